#include <fmt/format.h>
#include <sys/wait.h>

#include <LogCompat.hpp>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <gmshim/PopenCommandRunner.hpp>
#include <string>

namespace gmshim {

Result<ExecResult> PopenCommandRunner::run(const std::string& commandLine) {
    // Group the command so the redirection covers all of it.
    const auto shellLine = fmt::format("{{ {} ; }} 2>&1", commandLine);
    FILE* fp = popen(shellLine.c_str(), "r");
    if (fp == nullptr) {
        const int savedErrno = errno;
        LOG(ERROR) << "popen failed for: " << commandLine << ": "
                   << std::strerror(savedErrno);
        return std::unexpected(
            Error{ErrorKind::kSpawnFailed,
                  fmt::format("popen: {}", std::strerror(savedErrno))});
    }

    ExecResult result;
    std::array<char, kReadBufferSize> buffer{};
    size_t count = 0;
    while ((count = fread(buffer.data(), 1, buffer.size(), fp)) > 0) {
        result.output.append(buffer.data(), count);
    }
    const bool readFailed = ferror(fp) != 0;

    const int status = pclose(fp);
    if (status == -1) {
        PLOG(WARNING) << "pclose failed for: " << commandLine;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = WTERMSIG(status);
        result.signaled = true;
    }

    if (readFailed) {
        LOG(ERROR) << "Reading output of '" << commandLine << "' failed";
        return std::unexpected(Error{ErrorKind::kSpawnFailed,
                                     "failed to read command output"});
    }

    DLOG(INFO) << "Command: " << commandLine << ", exit "
               << (result.signaled ? "signal " : "code ") << result.exitCode
               << ", " << result.output.size() << " bytes of output";
    return result;
}

}  // namespace gmshim
