#pragma once

#include <string>

#include "Error.hpp"

namespace gmshim {

struct ExecResult {
    // stdout and stderr of the command, interleaved as they were written.
    std::string output;
    // Exit code, or the signal number if signaled is set. -1 if unknown.
    int exitCode = -1;
    bool signaled = false;
};

/**
 * @brief Runs a shell command line and collects what it prints.
 *
 * Implementations block until the command has exited.
 */
class CommandRunner {
   public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs @p commandLine through /bin/sh -c with the current
     * environment.
     *
     * @param commandLine The full command, binary name included.
     * @return The captured output and exit status, or kSpawnFailed if the
     * shell couldn't be started.
     */
    virtual Result<ExecResult> run(const std::string& commandLine) = 0;
};

}  // namespace gmshim
