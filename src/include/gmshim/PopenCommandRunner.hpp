#pragma once

#include <cstddef>

#include "CommandRunner.hpp"

namespace gmshim {

// CommandRunner on top of popen(3), stderr is redirected into stdout.
class PopenCommandRunner : public CommandRunner {
   public:
    // Read buffer size
    constexpr static size_t kReadBufferSize = 512;

    PopenCommandRunner() = default;
    ~PopenCommandRunner() override = default;

    Result<ExecResult> run(const std::string& commandLine) override;
};

}  // namespace gmshim
