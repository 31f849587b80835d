#pragma once

#include <gmock/gmock.h>

#include <gmshim/CommandRunner.hpp>

class CommandRunnerMock : public gmshim::CommandRunner {
   public:
    MOCK_METHOD(gmshim::Result<gmshim::ExecResult>, run,
                (const std::string& commandLine), (override));
};
