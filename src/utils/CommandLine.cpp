#include <CommandLine.hpp>
#include <LogCompat.hpp>
#include <stdexcept>

CommandLine::CommandLine(CommandLine::argc_type argc,
                         CommandLine::argv_type argv)
    : _argc(argc), _argv(argv) {
    if (_argv == nullptr || _argv[0] == nullptr) {
        LOG(ERROR) << "Invalid argv passed";
        throw std::invalid_argument("Invalid argv passed");
    }
}

CommandLine::argv_type CommandLine::argv() const { return _argv; }

CommandLine::argc_type CommandLine::argc() const { return _argc; }
