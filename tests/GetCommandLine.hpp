#pragma once

#include <string>
#include <vector>

#include "CommandLine.hpp"

// Owns argv storage for a CommandLine built from plain strings.
class TestCommandLine {
   public:
    explicit TestCommandLine(std::vector<std::string> args)
        : _strings(std::move(args)) {
        for (auto& s : _strings) {
            _pointers.emplace_back(s.data());
        }
        _pointers.emplace_back(nullptr);
    }

    [[nodiscard]] CommandLine get() const {
        return {static_cast<CommandLine::argc_type>(_strings.size()),
                _pointers.data()};
    }

   private:
    std::vector<std::string> _strings;
    std::vector<char*> _pointers;
};
