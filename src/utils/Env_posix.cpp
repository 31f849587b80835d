#include <cstdlib>
#include <string>
#include <string_view>

#include "Env.hpp"

const Env::ValueEntry& Env::ValueEntry::operator=(
    const std::string_view value) const {
    setenv(_key.c_str(), std::string(value).c_str(), 1);
    return *this;
}

void Env::ValueEntry::clear() const { unsetenv(_key.c_str()); }

std::optional<std::string> Env::ValueEntry::find() const {
    const char* value = getenv(_key.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return value;
}
