#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace gmshim {

// A symbolic name, e.g. a field or binding key. Rendered as its own text.
class Symbol {
    std::string _name;

   public:
    Symbol() = default;
    explicit Symbol(std::string name) : _name(std::move(name)) {}
    explicit Symbol(const char* name) : _name(name) {}

    [[nodiscard]] const std::string& str() const { return _name; }

    auto operator<=>(const Symbol& other) const = default;
    bool operator==(const Symbol& other) const = default;
    bool operator==(const std::string_view other) const {
        return _name == other;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Symbol& s) {
    return os << s.str();
}

// Raw bytes, rendered as the characters they contain.
using Bytes = std::vector<std::uint8_t>;

/**
 * @brief A value that can be substituted into a command template.
 *
 * Integers, symbolic names, byte strings and raw text are supported.
 */
using Value = std::variant<long, Symbol, Bytes, std::string>;

/**
 * @brief Converts a value to its command line text.
 *
 * Integers become decimal digits, symbols their name, byte strings their
 * bytes and text stays unchanged.
 *
 * @param value The value to convert.
 * @return The textual form of @p value.
 */
std::string stringify(const Value& value);

// A placeholder name and the value bound to it.
struct Binding {
    std::string key;
    Value value;
};

using Bindings = std::vector<Binding>;

}  // namespace gmshim
