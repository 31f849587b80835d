#include <gmshim/Value.hpp>

#include <string>
#include <type_traits>
#include <variant>

namespace gmshim {

std::string stringify(const Value& value) {
    return std::visit(
        [](auto&& arg) -> std::string {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, long>) {
                return std::to_string(arg);
            } else if constexpr (std::is_same_v<T, Symbol>) {
                return arg.str();
            } else if constexpr (std::is_same_v<T, Bytes>) {
                return {arg.begin(), arg.end()};
            } else {
                return arg;
            }
        },
        value);
}

}  // namespace gmshim
