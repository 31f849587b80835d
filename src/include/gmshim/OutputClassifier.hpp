#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "Error.hpp"

namespace gmshim {

struct ClassifierRule {
    std::string_view substring;
    ErrorKind kind;
};

// Checked in this order, the first substring found decides the error.
inline constexpr std::array<ClassifierRule, 4> kClassifierRules = {{
    {"command not found", ErrorKind::kCommandNotFound},
    {"No such file", ErrorKind::kFileNotFound},
    {"Request did not return an image", ErrorKind::kNoImageReturned},
    {"unable to open image", ErrorKind::kUnableToOpen},
}};

/**
 * @brief Finds the first known error message in gm's output.
 *
 * @param output Everything the command printed.
 * @return The error kind of the first matching rule, or std::nullopt.
 */
[[nodiscard]] std::optional<ErrorKind> findKnownError(std::string_view output);

/**
 * @brief Turns the output of a gm command into its result.
 *
 * A known error message gives that kind. Otherwise empty output means
 * success, and anything else is a kUnclassified error carrying the output.
 */
[[nodiscard]] CommandResult classifyOutput(std::string_view output);

}  // namespace gmshim
