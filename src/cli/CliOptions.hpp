#pragma once

#include <absl/status/statusor.h>

#include <gmshim/FormatField.hpp>
#include <gmshim/Option.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace gmshim::cli {

/**
 * @brief Parses a command line option spec into an Option.
 *
 * "-strip" gives a bare option, "-resize=50%" a valued one with the text
 * after the first '=' as its argument.
 *
 * @return The option, or InvalidArgument for an empty switch.
 */
absl::StatusOr<Option> parseOptionSpec(std::string_view spec);

absl::StatusOr<Options> parseOptionSpecs(const std::vector<std::string>& specs);

/**
 * @brief Parses a comma separated list of field names ("filename,width").
 *
 * @return The fields in the given order, or InvalidArgument naming the first
 * unknown field.
 */
absl::StatusOr<std::vector<FormatField>> parseFieldList(std::string_view list);

}  // namespace gmshim::cli
