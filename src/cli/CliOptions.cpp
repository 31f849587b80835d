#include "CliOptions.hpp"

#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>
#include <fmt/format.h>

#include <string>
#include <vector>

namespace gmshim::cli {

absl::StatusOr<Option> parseOptionSpec(const std::string_view spec) {
    const std::vector<std::string> parts =
        absl::StrSplit(std::string(spec), absl::MaxSplits('=', 1));
    if (parts.empty() || parts[0].empty()) {
        return absl::InvalidArgumentError(
            fmt::format("Invalid option spec: '{}'", spec));
    }
    if (parts.size() == 1) {
        return Option::bare(parts[0]);
    }
    return Option::valued(parts[0], parts[1]);
}

absl::StatusOr<Options> parseOptionSpecs(const std::vector<std::string>& specs) {
    Options options;
    options.reserve(specs.size());
    for (const auto& spec : specs) {
        auto option = parseOptionSpec(spec);
        if (!option.ok()) {
            return option.status();
        }
        options.emplace_back(std::move(*option));
    }
    return options;
}

absl::StatusOr<std::vector<FormatField>> parseFieldList(
    const std::string_view list) {
    std::vector<FormatField> fields;
    for (const auto& name :
         absl::StrSplit(std::string(list), ',', absl::SkipWhitespace())) {
        const auto trimmed = std::string(absl::StripAsciiWhitespace(name));
        const auto field = formatFieldFromName(trimmed);
        if (!field) {
            return absl::InvalidArgumentError(
                fmt::format("Unknown field: '{}'", trimmed));
        }
        fields.emplace_back(*field);
    }
    if (fields.empty()) {
        return absl::InvalidArgumentError("No fields given");
    }
    return fields;
}

}  // namespace gmshim::cli
