#pragma once

#include <absl/status/statusor.h>

#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "Template.hpp"
#include "Value.hpp"

namespace gmshim {

/**
 * @brief One command line switch for the gm binary.
 *
 * Either a bare switch ("-strip") or a switch with an argument built from a
 * small template ("-resize" with ":widthx:height").
 */
class Option {
   public:
    struct Bare {
        std::string flag;
    };
    struct Valued {
        std::string flag;
        std::string argTemplate;
        Bindings bindings;
    };

    static Option bare(std::string flag);
    static Option valued(std::string flag, std::string argTemplate,
                         Bindings bindings);
    // Shorthand for valued(flag, ":value", {{"value", value}}).
    static Option valued(std::string flag, Value value);

    [[nodiscard]] bool isBare() const {
        return std::holds_alternative<Bare>(_data);
    }
    [[nodiscard]] const std::string& flag() const;
    [[nodiscard]] const std::variant<Bare, Valued>& data() const {
        return _data;
    }

   private:
    explicit Option(std::variant<Bare, Valued> data)
        : _data(std::move(data)) {}

    std::variant<Bare, Valued> _data;
};

using Options = std::vector<Option>;

/**
 * @brief Renders a single option.
 *
 * Bare options render to their switch. Valued options render to the switch,
 * a space and the argument: the sub-template with its bindings substituted
 * unquoted, then wrapped in double quotes as a whole.
 *
 * @param option The option to render.
 * @param mode Whether unbound placeholders in the sub-template are an error.
 * @return The rendered text, or InvalidArgument.
 */
absl::StatusOr<std::string> renderOption(
    const Option& option, TemplateMode mode = TemplateMode::kStrict);

/**
 * @brief Renders options into one space separated fragment, in the given
 * order.
 *
 * gm lets later switches override earlier ones, so the order is kept
 * exactly. An empty list gives an empty string.
 */
absl::StatusOr<std::string> renderOptions(
    const Options& options, TemplateMode mode = TemplateMode::kStrict);

std::ostream& operator<<(std::ostream& os, const Option& option);

}  // namespace gmshim
