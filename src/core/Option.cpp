#include <absl/strings/str_cat.h>

#include <gmshim/Option.hpp>
#include <string>
#include <utility>

namespace gmshim {

Option Option::bare(std::string flag) { return Option(Bare{std::move(flag)}); }

Option Option::valued(std::string flag, std::string argTemplate,
                      Bindings bindings) {
    return Option(
        Valued{std::move(flag), std::move(argTemplate), std::move(bindings)});
}

Option Option::valued(std::string flag, Value value) {
    return valued(std::move(flag), ":value", {{"value", std::move(value)}});
}

const std::string& Option::flag() const {
    return std::visit([](const auto& v) -> const std::string& { return v.flag; },
                      _data);
}

absl::StatusOr<std::string> renderOption(const Option& option,
                                         const TemplateMode mode) {
    if (const auto* bare = std::get_if<Option::Bare>(&option.data())) {
        return bare->flag;
    }
    const auto& valued = std::get<Option::Valued>(option.data());
    const auto argument = Template(valued.argTemplate)
                              .render({}, valued.bindings, BindMode::kRaw, mode);
    if (!argument.ok()) {
        return argument.status();
    }
    return absl::StrCat(valued.flag, " ", shellQuote(*argument));
}

absl::StatusOr<std::string> renderOptions(const Options& options,
                                          const TemplateMode mode) {
    std::string fragment;
    for (const auto& option : options) {
        auto rendered = renderOption(option, mode);
        if (!rendered.ok()) {
            return rendered.status();
        }
        if (!fragment.empty()) {
            fragment += ' ';
        }
        fragment += *rendered;
    }
    return fragment;
}

std::ostream& operator<<(std::ostream& os, const Option& option) {
    const auto rendered = renderOption(option, TemplateMode::kLegacy);
    return os << (rendered.ok() ? *rendered : option.flag());
}

}  // namespace gmshim
