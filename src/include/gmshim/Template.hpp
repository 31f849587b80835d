#pragma once

#include <absl/status/statusor.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Value.hpp"

namespace gmshim {

enum class BindMode {
    kEscaped,  // Values are wrapped in double quotes (shellQuote)
    kRaw,      // Values are inserted as they are
};

enum class TemplateMode {
    // Rendering fails if a :name placeholder or {{marker}} stays unbound.
    kStrict,
    // Unbound placeholders pass through literally.
    kLegacy,
};

/**
 * @brief Wraps text in double quotes for /bin/sh.
 *
 * Backslash, double quote, dollar and backtick are backslash-escaped, so the
 * shell passes @p text through as a single argument.
 */
std::string shellQuote(std::string_view text);

/**
 * @brief Replaces every :key placeholder in @p tmpl with its bound value.
 *
 * At a given position the longest matching key wins, and a key may be
 * directly followed by other text (":widthx:height"). Substituted text is
 * never scanned again. Keys that don't occur in @p tmpl are ignored, and
 * placeholders without a binding are left as they are.
 *
 * @param tmpl The template text.
 * @param bindings The values to substitute.
 * @param mode Whether values are shell-quoted.
 * @return The template with all known placeholders replaced.
 */
std::string bindData(std::string_view tmpl, const Bindings& bindings,
                     BindMode mode);

/**
 * @brief A command template with structural insertion points and named
 * value placeholders.
 *
 * "convert {{options}} :input_file {{output_options}} :output_file" has two
 * insertion points, filled with pre-rendered fragments, and two
 * placeholders, filled with bound values. Rendering splices the fragments
 * first and binds the values second. Neither pass looks at text produced by
 * the other.
 */
class Template {
   public:
    // Insertion point name (without braces) -> rendered fragment.
    using Fragments = std::map<std::string, std::string, std::less<>>;

    struct Segment {
        enum class Kind { kLiteral, kInsertion } kind;
        // Literal text, or the insertion point's name.
        std::string text;

        bool operator==(const Segment& other) const = default;
    };

    explicit Template(std::string_view text);

    /**
     * @brief Renders the template.
     *
     * @param fragments Text for each {{name}} insertion point.
     * @param bindings Values for the :name placeholders.
     * @param bindMode Whether bound values are shell-quoted.
     * @param mode What to do about insertion points or placeholders that
     * have nothing to fill them.
     * @return The rendered command text, or InvalidArgument in strict mode
     * when something stayed unbound.
     */
    [[nodiscard]] absl::StatusOr<std::string> render(
        const Fragments& fragments, const Bindings& bindings,
        BindMode bindMode, TemplateMode mode = TemplateMode::kStrict) const;

    [[nodiscard]] const std::string& text() const { return _text; }
    [[nodiscard]] const std::vector<Segment>& segments() const {
        return _segments;
    }

   private:
    std::string _text;
    std::vector<Segment> _segments;
};

}  // namespace gmshim
