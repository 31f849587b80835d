#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <fmt/format.h>

#include <LogCompat.hpp>
#include <cctype>
#include <iterator>
#include <gmshim/Template.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace gmshim {

namespace {

constexpr std::string_view kInsertionOpen = "{{";
constexpr std::string_view kInsertionClose = "}}";

bool isIdentifierStart(const char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isIdentifierChar(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Length of the identifier at the start of text, 0 if there is none.
size_t identifierLength(const std::string_view text) {
    if (text.empty() || !isIdentifierStart(text.front())) {
        return 0;
    }
    size_t len = 1;
    while (len < text.size() && isIdentifierChar(text[len])) {
        ++len;
    }
    return len;
}

const Binding* longestMatch(const std::string_view rest,
                            const Bindings& bindings) {
    const Binding* best = nullptr;
    for (const auto& binding : bindings) {
        if (binding.key.empty() || !rest.starts_with(binding.key)) {
            continue;
        }
        if (best == nullptr || binding.key.size() > best->key.size()) {
            best = &binding;
        }
    }
    return best;
}

std::string renderValue(const Value& value, const BindMode mode) {
    if (mode == BindMode::kEscaped) {
        return shellQuote(stringify(value));
    }
    return stringify(value);
}

// Binds one piece of literal text, appending the result to out.
// Names of :placeholders that had no binding are appended to unbound.
void bindInto(std::string& out, const std::string_view text,
              const Bindings& bindings, const BindMode mode,
              std::vector<std::string>* unbound) {
    size_t i = 0;
    while (i < text.size()) {
        const size_t colon = text.find(':', i);
        if (colon == std::string_view::npos) {
            out.append(text.substr(i));
            break;
        }
        out.append(text.substr(i, colon - i));

        const auto rest = text.substr(colon + 1);
        if (const auto* binding = longestMatch(rest, bindings)) {
            out += renderValue(binding->value, mode);
            i = colon + 1 + binding->key.size();
            continue;
        }
        const size_t len = identifierLength(rest);
        if (len != 0 && unbound != nullptr) {
            unbound->emplace_back(rest.substr(0, len));
        }
        out.append(text.substr(colon, len + 1));
        i = colon + 1 + len;
    }
}

}  // namespace

std::string shellQuote(const std::string_view text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted += '"';
    for (const char c : text) {
        switch (c) {
            case '"':
            case '\\':
            case '$':
            case '`':
                quoted += '\\';
                break;
            default:
                break;
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string bindData(const std::string_view tmpl, const Bindings& bindings,
                     const BindMode mode) {
    std::string result;
    result.reserve(tmpl.size());
    bindInto(result, tmpl, bindings, mode, nullptr);
    return result;
}

Template::Template(const std::string_view text) : _text(text) {
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t open = text.find(kInsertionOpen, pos);
        const size_t close =
            open == std::string_view::npos
                ? std::string_view::npos
                : text.find(kInsertionClose, open + kInsertionOpen.size());
        if (close == std::string_view::npos) {
            _segments.push_back({Segment::Kind::kLiteral,
                                 std::string(text.substr(pos))});
            break;
        }
        if (open != pos) {
            _segments.push_back({Segment::Kind::kLiteral,
                                 std::string(text.substr(pos, open - pos))});
        }
        const auto nameStart = open + kInsertionOpen.size();
        _segments.push_back(
            {Segment::Kind::kInsertion,
             std::string(text.substr(nameStart, close - nameStart))});
        pos = close + kInsertionClose.size();
    }
}

absl::StatusOr<std::string> Template::render(const Fragments& fragments,
                                             const Bindings& bindings,
                                             const BindMode bindMode,
                                             const TemplateMode mode) const {
    // Pass 1: structural fragments. A null fragment marks an insertion
    // point nobody filled.
    struct Piece {
        const Segment* segment;
        const std::string* fragment;
    };
    std::vector<Piece> pieces;
    std::vector<std::string> missing;

    pieces.reserve(_segments.size());
    for (const auto& segment : _segments) {
        if (segment.kind == Segment::Kind::kLiteral) {
            pieces.push_back({&segment, nullptr});
            continue;
        }
        const auto it = fragments.find(segment.text);
        if (it == fragments.end()) {
            missing.emplace_back(fmt::format("{}{}{}", kInsertionOpen,
                                             segment.text, kInsertionClose));
            pieces.push_back({&segment, nullptr});
        } else {
            pieces.push_back({&segment, &it->second});
        }
    }

    // Pass 2: values, only inside the template's own text.
    std::string result;
    for (const auto& piece : pieces) {
        if (piece.segment->kind == Segment::Kind::kInsertion) {
            if (piece.fragment != nullptr) {
                result += *piece.fragment;
            } else {
                // Legacy mode keeps the marker as it was written.
                fmt::format_to(std::back_inserter(result), "{}{}{}",
                               kInsertionOpen, piece.segment->text,
                               kInsertionClose);
            }
            continue;
        }
        std::vector<std::string> unbound;
        bindInto(result, piece.segment->text, bindings, bindMode, &unbound);
        for (const auto& name : unbound) {
            missing.emplace_back(absl::StrCat(":", name));
        }
    }

    if (!missing.empty()) {
        if (mode == TemplateMode::kStrict) {
            return absl::InvalidArgumentError(
                fmt::format("Unbound in template '{}': {}", _text,
                            absl::StrJoin(missing, ", ")));
        }
        DLOG(INFO) << "Template '" << _text
                   << "' rendered with unbound: " << absl::StrJoin(missing, ", ");
    }
    return result;
}

}  // namespace gmshim
