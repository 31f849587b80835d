#include <LogCompat.hpp>
#include <gmshim/OutputClassifier.hpp>
#include <string>

namespace gmshim {

std::optional<ErrorKind> findKnownError(const std::string_view output) {
    for (const auto& rule : kClassifierRules) {
        if (output.find(rule.substring) != std::string_view::npos) {
            return rule.kind;
        }
    }
    return std::nullopt;
}

CommandResult classifyOutput(const std::string_view output) {
    if (const auto kind = findKnownError(output)) {
        LOG(WARNING) << "gm failed: " << *kind;
        return std::unexpected(Error{*kind, std::string(output)});
    }
    if (output.empty()) {
        return {};
    }
    LOG(WARNING) << "gm printed unexpected output: " << output;
    return std::unexpected(Error{ErrorKind::kUnclassified, std::string(output)});
}

}  // namespace gmshim
