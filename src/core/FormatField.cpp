#include <fmt/format.h>

#include <algorithm>
#include <gmshim/FormatField.hpp>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace gmshim {

namespace {

template <size_t... index>
constexpr bool fieldsInOrder(std::index_sequence<index...> /*unused*/) {
    return ((kFormatFields[index].field == static_cast<FormatField>(index)) &&
            ...);
}

static_assert(fieldsInOrder(std::make_index_sequence<kFormatFields.size()>()),
              "kFormatFields must list every FormatField in enum order");

}  // namespace

const FormatFieldInfo& info(const FormatField field) {
    const auto index = static_cast<size_t>(field);
    if (index >= kFormatFields.size()) {
        throw std::out_of_range(
            fmt::format("Invalid FormatField: {}", index));
    }
    return kFormatFields[index];
}

std::optional<FormatField> formatFieldFromName(const std::string_view name) {
    const auto it = std::ranges::find_if(
        kFormatFields,
        [name](const FormatFieldInfo& entry) { return entry.name == name; });
    if (it == kFormatFields.end()) {
        return std::nullopt;
    }
    return it->field;
}

std::string identifyFormatString(const std::vector<FormatField>& fields) {
    std::string result;
    for (const auto field : fields) {
        const auto& entry = info(field);
        if (!result.empty()) {
            result += kMetadataSeparator;
        }
        fmt::format_to(std::back_inserter(result), "{}: {}", entry.name,
                       entry.escape);
    }
    return result;
}

}  // namespace gmshim
