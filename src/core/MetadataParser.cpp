#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <fmt/format.h>

#include <LogCompat.hpp>
#include <algorithm>
#include <gmshim/MetadataParser.hpp>
#include <string>
#include <vector>

namespace gmshim {

namespace {

bool isNumericField(const std::string_view name) {
    return name == info(FormatField::kWidth).name ||
           name == info(FormatField::kHeight).name;
}

}  // namespace

bool MetadataRecord::contains(const std::string_view name) const {
    return _fields.contains(Symbol(std::string(name)));
}

std::optional<MetadataValue> MetadataRecord::get(
    const std::string_view name) const {
    if (const auto it = _fields.find(Symbol(std::string(name)));
        it != _fields.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<long> MetadataRecord::getInt(const std::string_view name) const {
    const auto value = get(name);
    if (value && std::holds_alternative<long>(*value)) {
        return std::get<long>(*value);
    }
    return std::nullopt;
}

std::optional<std::string> MetadataRecord::getText(
    const std::string_view name) const {
    auto value = get(name);
    if (value && std::holds_alternative<std::string>(*value)) {
        return std::get<std::string>(std::move(*value));
    }
    return std::nullopt;
}

Result<MetadataRecord> parseIdentifyExplicit(const std::string_view output) {
    std::string cleaned(output);
    std::erase_if(cleaned, [](const char c) { return c == '\r' || c == '\n'; });

    MetadataRecord::Map fields;
    const std::vector<std::string> parts =
        absl::StrSplit(cleaned, std::string(kMetadataSeparator));
    for (const auto& part : parts) {
        const std::vector<std::string> kv =
            absl::StrSplit(part, absl::MaxSplits(": ", 1));
        if (kv.size() != 2) {
            LOG(ERROR) << "Malformed identify field: '" << part << "'";
            return std::unexpected(Error{
                ErrorKind::kMalformedMetadata,
                fmt::format("field without ': ' separator: '{}'", part)});
        }
        const auto& name = kv[0];
        const auto& text = kv[1];

        if (isNumericField(name)) {
            long number = 0;
            if (!absl::SimpleAtoi(text, &number)) {
                LOG(ERROR) << "Non-numeric " << name << ": '" << text << "'";
                return std::unexpected(Error{
                    ErrorKind::kMalformedMetadata,
                    fmt::format("{} is not an integer: '{}'", name, text)});
            }
            fields.insert_or_assign(Symbol(name), number);
        } else {
            fields.insert_or_assign(Symbol(name), text);
        }
    }
    return MetadataRecord(std::move(fields));
}

std::ostream& operator<<(std::ostream& os, const MetadataRecord& record) {
    os << "{";
    bool first = true;
    for (const auto& [name, value] : record.fields()) {
        if (!first) {
            os << ", ";
        }
        first = false;
        os << name << ": ";
        std::visit([&os](const auto& v) { os << v; }, value);
    }
    return os << "}";
}

}  // namespace gmshim
