#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "Error.hpp"
#include "FormatField.hpp"
#include "Value.hpp"

namespace gmshim {

// width and height are integers, every other field is text.
using MetadataValue = std::variant<long, std::string>;

/**
 * @brief Fields read by an explicit identify.
 */
class MetadataRecord {
   public:
    using Map = std::map<Symbol, MetadataValue>;

    MetadataRecord() = default;
    explicit MetadataRecord(Map fields) : _fields(std::move(fields)) {}

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::optional<MetadataValue> get(std::string_view name) const;
    // nullopt if missing or not numeric
    [[nodiscard]] std::optional<long> getInt(std::string_view name) const;
    // nullopt if missing or numeric
    [[nodiscard]] std::optional<std::string> getText(
        std::string_view name) const;

    [[nodiscard]] std::optional<long> width() const { return getInt("width"); }
    [[nodiscard]] std::optional<long> height() const {
        return getInt("height");
    }

    [[nodiscard]] const Map& fields() const { return _fields; }
    [[nodiscard]] size_t size() const { return _fields.size(); }

    bool operator==(const MetadataRecord& other) const = default;

   private:
    Map _fields;
};

/**
 * @brief Parses the output of `gm identify -format` built by
 * identifyFormatString().
 *
 * CR and LF are dropped first since gm may break the line anywhere. The
 * rest is split on kMetadataSeparator, and each part on its first ": ".
 * width and height are converted to integers. A repeated field keeps the
 * last value.
 *
 * @param output Raw output of the identify command.
 * @return The record, or kMalformedMetadata naming the bad part.
 */
[[nodiscard]] Result<MetadataRecord> parseIdentifyExplicit(
    std::string_view output);

std::ostream& operator<<(std::ostream& os, const MetadataRecord& record);

}  // namespace gmshim
