#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gmshim {

// Joins the "name: value" fields of an explicit identify.
inline constexpr std::string_view kMetadataSeparator = "--SEP--";

// Image properties that `gm identify -format` can print.
enum class FormatField {
    kFilename,
    kWidth,
    kHeight,
    kType,
    kFileSize,
    kComment,
    kDirectory,
    kExtension,
    kPageGeometry,
    kInputFilename,
    kUniqueColors,
    kLabel,
    kSceneCount,
    kQuantumDepth,
    kImageClass,
    kScene,
    kBasename,
    kXResolution,
    kYResolution,
    kCompression,
    kDimensions,
    kCompressionQuality,
    kResolutionUnits,
    kSignature,
    kMax,
};

struct FormatFieldInfo {
    FormatField field;
    // Key used in the parsed metadata record.
    std::string_view name;
    // identify -format escape sequence.
    std::string_view escape;
};

inline constexpr std::array<FormatFieldInfo,
                            static_cast<size_t>(FormatField::kMax)>
    kFormatFields = {{
        {FormatField::kFilename, "filename", "%f"},
        {FormatField::kWidth, "width", "%w"},
        {FormatField::kHeight, "height", "%h"},
        {FormatField::kType, "type", "%m"},
        {FormatField::kFileSize, "file_size", "%b"},
        {FormatField::kComment, "comment", "%c"},
        {FormatField::kDirectory, "directory", "%d"},
        {FormatField::kExtension, "extension", "%e"},
        {FormatField::kPageGeometry, "page_geometry", "%g"},
        {FormatField::kInputFilename, "input_filename", "%i"},
        {FormatField::kUniqueColors, "unique_colors", "%k"},
        {FormatField::kLabel, "label", "%l"},
        {FormatField::kSceneCount, "scene_count", "%n"},
        {FormatField::kQuantumDepth, "quantum_depth", "%q"},
        {FormatField::kImageClass, "image_class", "%r"},
        {FormatField::kScene, "scene", "%s"},
        {FormatField::kBasename, "basename", "%t"},
        {FormatField::kXResolution, "x_resolution", "%x"},
        {FormatField::kYResolution, "y_resolution", "%y"},
        {FormatField::kCompression, "compression", "%C"},
        {FormatField::kDimensions, "dimensions", "%G"},
        {FormatField::kCompressionQuality, "compression_quality", "%Q"},
        {FormatField::kResolutionUnits, "resolution_units", "%U"},
        {FormatField::kSignature, "signature", "%#"},
    }};

[[nodiscard]] const FormatFieldInfo& info(FormatField field);

// Looks a field up by its record key ("width"), nullopt if unknown.
[[nodiscard]] std::optional<FormatField> formatFieldFromName(
    std::string_view name);

/**
 * @brief Builds the -format argument for an explicit identify.
 *
 * Each field becomes "name: escape" and fields are joined by
 * kMetadataSeparator, so "filename: %f--SEP--width: %w" for
 * {kFilename, kWidth}.
 */
[[nodiscard]] std::string identifyFormatString(
    const std::vector<FormatField>& fields);

}  // namespace gmshim
