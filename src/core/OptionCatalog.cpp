#include <fmt/format.h>

#include <gmshim/OptionCatalog.hpp>
#include <string>

namespace gmshim::opt {

namespace {

constexpr const char kSize[] = ":widthx:height";
constexpr const char kSizeWithOffset[] = ":widthx:height:x_offset:y_offset";
constexpr const char kRadiusSigma[] = ":radiusx:sigma";

std::string decimal(const double value) { return fmt::format("{}", value); }

// gm wants an explicit sign on both offsets.
std::string offset(const long value) { return fmt::format("{:+d}", value); }

Option sized(const char* flag, const long width, const long height) {
    return Option::valued(flag, kSize, {{"width", width}, {"height", height}});
}

Option sizedWithOffset(const char* flag, const long width, const long height,
                       const long xOffset, const long yOffset) {
    return Option::valued(flag, kSizeWithOffset,
                          {{"width", width},
                           {"height", height},
                           {"x_offset", offset(xOffset)},
                           {"y_offset", offset(yOffset)}});
}

Option radiusSigma(const char* flag, const double radius, const double sigma) {
    return Option::valued(
        flag, kRadiusSigma,
        {{"radius", decimal(radius)}, {"sigma", decimal(sigma)}});
}

}  // namespace

Option adjoin() { return Option::bare("-adjoin"); }
Option append() { return Option::bare("-append"); }
Option appendHorizontal() { return Option::bare("+append"); }
Option autoOrient() { return Option::bare("-auto-orient"); }
Option background(const std::string& color) {
    return Option::valued("-background", color);
}
Option blur(const double radius, const double sigma) {
    return radiusSigma("-blur", radius, sigma);
}
Option border(const long width, const long height) {
    return sized("-border", width, height);
}
Option borderColor(const std::string& color) {
    return Option::valued("-bordercolor", color);
}
Option colors(const long count) { return Option::valued("-colors", count); }
Option colorspace(const std::string& name) {
    return Option::valued("-colorspace", name);
}
Option compose(const std::string& op) {
    return Option::valued("-compose", op);
}
Option compress(const std::string& type) {
    return Option::valued("-compress", type);
}
Option crop(const long width, const long height, const long xOffset,
            const long yOffset) {
    return sizedWithOffset("-crop", width, height, xOffset, yOffset);
}
Option density(const long width, const long height) {
    return sized("-density", width, height);
}
Option depth(const long bits) { return Option::valued("-depth", bits); }
Option dissolve(const long percent) {
    return Option::valued("-dissolve", percent);
}
Option draw(const std::string& primitive) {
    return Option::valued("-draw", primitive);
}
Option edge(const double radius) {
    return Option::valued("-edge", decimal(radius));
}
Option extent(const long width, const long height) {
    return sized("-extent", width, height);
}
Option fill(const std::string& color) { return Option::valued("-fill", color); }
Option flatten() { return Option::bare("-flatten"); }
Option flip() { return Option::bare("-flip"); }
Option flop() { return Option::bare("-flop"); }
Option font(const std::string& name) { return Option::valued("-font", name); }
Option format(const std::string& format) {
    return Option::valued("-format", format);
}
Option gaussian(const double radius, const double sigma) {
    return radiusSigma("-gaussian", radius, sigma);
}
Option geometry(const long width, const long height, const long xOffset,
                const long yOffset) {
    return sizedWithOffset("-geometry", width, height, xOffset, yOffset);
}
Option gravity(const std::string& gravity) {
    return Option::valued("-gravity", gravity);
}
Option interlace(const std::string& type) {
    return Option::valued("-interlace", type);
}
Option magnify() { return Option::bare("-magnify"); }
Option monochrome() { return Option::bare("-monochrome"); }
Option negate() { return Option::bare("-negate"); }
Option noProfile(const std::string& name) {
    return Option::valued("+profile", name);
}
Option opaque(const std::string& color) {
    return Option::valued("-opaque", color);
}
Option outputDirectory(const std::string& directory) {
    return Option::valued("-output-directory", directory);
}
Option pointsize(const long size) { return Option::valued("-pointsize", size); }
Option quality(const long quality) {
    return Option::valued("-quality", quality);
}
Option resize(const long width, const long height) {
    return sized("-resize", width, height);
}
Option resizeExact(const long width, const long height) {
    return Option::valued("-resize", ":widthx:height!",
                          {{"width", width}, {"height", height}});
}
Option resizePercent(const long percent) {
    return Option::valued("-resize", ":percent%", {{"percent", percent}});
}
Option rotate(const double degrees) {
    return Option::valued("-rotate", decimal(degrees));
}
Option sharpen(const double radius, const double sigma) {
    return radiusSigma("-sharpen", radius, sigma);
}
Option size(const long width, const long height) {
    return sized("-size", width, height);
}
Option strip() { return Option::bare("-strip"); }
Option thumbnail(const long width, const long height) {
    return sized("-thumbnail", width, height);
}
Option tile(const long columns, const long rows) {
    return Option::valued("-tile", ":columnsx:rows",
                          {{"columns", columns}, {"rows", rows}});
}
Option transparent(const std::string& color) {
    return Option::valued("-transparent", color);
}
Option type(const std::string& type) { return Option::valued("-type", type); }
Option verbose() { return Option::bare("-verbose"); }

}  // namespace gmshim::opt
