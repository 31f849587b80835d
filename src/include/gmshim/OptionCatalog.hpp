#pragma once

#include <string>

#include "Option.hpp"

// Ready made options for the gm switches used most often.
// Geometry arguments follow GraphicsMagick's WIDTHxHEIGHT{+-}X{+-}Y syntax.
namespace gmshim::opt {

Option adjoin();
Option append();            // Stack images top to bottom
Option appendHorizontal();  // Stack images left to right (+append)
Option autoOrient();
Option background(const std::string& color);
Option blur(double radius, double sigma);
Option border(long width, long height);
Option borderColor(const std::string& color);
Option colors(long count);
Option colorspace(const std::string& name);
Option compose(const std::string& op);
Option compress(const std::string& type);
Option crop(long width, long height, long xOffset = 0, long yOffset = 0);
Option density(long width, long height);
Option depth(long bits);
Option dissolve(long percent);
Option draw(const std::string& primitive);
Option edge(double radius);
Option extent(long width, long height);
Option fill(const std::string& color);
Option flatten();
Option flip();
Option flop();
Option font(const std::string& name);
Option format(const std::string& format);
Option gaussian(double radius, double sigma);
Option geometry(long width, long height, long xOffset = 0, long yOffset = 0);
Option gravity(const std::string& gravity);
Option interlace(const std::string& type);
Option magnify();
Option monochrome();
Option negate();
// Removes the named profile, all of them by default (+profile "*").
Option noProfile(const std::string& name = "*");
Option opaque(const std::string& color);
Option outputDirectory(const std::string& directory);
Option pointsize(long size);
Option quality(long quality);

/**
 * @brief -resize WIDTHxHEIGHT, keeping the aspect ratio.
 */
Option resize(long width, long height);
// -resize WIDTHxHEIGHT!, ignoring the aspect ratio.
Option resizeExact(long width, long height);
// -resize PERCENT%
Option resizePercent(long percent);

Option rotate(double degrees);
Option sharpen(double radius, double sigma);
Option size(long width, long height);
Option strip();
Option thumbnail(long width, long height);
Option tile(long columns, long rows);
Option transparent(const std::string& color);
Option type(const std::string& type);
Option verbose();

}  // namespace gmshim::opt
