#pragma once
#ifndef _COLOR_MODEL_H_EF666901_0589_434A_9766_44774D175B80
#define _COLOR_MODEL_H_EF666901_0589_434A_9766_44774D175B80
#include <string>
#include <ostream>
#include "scalar.hpp"

namespace hues {

// Additive color
struct RGBModel {
    RGBModel();
    RGBModel(Bit8 r, Bit8 g, Bit8 b);

    bool operator==(const RGBModel& other) const;
    bool operator!=(const RGBModel& other) const;

    // e.g. rgb(255,  95,   0)
    std::string str() const;

    Bit8 r, g, b;
};

// Perceptual color: hue angle, saturation and value (max channel)
struct HSVModel {
    HSVModel();
    HSVModel(DegUnit h, Percent s, Bit8 v);

    bool operator==(const HSVModel& other) const;
    bool operator!=(const HSVModel& other) const;

    // e.g. hsv(360°, 100.0%, 255)
    std::string str() const;

    DegUnit h;
    Percent s;
    Bit8 v;
};

std::ostream& operator<<(std::ostream& os, const RGBModel& rgb);
std::ostream& operator<<(std::ostream& os, const HSVModel& hsv);

// Standard RGB -> HSV; H rounded to the nearest whole degree,
// H = 0 and S = 0 for achromatic input
HSVModel rgb_to_hsv(const RGBModel& rgb);
// Standard HSV -> RGB (360 degrees is treated as 0)
RGBModel hsv_to_rgb(const HSVModel& hsv);

// Named sectors of the wheel, in wheel order (30 degrees apart,
// starting at Red = 0), followed by the achromatic family
enum class HueName {
    red, orange, yellow, lime, green, turquoise,
    teal, cyan, blue, purple, magenta, rose,
    grey
};
constexpr int N_WHEEL_HUES = 12;
constexpr int N_HUES = 13;
constexpr int WHEEL_STEP = 360 / N_WHEEL_HUES;

// Display name e.g. "Turquoise"
std::string to_string(HueName name);
// Case-insensitive name lookup ("grey" and "gray" both work);
// throws FormatError on an unknown name
HueName hue_from_string(const std::string& name);
std::ostream& operator<<(std::ostream& os, HueName name);

// Sector an RGB triple falls in: the hue angle is rounded to the
// nearest 30 degrees (ties to even); R = G = B gives grey
HueName hue_sector(const RGBModel& rgb);

// Palette index -> RGB:
// 0-15 system colors, 16-231 6x6x6 cube, 232-255 grayscale ramp.
// Throws RangeError outside 0-255.
RGBModel ansi_to_rgb(int ansi);

// Closest cube or grayscale cell (16-255) by squared RGB distance
int nearest_ansi(const RGBModel& rgb);

namespace palette {
// Cube axis intensities, indexed by brightness level 0-5
constexpr int RAMP[6] = {0, 95, 135, 175, 215, 255};
constexpr int CUBE_BEGIN = 16, GRAY_BEGIN = 232;
}  // namespace palette

}  // namespace hues
#endif // ifndef _COLOR_MODEL_H_EF666901_0589_434A_9766_44774D175B80
