#pragma once
#ifndef _COLOR_H_1DE740A4_59E8_4B06_807F_0B3199B18AEE
#define _COLOR_H_1DE740A4_59E8_4B06_807F_0B3199B18AEE
#include <string>
#include <ostream>
#include "scalar.hpp"
#include "color_model.hpp"

namespace hues {

// One addressable cell of the 256-color palette, plus whether it
// should be rendered as background. RGB/HSV are derived from the index.
//
// The operators move the color to a neighbouring cell by looking up its
// (hue, level, saturation) position and re-resolving it through the hue
// tables; the index is never left invalid.
//   >>= n / <<= n : n hue sectors forward/back on the wheel (mod 12)
//   += n  / -= n  : brightness level up/down (clamped to 0-5)
//   *= n  / /= n  : saturation level up/down (clamped to 1-9)
class Color {
public:
    // From palette index 0-255; throws RangeError otherwise
    explicit Color(int ansi);
    // From numeric string; throws FormatError/RangeError
    explicit Color(const std::string& ansi);
    Color(const Color& other) =default;
    Color& operator=(const Color& other) =default;

    // Nearest cube/grayscale cell
    static Color from_rgb(const RGBModel& rgb);
    static Color from_hsv(const HSVModel& hsv);

    Bit8 ansi() const { return code; }
    RGBModel rgb() const;
    HSVModel hsv() const;
    // Name of the hue sector the color belongs to
    HueName hue() const;
    std::string hue_name() const;

    // Brightness level (0-5) and saturation level (1-9)
    // of the color's position in its hue table
    int level() const;
    int saturation() const;

    bool background() const { return bg; }
    void set_background(bool value) { bg = value; }

    Color& rotate_forward(int amount = 1);
    Color& rotate_backward(int amount = 1);
    Color& brighten(int amount = 1);
    Color& darken(int amount = 1);
    Color& saturate(int amount = 1);
    Color& desaturate(int amount = 1);

    Color& operator>>=(int amount) { return rotate_forward(amount); }
    Color& operator<<=(int amount) { return rotate_backward(amount); }
    Color& operator+=(int amount) { return brighten(amount); }
    Color& operator-=(int amount) { return darken(amount); }
    Color& operator*=(int amount) { return saturate(amount); }
    Color& operator/=(int amount) { return desaturate(amount); }

    Color operator>>(int amount) const;
    Color operator<<(int amount) const;
    Color operator+(int amount) const;
    Color operator-(int amount) const;
    Color operator*(int amount) const;
    Color operator/(int amount) const;

    // Opening escape sequence, e.g. \033[38;5;196m (48 for background)
    std::string escape() const;
    // text wrapped in escape() ... \033[0m
    std::string render(const std::string& text) const;
    // e.g. "196 | rgb(255,   0,   0) | hsv(  0°, 100.0%, 255)"
    std::string str() const;

    bool operator==(const Color& other) const;
    bool operator!=(const Color& other) const;

private:
    // Move to (hue, level, saturation), clamping level/saturation
    Color& move_to(HueName hue, long long level, long long saturation);

    Bit8 code;
    bool bg;
};

std::ostream& operator<<(std::ostream& os, const Color& color);

}  // namespace hues
#endif // ifndef _COLOR_H_1DE740A4_59E8_4B06_807F_0B3199B18AEE
