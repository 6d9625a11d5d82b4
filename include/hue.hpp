#pragma once
#ifndef _HUE_H_05CEB069_1BD1_49E5_8620_1EDE529B6F22
#define _HUE_H_05CEB069_1BD1_49E5_8620_1EDE529B6F22
#include <string>
#include <ostream>
#include "scalar.hpp"
#include "color_model.hpp"
#include "color.hpp"

namespace hues {

// Brightness level domain
constexpr int LEVEL_MIN = 0, LEVEL_MAX = 5;
// Saturation level domain
constexpr int SAT_MIN = 1, SAT_MAX = 9;

// A named wheel sector (or the grey family) and every
// brightness/saturation variation it provides
class Hue {
public:
    constexpr explicit Hue(HueName name) : id(name) {}

    HueName name() const { return id; }
    std::string str() const { return to_string(id); }
    bool achromatic() const { return id == HueName::grey; }
    // Position on the wheel (Red = 0); 0 for Grey
    DegUnit degree() const;

    // Default color: brightest level, most saturated
    Color operator()() const;
    // Resolve level (0-5) and saturation (1-9);
    // throws RangeError before resolving if either is out of domain
    Color operator()(int level, int saturation = SAT_MAX,
                     bool background = false) const;
    // Same as above, palette index only
    int index(int level = LEVEL_MAX, int saturation = SAT_MAX) const;

    // Whether the hue has colors at exactly this level
    // (other levels resolve to the next brighter populated one)
    bool has_level(int level) const;

    // Hue amount sectors along the wheel (negative: backwards);
    // Grey maps to itself
    Hue rotated(int amount) const;

    // Text in the default color
    std::string render(const std::string& text) const;

    // Level x saturation grid of palette indices, each drawn in its
    // own color, brightest level and most saturated column first
    std::string table() const;

    bool operator==(const Hue& other) const { return id == other.id; }
    bool operator!=(const Hue& other) const { return id != other.id; }

private:
    HueName id;
};

std::ostream& operator<<(std::ostream& os, const Hue& hue);

// Where a palette cell sits in the resolution table
struct Position {
    HueName hue;
    int level;       // 0-5
    int saturation;  // 1-9
};

// Position of a palette index. Cells that are not in the table
// (0-15, 253-255) take the position of the nearest table entry
// of their own hue. Throws RangeError outside 0-255.
Position locate(int ansi);

// Palette index at (hue, level, saturation), no range checks beyond
// clamping; a level the hue does not populate is raised to the next
// populated level
int resolve(HueName hue, int level, int saturation);

}  // namespace hues
#endif // ifndef _HUE_H_05CEB069_1BD1_49E5_8620_1EDE529B6F22
