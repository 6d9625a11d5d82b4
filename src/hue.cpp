#include "hue.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include "error.hpp"

namespace hues {

namespace {
// Resolution table: [hue][level][SAT_MAX - saturation] -> palette index.
// Generated once from the 6x6x6 cube by grouping every cell by its hue
// sector (30 degree buckets) and max channel, ranking each group by
// saturation and padding it to nine entries with its least saturated
// member. Grey also holds the grayscale ramp, each shade filed under the
// cube level just above it. -1 rows are levels a hue does not populate.
const int16_t SPECTRUM_TABLE[N_HUES][LEVEL_MAX + 1][SAT_MAX] = {
    {   // Red
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 52,  52,  52,  52,  52,  52,  52,  52,  52},
        { 88,  95,  95,  95,  95,  95,  95,  95,  95},
        {124, 131, 138, 138, 138, 138, 138, 138, 138},
        {160, 167, 174, 181, 181, 181, 181, 181, 181},
        {196, 203, 204, 209, 210, 217, 224, 224, 224},
    },
    {   // Orange
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 94,  94,  94,  94,  94,  94,  94,  94,  94},
        {130, 137, 137, 137, 137, 137, 137, 137, 137},
        {166, 172, 173, 179, 180, 180, 180, 180, 180},
        {202, 208, 214, 215, 216, 222, 223, 223, 223},
    },
    {   // Yellow
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 58,  58,  58,  58,  58,  58,  58,  58,  58},
        {100, 101, 101, 101, 101, 101, 101, 101, 101},
        {106, 136, 142, 143, 144, 144, 144, 144, 144},
        {148, 178, 184, 185, 186, 187, 187, 187, 187},
        {190, 220, 226, 191, 221, 227, 228, 229, 230},
    },
    {   // Lime
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 64,  64,  64,  64,  64,  64,  64,  64,  64},
        { 70, 107, 107, 107, 107, 107, 107, 107, 107},
        { 76, 112, 113, 149, 150, 150, 150, 150, 150},
        { 82, 118, 154, 155, 156, 192, 193, 193, 193},
    },
    {   // Green
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 22,  22,  22,  22,  22,  22,  22,  22,  22},
        { 28,  65,  65,  65,  65,  65,  65,  65,  65},
        { 34,  71, 108, 108, 108, 108, 108, 108, 108},
        { 40,  77, 114, 151, 151, 151, 151, 151, 151},
        { 46,  83,  84, 119, 120, 157, 194, 194, 194},
    },
    {   // Turquoise
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 29,  29,  29,  29,  29,  29,  29,  29,  29},
        { 35,  72,  72,  72,  72,  72,  72,  72,  72},
        { 41,  42,  78,  79, 115, 115, 115, 115, 115},
        { 47,  48,  49,  85, 121, 122, 158, 158, 158},
    },
    {   // Teal
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 23,  23,  23,  23,  23,  23,  23,  23,  23},
        { 30,  66,  66,  66,  66,  66,  66,  66,  66},
        { 31,  36,  37,  73, 109, 109, 109, 109, 109},
        { 38,  43,  44,  80, 116, 152, 152, 152, 152},
        { 45,  50,  51,  81,  86,  87, 123, 159, 195},
    },
    {   // Cyan
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 24,  24,  24,  24,  24,  24,  24,  24,  24},
        { 25,  67,  67,  67,  67,  67,  67,  67,  67},
        { 26,  32,  68,  74, 110, 110, 110, 110, 110},
        { 27,  33,  39,  75, 111, 117, 153, 153, 153},
    },
    {   // Blue
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 17,  17,  17,  17,  17,  17,  17,  17,  17},
        { 18,  60,  60,  60,  60,  60,  60,  60,  60},
        { 19,  61, 103, 103, 103, 103, 103, 103, 103},
        { 20,  62, 104, 146, 146, 146, 146, 146, 146},
        { 21,  63,  69,  99, 105, 147, 189, 189, 189},
    },
    {   // Purple
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 54,  54,  54,  54,  54,  54,  54,  54,  54},
        { 55,  97,  97,  97,  97,  97,  97,  97,  97},
        { 56,  92,  98, 134, 140, 140, 140, 140, 140},
        { 57,  93, 129, 135, 141, 177, 183, 183, 183},
    },
    {   // Magenta
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 53,  53,  53,  53,  53,  53,  53,  53,  53},
        { 90,  96,  96,  96,  96,  96,  96,  96,  96},
        { 91, 126, 127, 133, 139, 139, 139, 139, 139},
        {128, 163, 164, 170, 176, 182, 182, 182, 182},
        {165, 200, 201, 171, 206, 207, 213, 219, 225},
    },
    {   // Rose
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 89,  89,  89,  89,  89,  89,  89,  89,  89},
        {125, 132, 132, 132, 132, 132, 132, 132, 132},
        {161, 162, 168, 169, 175, 175, 175, 175, 175},
        {197, 198, 199, 205, 211, 212, 218, 218, 218},
    },
    {   // Grey
        {-1, -1, -1, -1, -1, -1, -1, -1, -1},
        { 16, 232, 233, 234, 235, 236,  59,  59,  59},
        {237, 238, 239, 240, 102, 102, 102, 102, 102},
        {241, 242, 243, 244, 145, 145, 145, 145, 145},
        {245, 246, 247, 248, 188, 188, 188, 188, 188},
        {249, 250, 251, 252, 231, 231, 231, 231, 231},
    },
};

const int16_t* table_row(HueName hue, int level) {
    return SPECTRUM_TABLE[static_cast<int>(hue)][level];
}

void check_domain(int level, int saturation) {
    if (level < LEVEL_MIN || level > LEVEL_MAX) {
        throw RangeError("Level must be between 0-5 (got " +
                std::to_string(level) + ")");
    }
    if (saturation < SAT_MIN || saturation > SAT_MAX) {
        throw RangeError("Saturation must be between 1-9 (got " +
                std::to_string(saturation) + ")");
    }
}

int sqr_dist(const RGBModel& a, const RGBModel& b) {
    const int dr = a.r.value() - b.r.value();
    const int dg = a.g.value() - b.g.value();
    const int db = a.b.value() - b.b.value();
    return dr * dr + dg * dg + db * db;
}

// Reverse of SPECTRUM_TABLE, built on first use
std::array<Position, Bit8::MAX + 1> build_positions() {
    std::array<Position, Bit8::MAX + 1> positions;
    std::array<bool, Bit8::MAX + 1> found{};
    for (int h = 0; h < N_HUES; ++h) {
        for (int lvl = LEVEL_MIN; lvl <= LEVEL_MAX; ++lvl) {
            const int16_t* row = table_row(static_cast<HueName>(h), lvl);
            for (int slot = 0; slot < SAT_MAX; ++slot) {
                const int ansi = row[slot];
                // First occurrence wins: padded cells repeat
                if (ansi < 0 || found[ansi]) continue;
                found[ansi] = true;
                positions[ansi] = Position{static_cast<HueName>(h), lvl,
                                           SAT_MAX - slot};
            }
        }
    }
    for (int ansi = 0; ansi <= Bit8::MAX; ++ansi) {
        if (found[ansi]) continue;
        const RGBModel rgb = ansi_to_rgb(ansi);
        const HueName hue = hue_sector(rgb);
        int best_d2 = -1;
        for (int lvl = LEVEL_MIN; lvl <= LEVEL_MAX; ++lvl) {
            const int16_t* row = table_row(hue, lvl);
            for (int slot = 0; slot < SAT_MAX; ++slot) {
                if (row[slot] < 0) continue;
                const int d2 = sqr_dist(rgb, ansi_to_rgb(row[slot]));
                if (best_d2 < 0 || d2 < best_d2) {
                    best_d2 = d2;
                    positions[ansi] = positions[row[slot]];
                }
            }
        }
    }
    return positions;
}
}  // namespace

Position locate(int ansi) {
    static const std::array<Position, Bit8::MAX + 1> positions =
        build_positions();
    if (ansi < 0 || ansi > Bit8::MAX) {
        throw RangeError("ANSI value is invalid; must be 0-255 (got " +
                std::to_string(ansi) + ")");
    }
    return positions[ansi];
}

int resolve(HueName hue, int level, int saturation) {
    level = std::min(std::max(level, LEVEL_MIN), LEVEL_MAX);
    saturation = std::min(std::max(saturation, SAT_MIN), SAT_MAX);
    // Every hue populates LEVEL_MAX
    while (table_row(hue, level)[0] < 0) ++level;
    return table_row(hue, level)[SAT_MAX - saturation];
}

DegUnit Hue::degree() const {
    if (achromatic()) return DegUnit(0);
    return DegUnit(static_cast<int>(id) * WHEEL_STEP);
}

Color Hue::operator()() const {
    return Color(index());
}

Color Hue::operator()(int level, int saturation, bool background) const {
    Color color(index(level, saturation));
    color.set_background(background);
    return color;
}

int Hue::index(int level, int saturation) const {
    check_domain(level, saturation);
    return resolve(id, level, saturation);
}

bool Hue::has_level(int level) const {
    if (level < LEVEL_MIN || level > LEVEL_MAX) return false;
    return table_row(id, level)[0] >= 0;
}

Hue Hue::rotated(int amount) const {
    if (achromatic()) return *this;
    const long long sector =
        ((static_cast<long long>(id) + amount) % N_WHEEL_HUES +
         N_WHEEL_HUES) % N_WHEEL_HUES;
    return Hue(static_cast<HueName>(sector));
}

std::string Hue::render(const std::string& text) const {
    return (*this)().render(text);
}

std::string Hue::table() const {
    const Color purest = (*this)();
    std::ostringstream ss;
    ss << purest.render(str() + "(y=level,x=saturation)") << "\n\n";
    ss << "    ";
    for (int sat = SAT_MAX; sat >= SAT_MIN; --sat) {
        std::string head = "(" + std::to_string(sat) + ")";
        head.resize(4, ' ');
        ss << purest.render(head);
    }
    ss << "\n";
    for (int lvl = LEVEL_MAX; lvl >= LEVEL_MIN; --lvl) {
        if (!has_level(lvl)) continue;
        std::string head = "(" + std::to_string(lvl) + ")";
        head.resize(4, ' ');
        ss << purest.render(head);
        for (int sat = SAT_MAX; sat >= SAT_MIN; --sat) {
            const Color color(resolve(id, lvl, sat));
            char cell[8];
            std::snprintf(cell, sizeof cell, "%3d", color.ansi().value());
            ss << color.render(cell) << " ";
        }
        ss << "\n";
    }
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Hue& hue) {
    return os << hue.str();
}

}  // namespace hues
