#include "color_model.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include "error.hpp"
#include "util.hpp"

namespace hues {

namespace {
const char* const HUE_NAMES[N_HUES] = {
    "Red", "Orange", "Yellow", "Lime", "Green", "Turquoise",
    "Teal", "Cyan", "Blue", "Purple", "Magenta", "Rose",
    "Grey"
};

// xterm system colors 0-15
const int SYSTEM_COLORS[16][3] = {
    {  0,   0,   0}, {128,   0,   0}, {  0, 128,   0}, {128, 128,   0},
    {  0,   0, 128}, {128,   0, 128}, {  0, 128, 128}, {192, 192, 192},
    {128, 128, 128}, {255,   0,   0}, {  0, 255,   0}, {255, 255,   0},
    {  0,   0, 255}, {255,   0, 255}, {  0, 255, 255}, {255, 255, 255},
};

// Hue as a fraction of a turn in [0, 1) and saturation in [0, 1].
// Returns false (h = s = 0) for achromatic input.
// The operation order is fixed: sector rounding depends on exact ties.
bool wheel_position(int r, int g, int b, double& h, double& s) {
    const int maxc = std::max(r, std::max(g, b));
    const int minc = std::min(r, std::min(g, b));
    if (maxc == minc) {
        h = s = 0.0;
        return false;
    }
    const double rangec = maxc - minc;
    s = rangec / maxc;
    const double rc = (maxc - r) / rangec;
    const double gc = (maxc - g) / rangec;
    const double bc = (maxc - b) / rangec;
    if (r == maxc) {
        h = bc - gc;
    } else if (g == maxc) {
        h = 2.0 + rc - bc;
    } else {
        h = 4.0 + gc - rc;
    }
    h = std::fmod(h / 6.0, 1.0);
    if (h < 0.0) h += 1.0;
    return true;
}

int nearest_level(int v) {
    // Midpoints of {0, 95, 135, 175, 215, 255}
    if (v < 48)  return 0;
    if (v < 115) return 1;
    if (v < 155) return 2;
    if (v < 195) return 3;
    if (v < 235) return 4;
    return 5;
}

int sqr_dist(const RGBModel& a, const RGBModel& b) {
    const int dr = a.r.value() - b.r.value();
    const int dg = a.g.value() - b.g.value();
    const int db = a.b.value() - b.b.value();
    return dr * dr + dg * dg + db * db;
}

Bit8 round_channel(double c) {
    return Bit8(static_cast<int>(
                std::min(std::max(std::lround(c), 0L), 255L)));
}
}  // namespace

RGBModel::RGBModel() {}
RGBModel::RGBModel(Bit8 r, Bit8 g, Bit8 b) : r(r), g(g), b(b) {}

bool RGBModel::operator==(const RGBModel& other) const {
    return r == other.r && g == other.g && b == other.b;
}
bool RGBModel::operator!=(const RGBModel& other) const {
    return !(*this == other);
}

std::string RGBModel::str() const {
    char buf[32];
    std::snprintf(buf, sizeof buf, "rgb(%3d, %3d, %3d)",
            r.value(), g.value(), b.value());
    return buf;
}

HSVModel::HSVModel() {}
HSVModel::HSVModel(DegUnit h, Percent s, Bit8 v) : h(h), s(s), v(v) {}

bool HSVModel::operator==(const HSVModel& other) const {
    return h == other.h && s == other.s && v == other.v;
}
bool HSVModel::operator!=(const HSVModel& other) const {
    return !(*this == other);
}

std::string HSVModel::str() const {
    // The degree sign is two bytes in UTF-8, so pad by hand
    std::string hs = h.str(), ss = s.str();
    while (hs.size() < 5) hs.insert(hs.begin(), ' ');
    while (ss.size() < 6) ss.insert(ss.begin(), ' ');
    char buf[8];
    std::snprintf(buf, sizeof buf, "%3d", v.value());
    return "hsv(" + hs + ", " + ss + ", " + buf + ")";
}

std::ostream& operator<<(std::ostream& os, const RGBModel& rgb) {
    return os << rgb.str();
}
std::ostream& operator<<(std::ostream& os, const HSVModel& hsv) {
    return os << hsv.str();
}

HSVModel rgb_to_hsv(const RGBModel& rgb) {
    double h, s;
    const int v = std::max(rgb.r.value(),
            std::max(rgb.g.value(), rgb.b.value()));
    if (v == 0 || !wheel_position(rgb.r.value(), rgb.g.value(),
                rgb.b.value(), h, s)) {
        return HSVModel(DegUnit(0), Percent(0.0), Bit8(v));
    }
    int deg = static_cast<int>(std::lround(h * 360.0));
    if (deg == DegUnit::MAX) deg = 0;
    return HSVModel(DegUnit(deg), Percent::from_fraction(s), Bit8(v));
}

RGBModel hsv_to_rgb(const HSVModel& hsv) {
    const double v = hsv.v.value();
    const double s = ~hsv.s;
    if (s == 0.0) {
        return RGBModel(hsv.v, hsv.v, hsv.v);
    }
    const double hh = (hsv.h.value() % DegUnit::MAX) / 60.0;
    const int i = static_cast<int>(std::floor(hh));
    const double f = hh - i;
    const double p = v * (1.0 - s);
    const double q = v * (1.0 - s * f);
    const double t = v * (1.0 - s * (1.0 - f));
    switch (i % 6) {
        case 0: return RGBModel(round_channel(v), round_channel(t), round_channel(p));
        case 1: return RGBModel(round_channel(q), round_channel(v), round_channel(p));
        case 2: return RGBModel(round_channel(p), round_channel(v), round_channel(t));
        case 3: return RGBModel(round_channel(p), round_channel(q), round_channel(v));
        case 4: return RGBModel(round_channel(t), round_channel(p), round_channel(v));
        default: return RGBModel(round_channel(v), round_channel(p), round_channel(q));
    }
}

std::string to_string(HueName name) {
    return HUE_NAMES[static_cast<int>(name)];
}

HueName hue_from_string(const std::string& name) {
    std::string key = util::to_lower(name);
    util::trim(key);
    if (key == "gray") return HueName::grey;
    for (int i = 0; i < N_HUES; ++i) {
        if (key == util::to_lower(HUE_NAMES[i])) {
            return static_cast<HueName>(i);
        }
    }
    throw FormatError("'" + name + "' is not the name of a hue");
}

std::ostream& operator<<(std::ostream& os, HueName name) {
    return os << HUE_NAMES[static_cast<int>(name)];
}

HueName hue_sector(const RGBModel& rgb) {
    double h, s;
    if (!wheel_position(rgb.r.value(), rgb.g.value(), rgb.b.value(), h, s)) {
        return HueName::grey;
    }
    // nearbyint rounds ties to even under the default rounding mode
    const int sector = static_cast<int>(std::nearbyint((360.0 * h) / WHEEL_STEP));
    return static_cast<HueName>(sector % N_WHEEL_HUES);
}

RGBModel ansi_to_rgb(int ansi) {
    if (ansi < 0 || ansi > Bit8::MAX) {
        throw RangeError("ANSI value is invalid; must be 0-255 (got " +
                std::to_string(ansi) + ")");
    }
    if (ansi < palette::CUBE_BEGIN) {
        const int* c = SYSTEM_COLORS[ansi];
        return RGBModel(c[0], c[1], c[2]);
    }
    if (ansi >= palette::GRAY_BEGIN) {
        const int s = (ansi - palette::GRAY_BEGIN) * 10 + 8;
        return RGBModel(s, s, s);
    }
    const int n = ansi - palette::CUBE_BEGIN;
    return RGBModel(palette::RAMP[n / 36],
                    palette::RAMP[(n / 6) % 6],
                    palette::RAMP[n % 6]);
}

int nearest_ansi(const RGBModel& rgb) {
    // Candidate 1: cube
    const int ri = nearest_level(rgb.r.value());
    const int gi = nearest_level(rgb.g.value());
    const int bi = nearest_level(rgb.b.value());
    int best = palette::CUBE_BEGIN + 36 * ri + 6 * gi + bi;
    int best_d2 = sqr_dist(rgb, ansi_to_rgb(best));

    // Candidate 2: grayscale ramp, entries are 8 + 10k
    const int avg = (rgb.r.value() + rgb.g.value() + rgb.b.value() + 1) / 3;
    const int k = std::min(std::max((avg - 8 + 5) / 10, 0), 23);
    const int gray = palette::GRAY_BEGIN + (avg <= 8 ? 0 : k);
    const int gray_d2 = sqr_dist(rgb, ansi_to_rgb(gray));
    if (gray_d2 < best_d2) {
        best = gray;
    }
    return best;
}

}  // namespace hues
