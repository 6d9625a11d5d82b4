#include "color.hpp"

#include <algorithm>
#include <cstdio>
#include "error.hpp"
#include "hue.hpp"
#include "util.hpp"

namespace hues {

namespace {
Bit8 check_ansi(int ansi) {
    if (ansi < 0 || ansi > Bit8::MAX) {
        throw RangeError("ANSI value is invalid; must be 0-255 (got " +
                std::to_string(ansi) + ")");
    }
    return Bit8(ansi);
}

long long clamp_level(long long v, long long lo, long long hi) {
    return std::min(std::max(v, lo), hi);
}
}  // namespace

Color::Color(int ansi) : code(check_ansi(ansi)), bg(false) {}
Color::Color(const std::string& ansi)
    : code(check_ansi(util::parse_int(ansi, "ANSI"))), bg(false) {}

Color Color::from_rgb(const RGBModel& rgb) {
    return Color(nearest_ansi(rgb));
}
Color Color::from_hsv(const HSVModel& hsv) {
    return Color(nearest_ansi(hsv_to_rgb(hsv)));
}

RGBModel Color::rgb() const {
    return ansi_to_rgb(code.value());
}
HSVModel Color::hsv() const {
    return rgb_to_hsv(rgb());
}
HueName Color::hue() const {
    return hue_sector(rgb());
}
std::string Color::hue_name() const {
    return to_string(hue());
}

int Color::level() const {
    return locate(code.value()).level;
}
int Color::saturation() const {
    return locate(code.value()).saturation;
}

Color& Color::move_to(HueName hue, long long level, long long saturation) {
    level = clamp_level(level, LEVEL_MIN, LEVEL_MAX);
    saturation = clamp_level(saturation, SAT_MIN, SAT_MAX);
    code = Bit8(resolve(hue, static_cast<int>(level),
                static_cast<int>(saturation)));
    return *this;
}

Color& Color::rotate_forward(int amount) {
    const Position pos = locate(code.value());
    // Not on the wheel
    if (pos.hue == HueName::grey) return *this;
    return move_to(Hue(pos.hue).rotated(amount).name(), pos.level,
            pos.saturation);
}
Color& Color::rotate_backward(int amount) {
    return rotate_forward(-(amount % N_WHEEL_HUES));
}

Color& Color::brighten(int amount) {
    const Position pos = locate(code.value());
    return move_to(pos.hue, static_cast<long long>(pos.level) + amount,
            pos.saturation);
}
Color& Color::darken(int amount) {
    const Position pos = locate(code.value());
    return move_to(pos.hue, static_cast<long long>(pos.level) - amount,
            pos.saturation);
}

Color& Color::saturate(int amount) {
    const Position pos = locate(code.value());
    return move_to(pos.hue, pos.level,
            static_cast<long long>(pos.saturation) + amount);
}
Color& Color::desaturate(int amount) {
    const Position pos = locate(code.value());
    return move_to(pos.hue, pos.level,
            static_cast<long long>(pos.saturation) - amount);
}

Color Color::operator>>(int amount) const { return Color(*this) >>= amount; }
Color Color::operator<<(int amount) const { return Color(*this) <<= amount; }
Color Color::operator+(int amount) const { return Color(*this) += amount; }
Color Color::operator-(int amount) const { return Color(*this) -= amount; }
Color Color::operator*(int amount) const { return Color(*this) *= amount; }
Color Color::operator/(int amount) const { return Color(*this) /= amount; }

std::string Color::escape() const {
    return "\033[" + std::string(bg ? "48" : "38") + ";5;" +
        std::to_string(code.value()) + "m";
}

std::string Color::render(const std::string& text) const {
    return escape() + text + "\033[0m";
}

std::string Color::str() const {
    char buf[8];
    std::snprintf(buf, sizeof buf, "%3d", code.value());
    const RGBModel col = rgb();
    return std::string(buf) + " | " + col.str() + " | " +
        rgb_to_hsv(col).str();
}

bool Color::operator==(const Color& other) const {
    return code == other.code && bg == other.bg;
}
bool Color::operator!=(const Color& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const Color& color) {
    return os << color.str();
}

}  // namespace hues
