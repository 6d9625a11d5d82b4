#include "color_json.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include "error.hpp"
#include "hue.hpp"
#include "spectrum.hpp"

namespace hues {

using json = nlohmann::json;

namespace {
// Integer member as int, saturated to the int range so the
// caller's range check rejects it; non-integers throw FormatError
int json_int(const json& j, const char* what) {
    if (!j.is_number_integer()) {
        throw FormatError(std::string(what) + " must be an integer, not " +
                (j.is_number() ? std::string("a fraction") :
                 std::string(j.type_name())));
    }
    long long value;
    if (j.is_number_unsigned()) {
        const std::uint64_t u = j.get<std::uint64_t>();
        value = u > static_cast<std::uint64_t>(std::numeric_limits<int>::max()) ?
            std::numeric_limits<int>::max() : static_cast<long long>(u);
    } else {
        value = j.get<std::int64_t>();
    }
    return static_cast<int>(std::min<long long>(
                std::max<long long>(value, std::numeric_limits<int>::min()),
                std::numeric_limits<int>::max()));
}

// Optional integer member of an object
int json_int_member(const json& j, const char* key, int default_value) {
    if (!j.count(key)) return default_value;
    return json_int(j.at(key), key);
}
}  // namespace

void to_json(json& j, const RGBModel& rgb) {
    j = json::array({rgb.r.value(), rgb.g.value(), rgb.b.value()});
}

void from_json(const json& j, RGBModel& rgb) {
    rgb = RGBModel(json_int(j.at(0), "red"), json_int(j.at(1), "green"),
                   json_int(j.at(2), "blue"));
}

void to_json(json& j, const HSVModel& hsv) {
    j = json::array({hsv.h.value(), hsv.s.value(), hsv.v.value()});
}

void from_json(const json& j, HSVModel& hsv) {
    if (!j.at(1).is_number()) {
        throw FormatError(std::string("saturation must be a number, not ") +
                j.at(1).type_name());
    }
    hsv = HSVModel(DegUnit(json_int(j.at(0), "hue")),
                   Percent(j.at(1).get<double>()),
                   Bit8(json_int(j.at(2), "value")));
}

Color color_from_json(const std::string& text, std::string* error_msg) {
    if (error_msg) {
        error_msg->clear();
    }
    try {
        return json::parse(text).get<Color>();
    } catch (const json::exception& e) {
        if (error_msg) *error_msg = std::string("JSON error: ") + e.what();
    } catch (const RangeError& e) {
        if (error_msg) *error_msg = e.what();
    } catch (const FormatError& e) {
        if (error_msg) *error_msg = e.what();
    }
    return Spectrum::black();
}

}  // namespace hues

namespace nlohmann {

hues::Color adl_serializer<hues::Color>::from_json(const json& j) {
    if (!j.is_object()) {
        throw hues::FormatError("color must be a JSON object, not " +
                std::string(j.type_name()));
    }
    const bool background = j.value("background", false);
    if (j.count("ansi")) {
        hues::Color color(hues::json_int_member(j, "ansi", 0));
        color.set_background(background);
        return color;
    }
    const hues::Hue& hue =
        hues::Spectrum::get(j.at("hue").get<std::string>());
    return hue(hues::json_int_member(j, "level", hues::LEVEL_MAX),
               hues::json_int_member(j, "saturation", hues::SAT_MAX),
               background);
}

void adl_serializer<hues::Color>::to_json(json& j, const hues::Color& color) {
    j = json {
        {"ansi", color.ansi().value()},
        {"background", color.background()},
        {"hue", color.hue_name()},
        {"level", color.level()},
        {"saturation", color.saturation()},
        {"rgb", color.rgb()},
        {"hsv", color.hsv()},
    };
}

}  // namespace nlohmann
