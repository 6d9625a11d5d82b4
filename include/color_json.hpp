#pragma once
#ifndef _COLOR_JSON_H_8BB4E074_F025_4FCE_A171_D17D6573BF2B
#define _COLOR_JSON_H_8BB4E074_F025_4FCE_A171_D17D6573BF2B
#include <string>
#include <nlohmann/json.hpp>
#include "color_model.hpp"
#include "color.hpp"

// JSON conversions for the color types
//   RGBModel -> [r, g, b]
//   HSVModel -> [h, s, v]
//   Color    -> {"ansi": 196, "background": false, "hue": "Red",
//                "level": 5, "saturation": 9,
//                "rgb": [255, 0, 0], "hsv": [0, 100.0, 255]}
// Reading a Color needs "ansi", or "hue" with optional "level" and
// "saturation"; "background" is optional. Out-of-domain values throw
// RangeError; a non-object, an unknown hue name or a non-integer index,
// level, saturation or channel FormatError; other malformed documents
// nlohmann::json exceptions.
namespace hues {

void to_json(nlohmann::json& j, const RGBModel& rgb);
void from_json(const nlohmann::json& j, RGBModel& rgb);
void to_json(nlohmann::json& j, const HSVModel& hsv);
void from_json(const nlohmann::json& j, HSVModel& hsv);

// Parse a Color from JSON text.
// On failure returns Black and, if error_msg is not null, writes the error to it
Color color_from_json(const std::string& text, std::string* error_msg = nullptr);

}  // namespace hues

namespace nlohmann {
// Color has no default constructor
template <>
struct adl_serializer<hues::Color> {
    static hues::Color from_json(const json& j);
    static void to_json(json& j, const hues::Color& color);
};
}  // namespace nlohmann

#endif // ifndef _COLOR_JSON_H_8BB4E074_F025_4FCE_A171_D17D6573BF2B
