#include "spectrum.hpp"

#include <iomanip>
#include <vector>
#include <nlohmann/json.hpp>

namespace hues {

using json = nlohmann::json;

Color Spectrum::white() {
    return grey(LEVEL_MAX, SAT_MIN);
}

Color Spectrum::black() {
    return grey(1, SAT_MAX);
}

const std::array<Hue, N_HUES>& Spectrum::hues() {
    static const std::array<Hue, N_HUES> all = {
        red, orange, yellow, lime, green, turquoise,
        teal, cyan, blue, purple, magenta, rose,
        grey
    };
    return all;
}

const Hue& Spectrum::get(HueName name) {
    return hues()[static_cast<size_t>(name)];
}

const Hue& Spectrum::get(const std::string& name) {
    return get(hue_from_string(name));
}

std::string Spectrum::table() {
    std::string out;
    for (const Hue& hue : hues()) {
        out.append("\n");
        out.append(hue.table());
    }
    return out;
}

std::ostream& Spectrum::export_json(std::ostream& os, bool pretty) {
    json j = json::object();
    for (const Hue& hue : hues()) {
        json jlevels = json::object();
        for (int lvl = LEVEL_MIN; lvl <= LEVEL_MAX; ++lvl) {
            if (!hue.has_level(lvl)) continue;
            std::vector<int> row;
            row.reserve(SAT_MAX);
            for (int sat = SAT_MAX; sat >= SAT_MIN; --sat) {
                row.push_back(hue.index(lvl, sat));
            }
            jlevels[std::to_string(lvl)] = row;
        }
        j[hue.str()] = jlevels;
    }
    if (pretty) os << std::setw(4);
    return os << j;
}

}  // namespace hues
