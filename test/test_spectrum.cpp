#include "spectrum.hpp"
#include "error.hpp"
#include "test_common.hpp"

#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace hues;

int main() {
    BEGIN_TEST(test_spectrum);
    using json = nlohmann::json;

    // Catalogue
    {
        const auto& hues = Spectrum::hues();
        ASSERT_EQ(hues.size(), 13u);
        ASSERT_EQ(hues[0], Spectrum::red);
        ASSERT_EQ(hues[6], Spectrum::teal);
        ASSERT_EQ(hues[11], Spectrum::rose);
        ASSERT_EQ(hues[12], Spectrum::grey);
        for (int i = 0; i < N_WHEEL_HUES; ++i) {
            ASSERT_EQ(hues[i].degree().value(), i * WHEEL_STEP);
            ASSERT_EQ(hues[i].rotated(1), hues[(i + 1) % N_WHEEL_HUES]);
        }
    }
    ASSERT_EQ(Spectrum::get(HueName::cyan), Spectrum::cyan);
    ASSERT_EQ(Spectrum::get("Magenta"), Spectrum::magenta);
    ASSERT_EQ(Spectrum::get("turquoise"), Spectrum::turquoise);
    ASSERT_EQ(Spectrum::get("GRAY"), Spectrum::grey);
    ASSERT_THROWS(Spectrum::get("mauve"), FormatError);
    ASSERT_EQ(Spectrum::purple.str(), std::string("Purple"));

    // Greys
    ASSERT_EQ(Spectrum::grey().ansi().value(), 249);
    ASSERT_EQ(Spectrum::white().ansi().value(), 231);
    ASSERT_EQ(Spectrum::black().ansi().value(), 16);
    ASSERT_EQ(Spectrum::white(), Spectrum::grey(5, 1));
    ASSERT_EQ(Spectrum::black(), Spectrum::grey(1, 9));
    ASSERT_EQ(Spectrum::white().rgb(), RGBModel(255, 255, 255));
    ASSERT_EQ(Spectrum::black().rgb(), RGBModel(0, 0, 0));
    ASSERT(!Spectrum::white().background());

    // Every chromatic cube cell belongs to exactly one hue table
    {
        std::vector<int> seen(256, 0);
        for (const Hue& hue : Spectrum::hues()) {
            for (int level = LEVEL_MIN; level <= LEVEL_MAX; ++level) {
                if (!hue.has_level(level)) continue;
                int last = -1;
                for (int sat = SAT_MAX; sat >= SAT_MIN; --sat) {
                    const int ansi = hue.index(level, sat);
                    if (ansi != last) ++seen[ansi];
                    last = ansi;
                }
            }
        }
        for (int ansi = 16; ansi <= 231; ++ansi) {
            ASSERT_EQ(seen[ansi], 1);
        }
        for (int ansi = 232; ansi <= 252; ++ansi) {
            ASSERT_EQ(seen[ansi], 1);
        }
        ASSERT_EQ(seen[253] + seen[254] + seen[255], 0);
    }

    // Table text
    {
        const std::string table = Spectrum::table();
        for (const Hue& hue : Spectrum::hues()) {
            ASSERT(table.find(hue.str() + "(y=level,x=saturation)") !=
                   std::string::npos);
        }
    }

    // JSON export
    {
        std::stringstream ss;
        Spectrum::export_json(ss);
        json j = json::parse(ss.str());
        ASSERT_EQ(j.size(), 13u);
        ASSERT_EQ(j["Red"]["5"][0].get<int>(), 196);
        ASSERT_EQ(j["Red"]["2"][1].get<int>(), 95);
        ASSERT_EQ(j["Grey"]["3"][3].get<int>(), 244);
        ASSERT_EQ(j["Red"].count("0"), 0u);
        ASSERT_EQ(j["Orange"].count("1"), 0u);
        ASSERT_EQ(j["Orange"]["2"].size(), 9u);
        for (auto& hue : j.items()) {
            ASSERT_EQ(hue.value().count("5"), 1u);
        }

        std::stringstream pretty;
        Spectrum::export_json(pretty, true);
        ASSERT(pretty.str().find("\n    \"") != std::string::npos);
        ASSERT_EQ(json::parse(pretty.str()), j);
    }

    END_TEST;
}
