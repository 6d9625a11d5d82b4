#include "hue.hpp"
#include "spectrum.hpp"
#include "error.hpp"
#include "test_common.hpp"

#include <string>

using namespace hues;

int main() {
    BEGIN_TEST(test_hue);

    // Default colors
    ASSERT_EQ(Spectrum::red().ansi().value(), 196);
    ASSERT_EQ(Spectrum::orange().ansi().value(), 202);
    ASSERT_EQ(Spectrum::yellow().ansi().value(), 190);
    ASSERT_EQ(Spectrum::lime().ansi().value(), 82);
    ASSERT_EQ(Spectrum::green().ansi().value(), 46);
    ASSERT_EQ(Spectrum::turquoise().ansi().value(), 47);
    ASSERT_EQ(Spectrum::teal().ansi().value(), 45);
    ASSERT_EQ(Spectrum::cyan().ansi().value(), 27);
    ASSERT_EQ(Spectrum::blue().ansi().value(), 21);
    ASSERT_EQ(Spectrum::purple().ansi().value(), 57);
    ASSERT_EQ(Spectrum::magenta().ansi().value(), 165);
    ASSERT_EQ(Spectrum::rose().ansi().value(), 197);
    ASSERT_EQ(Spectrum::grey().ansi().value(), 249);

    // Explicit brightness and saturation
    ASSERT_EQ(Spectrum::red(2, 7).ansi().value(), 95);
    ASSERT_EQ(Spectrum::orange(1, 7).ansi().value(), 94);
    ASSERT_EQ(Spectrum::yellow(3, 5).ansi().value(), 144);
    ASSERT_EQ(Spectrum::lime(5, 6).ansi().value(), 155);
    ASSERT_EQ(Spectrum::green(3, 5).ansi().value(), 108);
    ASSERT_EQ(Spectrum::turquoise(1, 9).ansi().value(), 29);
    ASSERT_EQ(Spectrum::teal(1, 9).ansi().value(), 23);
    ASSERT_EQ(Spectrum::cyan(5, 6).ansi().value(), 75);
    ASSERT_EQ(Spectrum::blue(5, 6).ansi().value(), 99);
    ASSERT_EQ(Spectrum::magenta(5, 6).ansi().value(), 171);
    ASSERT_EQ(Spectrum::rose(5, 6).ansi().value(), 205);
    ASSERT_EQ(Spectrum::grey(3, 6).ansi().value(), 244);
    {
        Color purple = Spectrum::purple(5, 6, true);
        ASSERT_EQ(purple.ansi().value(), 135);
        ASSERT(purple.background());
        ASSERT_EQ(purple.render("hello, world"),
                  std::string("\033[48;5;135mhello, world\033[0m"));
    }
    ASSERT_EQ(Spectrum::rose(LEVEL_MAX, SAT_MAX, true).render("hello, world"),
              std::string("\033[48;5;197mhello, world\033[0m"));
    ASSERT_EQ(Spectrum::red.render("hello, world"),
              std::string("\033[38;5;196mhello, world\033[0m"));
    ASSERT_EQ(Spectrum::green.index(), 46);
    ASSERT_EQ(Spectrum::green.index(3), 34);

    // Domain checks happen before resolution
    ASSERT_THROWS(Spectrum::red(6, 9), RangeError);
    ASSERT_THROWS(Spectrum::red(-1, 9), RangeError);
    ASSERT_THROWS(Spectrum::red(5, 0), RangeError);
    ASSERT_THROWS(Spectrum::red(5, 10), RangeError);
    ASSERT_THROWS(Spectrum::grey.index(5, 10), RangeError);

    // Every (level, saturation) resolves to a cell of the right family
    for (const Hue& hue : Spectrum::hues()) {
        for (int level = LEVEL_MIN; level <= LEVEL_MAX; ++level) {
            for (int sat = SAT_MIN; sat <= SAT_MAX; ++sat) {
                const Color color = hue(level, sat);
                const int ansi = color.ansi().value();
                if (hue.achromatic()) {
                    const RGBModel rgb = color.rgb();
                    ASSERT(ansi >= 16);
                    ASSERT(rgb.r == rgb.g && rgb.g == rgb.b);
                } else {
                    ASSERT(ansi >= 16 && ansi <= 231);
                }
                ASSERT_EQ(color.hue(), hue.name());
                ASSERT_EQ(color.hue_name(), hue.str());
            }
        }
    }
    // More saturation never lowers HSV saturation within a level
    for (const Hue& hue : Spectrum::hues()) {
        if (hue.achromatic()) continue;
        for (int level = LEVEL_MIN; level <= LEVEL_MAX; ++level) {
            for (int sat = SAT_MIN; sat < SAT_MAX; ++sat) {
                ASSERT(hue(level, sat).hsv().s.value() <=
                       hue(level, sat + 1).hsv().s.value());
            }
        }
    }

    // Levels
    ASSERT(Spectrum::red.has_level(1));
    ASSERT(!Spectrum::orange.has_level(1));
    ASSERT(Spectrum::orange.has_level(2));
    ASSERT(!Spectrum::red.has_level(0));
    ASSERT(!Spectrum::red.has_level(6));
    for (const Hue& hue : Spectrum::hues()) {
        ASSERT(hue.has_level(LEVEL_MAX));
    }
    // Unpopulated level resolves to the next brighter one
    ASSERT_EQ(Spectrum::orange(1, 9).ansi(), Spectrum::orange(2, 9).ansi());
    ASSERT_EQ(Spectrum::red(0, 9).ansi(), Spectrum::red(1, 9).ansi());

    // Wheel
    ASSERT_EQ(Spectrum::red.degree().value(), 0);
    ASSERT_EQ(Spectrum::orange.degree().value(), 30);
    ASSERT_EQ(Spectrum::rose.degree().value(), 330);
    ASSERT_EQ(Spectrum::grey.degree().value(), 0);
    ASSERT(Spectrum::grey.achromatic());
    ASSERT(!Spectrum::teal.achromatic());
    ASSERT_EQ(Spectrum::rose.rotated(1), Spectrum::red);
    ASSERT_EQ(Spectrum::red.rotated(-1), Spectrum::rose);
    ASSERT_EQ(Spectrum::red.rotated(12), Spectrum::red);
    ASSERT_EQ(Spectrum::blue.rotated(-24), Spectrum::blue);
    ASSERT_EQ(Spectrum::grey.rotated(3), Spectrum::grey);

    // Positions
    {
        Position pos = locate(196);
        ASSERT_EQ(pos.hue, HueName::red);
        ASSERT_EQ(pos.level, 5);
        ASSERT_EQ(pos.saturation, 9);
        pos = locate(244);
        ASSERT_EQ(pos.hue, HueName::grey);
        ASSERT_EQ(pos.level, 3);
        ASSERT_EQ(pos.saturation, 6);
        ASSERT_THROWS(locate(256), RangeError);
    }
    for (int ansi = 0; ansi <= 255; ++ansi) {
        const Position pos = locate(ansi);
        ASSERT(pos.level >= LEVEL_MIN && pos.level <= LEVEL_MAX);
        ASSERT(pos.saturation >= SAT_MIN && pos.saturation <= SAT_MAX);
        if (ansi >= 16 && ansi <= 252) {
            ASSERT_EQ(resolve(pos.hue, pos.level, pos.saturation), ansi);
        }
    }

    // Table
    {
        const std::string table = Spectrum::orange.table();
        ASSERT(table.find("Orange(y=level,x=saturation)") != std::string::npos);
        ASSERT(table.find("(9) ") != std::string::npos);
        ASSERT(table.find("\033[38;5;214m214\033[0m ") != std::string::npos);
        ASSERT(table.find("\033[38;5;94m 94\033[0m ") != std::string::npos);
        // Red's darkest cell is not an Orange
        ASSERT(table.find("\033[38;5;52m 52\033[0m ") == std::string::npos);
    }

    END_TEST;
}
