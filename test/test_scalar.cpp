#include "scalar.hpp"
#include "error.hpp"
#include "test_common.hpp"

#include <climits>
#include <string>

using namespace hues;

int main() {
    BEGIN_TEST(test_scalar);

    // Bit8
    ASSERT_EQ(Bit8(128).value(), 128);
    ASSERT_EQ(Bit8().value(), 0);
    ASSERT_EQ(Bit8(255).value(), 255);
    ASSERT_EQ(Bit8(std::string("128")).value(), 128);
    ASSERT_EQ(Bit8(std::string("  7 ")).value(), 7);
    ASSERT_THROWS(Bit8(256), RangeError);
    ASSERT_THROWS(Bit8(-1), RangeError);
    ASSERT_THROWS(Bit8(std::string("300")), RangeError);
    ASSERT_THROWS(Bit8(std::string("abc")), FormatError);
    ASSERT_THROWS(Bit8(std::string("12.5")), FormatError);
    ASSERT_THROWS(Bit8(std::string("")), FormatError);
    ASSERT_THROWS(Bit8(std::string("-99999999999")), RangeError);
    ASSERT_THROWS(Bit8(std::string("+99999999999999999999")), RangeError);
    ASSERT_THROWS(Bit8(std::string("-")), FormatError);
    ASSERT_EQ(Bit8(std::string("+12")).value(), 12);
    ASSERT_EQ(~Bit8(4), Bit8(251));
    ASSERT_EQ(~Bit8(0), Bit8(255));
    {
        // Complement does not modify
        Bit8 b(4);
        Bit8 c = ~b;
        ASSERT_EQ(b.value(), 4);
        ASSERT_EQ(c.value(), 251);
    }
    // Saturating arithmetic
    ASSERT_EQ(Bit8(250) + 10, Bit8(255));
    ASSERT_EQ(Bit8(5) - 10, Bit8(0));
    ASSERT_EQ(Bit8(100) * 3, Bit8(255));
    ASSERT_EQ(Bit8(100) * -1, Bit8(0));
    ASSERT_EQ(Bit8(100) / 3, Bit8(33));
    ASSERT_EQ(Bit8(100) / 0, Bit8(255));
    ASSERT_EQ(Bit8(0) / 0, Bit8(0));
    ASSERT_EQ(Bit8(10) + 5, Bit8(15));

    // DegUnit
    ASSERT_EQ(DegUnit(270).value(), 270);
    ASSERT_EQ(DegUnit(270).str(), std::string("270\xc2\xb0"));
    ASSERT_EQ(DegUnit(std::string("90")).value(), 90);
    ASSERT_EQ(DegUnit(360).value(), 360);
    ASSERT_THROWS(DegUnit(361), RangeError);
    ASSERT_THROWS(DegUnit(-30), RangeError);
    ASSERT_THROWS(DegUnit(std::string("ninety")), FormatError);
    ASSERT_THROWS(DegUnit(std::string("4294967296")), RangeError);
    ASSERT_EQ(DegUnit(330) + 60, DegUnit(30));
    ASSERT_EQ(DegUnit(330) + 30, DegUnit(360));
    ASSERT_EQ(DegUnit(30) - 60, DegUnit(330));
    ASSERT_EQ(DegUnit(0) - 720, DegUnit(0));
    // Extreme amounts wrap without overflow
    ASSERT_EQ(DegUnit(10) - INT_MIN, DegUnit(138));
    ASSERT_EQ(DegUnit(10) + INT_MIN, DegUnit(242));
    ASSERT_EQ(DegUnit(10) - INT_MAX, DegUnit(243));
    ASSERT_EQ(DegUnit(5) + INT_MAX, DegUnit(132));

    // Percent
    ASSERT_FLOAT_EQ(Percent(75.0).value(), 75.0);
    ASSERT_FLOAT_EQ(~Percent(75.0), 0.75);
    ASSERT_FLOAT_EQ(Percent::from_fraction(0.2594).value(), 25.94);
    ASSERT_FLOAT_EQ(~Percent::from_fraction(0.2594), 0.2594);
    ASSERT_FLOAT_EQ(Percent(std::string("12.5")).value(), 12.5);
    ASSERT_EQ(Percent(68.1).str(), std::string("68.1%"));
    ASSERT_EQ(Percent(100).str(), std::string("100.0%"));
    ASSERT_THROWS(Percent(100.5), RangeError);
    ASSERT_THROWS(Percent(-0.1), RangeError);
    ASSERT_THROWS(Percent::from_fraction(1.5), RangeError);
    ASSERT_THROWS(Percent(std::string("nan")), RangeError);
    ASSERT_THROWS(Percent(std::string("lots")), FormatError);
    for (int i = 0; i <= 100; ++i) {
        Percent p(i);
        ASSERT_FLOAT_EQ(~p, p.value() / 100.0);
    }

    END_TEST;
}
