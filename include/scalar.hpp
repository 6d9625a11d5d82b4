#pragma once
#ifndef _SCALAR_H_D1446076_6CB3_4C02_8CE4_7087938F67C0
#define _SCALAR_H_D1446076_6CB3_4C02_8CE4_7087938F67C0
#include <string>
#include <ostream>

// Range-checked scalars used by the color model.
// Each throws RangeError when constructed outside its domain
// and FormatError when given a string that is not numeric.
namespace hues {

// 8-bit intensity or palette index (0-255)
class Bit8 {
public:
    static constexpr int MAX = 255;

    Bit8();
    // Not explicit on purpose
    Bit8(int value);
    // From numeric string e.g. "128"
    explicit Bit8(const std::string& value);

    int value() const { return val; }

    // Complement: 255 - value
    Bit8 operator~() const;

    // Saturating arithmetic, clamped to [0, 255]
    Bit8 operator+(int other) const;
    Bit8 operator-(int other) const;
    Bit8 operator*(int other) const;
    // Division by zero saturates to 255 (or 0 for 0/0)
    Bit8 operator/(int other) const;

    bool operator==(const Bit8& other) const { return val == other.val; }
    bool operator!=(const Bit8& other) const { return val != other.val; }
    bool operator<(const Bit8& other) const { return val < other.val; }

private:
    int val;
};

// Angle on the color wheel in whole degrees (0-360)
class DegUnit {
public:
    static constexpr int MAX = 360;

    DegUnit();
    DegUnit(int value);
    explicit DegUnit(const std::string& value);

    int value() const { return val; }

    // Wrapping arithmetic (mod 360; exactly 360 is kept)
    DegUnit operator+(int other) const;
    DegUnit operator-(int other) const;

    bool operator==(const DegUnit& other) const { return val == other.val; }
    bool operator!=(const DegUnit& other) const { return val != other.val; }

    // e.g. 270°
    std::string str() const;

private:
    int val;
};

// Percentage (0-100)
class Percent {
public:
    static constexpr double MAX = 100.0;

    Percent();
    explicit Percent(double value);
    explicit Percent(const std::string& value);

    // From a fraction in [0, 1]: 0.2594 -> 25.94
    static Percent from_fraction(double fraction);

    double value() const { return val; }

    // Fractional form: value / 100
    double operator~() const;

    bool operator==(const Percent& other) const { return val == other.val; }
    bool operator!=(const Percent& other) const { return val != other.val; }

    // e.g. 25.9%
    std::string str() const;

private:
    double val;
};

std::ostream& operator<<(std::ostream& os, const Bit8& b);
std::ostream& operator<<(std::ostream& os, const DegUnit& d);
std::ostream& operator<<(std::ostream& os, const Percent& p);

}  // namespace hues
#endif // ifndef _SCALAR_H_D1446076_6CB3_4C02_8CE4_7087938F67C0
