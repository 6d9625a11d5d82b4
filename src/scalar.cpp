#include "scalar.hpp"

#include <algorithm>
#include <cstdio>
#include "error.hpp"
#include "util.hpp"

namespace hues {

namespace {
int check_bit8(int value) {
    if (value < 0 || value > Bit8::MAX) {
        throw RangeError("Bit8 value must be between 0-255 (got " +
                std::to_string(value) + ")");
    }
    return value;
}

int check_degree(int value) {
    if (value < 0 || value > DegUnit::MAX) {
        throw RangeError("Degree value must be between 0-360 (got " +
                std::to_string(value) + ")");
    }
    return value;
}

double check_percent(double value) {
    // Written this way so NaN is rejected too
    if (!(value >= 0.0 && value <= Percent::MAX)) {
        throw RangeError("Percent value must be between 0-100 (got " +
                std::to_string(value) + ")");
    }
    return value;
}

// Results outside [0, 360] are taken mod 360
DegUnit wrap_degree(long long value) {
    if (value > DegUnit::MAX || value < 0) {
        value = ((value % DegUnit::MAX) + DegUnit::MAX) % DegUnit::MAX;
    }
    return DegUnit(static_cast<int>(value));
}

Bit8 clamp_bit8(long long value) {
    return Bit8(static_cast<int>(
                std::min<long long>(std::max<long long>(value, 0), Bit8::MAX)));
}
}  // namespace

Bit8::Bit8() : val(0) {}
Bit8::Bit8(int value) : val(check_bit8(value)) {}
Bit8::Bit8(const std::string& value)
    : val(check_bit8(util::parse_int(value, "Bit8"))) {}

Bit8 Bit8::operator~() const {
    return Bit8(MAX - val);
}

Bit8 Bit8::operator+(int other) const {
    return clamp_bit8(static_cast<long long>(val) + other);
}
Bit8 Bit8::operator-(int other) const {
    return clamp_bit8(static_cast<long long>(val) - other);
}
Bit8 Bit8::operator*(int other) const {
    return clamp_bit8(static_cast<long long>(val) * other);
}
Bit8 Bit8::operator/(int other) const {
    if (other == 0) return Bit8(val ? MAX : 0);
    return clamp_bit8(val / other);
}

DegUnit::DegUnit() : val(0) {}
DegUnit::DegUnit(int value) : val(check_degree(value)) {}
DegUnit::DegUnit(const std::string& value)
    : val(check_degree(util::parse_int(value, "Degree"))) {}

DegUnit DegUnit::operator+(int other) const {
    return wrap_degree(static_cast<long long>(val) + other);
}
DegUnit DegUnit::operator-(int other) const {
    return wrap_degree(static_cast<long long>(val) - other);
}

std::string DegUnit::str() const {
    return std::to_string(val) + "\xc2\xb0";
}

Percent::Percent() : val(0.0) {}
Percent::Percent(double value) : val(check_percent(value)) {}
Percent::Percent(const std::string& value)
    : val(check_percent(util::parse_double(value, "Percent"))) {}

Percent Percent::from_fraction(double fraction) {
    return Percent(fraction * MAX);
}

double Percent::operator~() const {
    return val / MAX;
}

std::string Percent::str() const {
    char buf[16];
    std::snprintf(buf, sizeof buf, "%.1f%%", val);
    return buf;
}

std::ostream& operator<<(std::ostream& os, const Bit8& b) {
    return os << b.value();
}
std::ostream& operator<<(std::ostream& os, const DegUnit& d) {
    return os << d.str();
}
std::ostream& operator<<(std::ostream& os, const Percent& p) {
    return os << p.str();
}

}  // namespace hues
