#pragma once
#ifndef _ERROR_H_E5CF4D61_BE4A_4B7B_A208_610DF690B29D
#define _ERROR_H_E5CF4D61_BE4A_4B7B_A208_610DF690B29D
#include <stdexcept>
#include <string>

namespace hues {

// Value outside its type's closed domain
// (palette index, level, saturation, angle, ...)
struct RangeError : public std::out_of_range {
    explicit RangeError(const std::string& what_arg)
        : std::out_of_range(what_arg) {}
};

// Input that cannot be read as the expected numeric form
struct FormatError : public std::invalid_argument {
    explicit FormatError(const std::string& what_arg)
        : std::invalid_argument(what_arg) {}
};

}  // namespace hues
#endif // ifndef _ERROR_H_E5CF4D61_BE4A_4B7B_A208_610DF690B29D
