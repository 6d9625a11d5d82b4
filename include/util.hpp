#pragma once
#ifndef _UTIL_H_9BFD7795_753E_4EC8_BD56_2ED7C882C6D7
#define _UTIL_H_9BFD7795_753E_4EC8_BD56_2ED7C882C6D7
#include <string>
#include <vector>
namespace hues {
namespace util {

// true if can be first char of a variable name
constexpr bool is_varname_first(char c) {
    return
        (c >= 'a' && c <= 'z') ||
        (c >= 'A' && c <= 'Z') ||
        c == '_';
}

// true if can appear after the first char of a variable name
constexpr bool is_varname_char(char c) {
    return is_varname_first(c) || (c >= '0' && c <= '9');
}

// checks if string is valid variable name
bool is_varname(const std::string& str);
// checks if string is a nonnegative integer (only 0-9)
bool is_whole_number(const std::string& str);

// string trimming/strip
void ltrim(std::string &s);
void rtrim(std::string &s);
void trim(std::string &s);

// lowercase copy (ASCII)
std::string to_lower(std::string s);

// Split on top-level commas, trimming each piece.
// "2, 7 ,bg" -> {"2", "7", "bg"}; "" -> {}
std::vector<std::string> split_args(const std::string& str);

// checks if string is an optionally signed run of digits
bool is_integer_literal(const std::string& str);

// Parse a whole string as int/double, ignoring surrounding whitespace.
// type_name is used in the error message.
// Throws FormatError if the string is not numeric.
// parse_int saturates to the int range; integer literals too long
// for long long throw RangeError.
int parse_int(const std::string& str, const char* type_name);
double parse_double(const std::string& str, const char* type_name);

}  // namespace util
}  // namespace hues
#endif // ifndef _UTIL_H_9BFD7795_753E_4EC8_BD56_2ED7C882C6D7
