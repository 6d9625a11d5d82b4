#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <locale>

#include <boost/lexical_cast.hpp>

#include "error.hpp"
namespace hues {
namespace util {

bool is_varname(const std::string& str) {
    if (str.empty() || !util::is_varname_first(str[0])) return false;
    for (size_t k = 1; k < str.size(); ++k) {
        if (!util::is_varname_char(str[k])) return false;
    }
    return true;
}

bool is_whole_number(const std::string& str) {
    if (str.empty()) return false;
    for (size_t k = 0; k < str.size(); ++k) {
        if (str[k] < '0' || str[k] > '9') return false;
    }
    return true;
}

void ltrim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
                return !::std::isspace(ch);
            }));
}

void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(),
                         [](unsigned char ch) { return !::std::isspace(ch); })
                .base(),
            s.end());
}

void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) {
                return static_cast<char>(std::tolower(ch));
            });
    return s;
}

std::vector<std::string> split_args(const std::string& str) {
    std::vector<std::string> args;
    std::string tmp = str;
    trim(tmp);
    if (tmp.empty()) return args;
    size_t stkh = 0, prev_comma = 0;
    for (size_t i = 0; i <= tmp.size(); ++i) {
        if (i == tmp.size() || (stkh == 0 && tmp[i] == ',')) {
            args.push_back(tmp.substr(prev_comma, i - prev_comma));
            trim(args.back());
            prev_comma = i + 1;
        } else if (tmp[i] == '(' || tmp[i] == '[' || tmp[i] == '{') {
            ++stkh;
        } else if ((tmp[i] == ')' || tmp[i] == ']' || tmp[i] == '}') && stkh) {
            --stkh;
        }
    }
    return args;
}

bool is_integer_literal(const std::string& str) {
    size_t k = 0;
    if (k < str.size() && (str[k] == '+' || str[k] == '-')) ++k;
    return k < str.size() && is_whole_number(str.substr(k));
}

int parse_int(const std::string& str, const char* type_name) {
    std::string tmp = str;
    trim(tmp);
    long long value;
    try {
        value = boost::lexical_cast<long long>(tmp);
    } catch (const boost::bad_lexical_cast&) {
        if (is_integer_literal(tmp)) {
            throw RangeError(std::string(type_name) +
                    " value is out of range (got '" + str + "')");
        }
        throw FormatError(std::string(type_name) +
                " value must be convertible to int (got '" + str + "')");
    }
    // Saturate; callers range-check the result
    return static_cast<int>(std::min<long long>(
                std::max<long long>(value, std::numeric_limits<int>::min()),
                std::numeric_limits<int>::max()));
}

double parse_double(const std::string& str, const char* type_name) {
    std::string tmp = str;
    trim(tmp);
    try {
        return boost::lexical_cast<double>(tmp);
    } catch (const boost::bad_lexical_cast&) {
        throw FormatError(std::string(type_name) +
                " value must be convertible to float (got '" + str + "')");
    }
}

}  // namespace util
}  // namespace hues
