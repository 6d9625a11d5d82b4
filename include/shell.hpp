#pragma once
#ifndef _SHELL_H_5C774826_30EB_4C60_9D59_6A07B9CD0A82
#define _SHELL_H_5C774826_30EB_4C60_9D59_6A07B9CD0A82
#include <map>
#include <string>
#include <ostream>
#include "color.hpp"

namespace hues {

// Line-oriented evaluator for color expressions, e.g.
//   Red(2, 7)        x = Purple(5, 6, bg)     x >>= 1
//   196 >> 1         rgb(255, 95, 0)          %table Teal
// See eval_line for the full list.
class Shell {
public:
    explicit Shell(std::ostream& os, bool banner = true);
    // Evaluate a line; returns true iff no error
    bool eval_line(std::string line); // string copy intentional
    // Whether shell is 'closed' (must be handled by frontend)
    bool closed = false;

    // Look up a variable; nullptr if undefined
    const Color* get(const std::string& var_name) const;

    // Evaluate an expression to a color.
    // Throws RangeError/FormatError (or nlohmann::json errors for
    // JSON literals) on failure.
    Color eval_expr(std::string expr) const;

private:
    // Print a color followed by newline
    void print(const Color& color);

    std::ostream& os;
    std::map<std::string, Color> vars;
};

}  // namespace hues
#endif // ifndef _SHELL_H_5C774826_30EB_4C60_9D59_6A07B9CD0A82
