#include "shell.hpp"

#include "version.hpp"

#include <vector>
#include <cctype>
#include <nlohmann/json.hpp>
#include "color_json.hpp"
#include "error.hpp"
#include "hue.hpp"
#include "spectrum.hpp"
#include "util.hpp"

namespace {
std::string get_word(std::string& str_to_parse) {
    auto is_space = [&](size_t k) {
        return std::isspace(static_cast<unsigned char>(str_to_parse[k])) != 0;
    };
    size_t i = 0;
    for (; i < str_to_parse.size(); ++i) if (!is_space(i)) break;
    for (; i < str_to_parse.size(); ++i) if (is_space(i)) break;
    std::string word = str_to_parse.substr(0, i);
    str_to_parse = str_to_parse.substr(i);
    return word;
}

// true if is operator character
constexpr bool is_op_char(char c) {
    return c == '>' || c == '<' || c == '+' || c == '-' ||
           c == '*' || c == '/' || c == '=';
}

// Position of the last top-level binary operator in expr,
// or -1 if there is none. op_len receives 1 or 2 (for >> and <<).
size_t find_binary_op(const std::string& expr, size_t& op_len) {
    size_t stkh = 0;
    for (size_t i = expr.size(); i-- > 0; ) {
        const char c = expr[i];
        if (c == ')' || c == ']' || c == '}') {
            ++stkh;
        } else if (c == '(' || c == '[' || c == '{') {
            if (stkh) --stkh;
        } else if (stkh == 0 && (c == '+' || c == '-' || c == '*' ||
                    c == '/' || c == '>' || c == '<')) {
            size_t begin = i;
            if ((c == '>' || c == '<') && i > 0 && expr[i - 1] == c) {
                begin = i - 1;
            } else if (c == '>' || c == '<') {
                continue;
            }
            // Unary sign: nothing but space/operators before it
            size_t j = begin;
            while (j > 0 &&
                   std::isspace(static_cast<unsigned char>(expr[j - 1]))) --j;
            if (j == 0 || is_op_char(expr[j - 1])) {
                i = begin;
                continue;
            }
            op_len = i - begin + 1;
            return begin;
        }
    }
    return -1;
}

bool is_reserved(const std::string& name) {
    const std::string key = hues::util::to_lower(name);
    if (key == "white" || key == "black" || key == "color" ||
        key == "rgb" || key == "hsv" || key == "bg" || key == "exit") {
        return true;
    }
    try {
        hues::hue_from_string(key);
        return true;
    } catch (const hues::FormatError&) {
        return false;
    }
}

bool parse_flag(const std::string& arg) {
    const std::string key = hues::util::to_lower(arg);
    if (key == "bg" || key == "true" || key == "1") return true;
    if (key == "fg" || key == "false" || key == "0") return false;
    throw hues::FormatError("'" + arg + "' is not a background flag "
                            "(use bg/fg)");
}

// Apply a color operator in place
void apply_op(hues::Color& color, const std::string& op, int amount) {
    if (op == ">>") color >>= amount;
    else if (op == "<<") color <<= amount;
    else if (op == "+") color += amount;
    else if (op == "-") color -= amount;
    else if (op == "*") color *= amount;
    else if (op == "/") color /= amount;
    else throw hues::FormatError("Unknown operator '" + op + "'");
}

}  // namespace

namespace hues {

Shell::Shell(std::ostream& os, bool banner) : os(os) {
    if (banner) {
        os << "hues " HUES_VERSION " " HUES_COPYRIGHT << std::endl;
    }
}

const Color* Shell::get(const std::string& var_name) const {
    auto it = vars.find(var_name);
    return it == vars.end() ? nullptr : &it->second;
}

void Shell::print(const Color& color) {
    os << color.render(color.str()) << "\n";
}

Color Shell::eval_expr(std::string expr) const {
    util::trim(expr);
    if (expr.empty()) {
        throw FormatError("Empty expression");
    }
    size_t op_len;
    size_t op_pos = find_binary_op(expr, op_len);
    if (~op_pos) {
        Color color = eval_expr(expr.substr(0, op_pos));
        apply_op(color, expr.substr(op_pos, op_len),
                util::parse_int(expr.substr(op_pos + op_len), "Amount"));
        return color;
    }

    if (expr[0] == '{') {
        // JSON literal
        return nlohmann::json::parse(expr).get<Color>();
    }

    if (util::is_whole_number(expr)) {
        return Color(expr);
    }

    // name or name(args)
    std::string name = expr, arg_str;
    bool has_args = false;
    auto brpos = expr.find('(');
    if (brpos != std::string::npos) {
        if (expr.back() != ')') {
            throw FormatError("Syntax error: expected ')' in '" + expr + "'");
        }
        name = expr.substr(0, brpos);
        util::rtrim(name);
        arg_str = expr.substr(brpos + 1, expr.size() - brpos - 2);
        has_args = true;
    }
    std::vector<std::string> args = util::split_args(arg_str);
    const std::string key = util::to_lower(name);

    if (!has_args) {
        auto it = vars.find(name);
        if (it != vars.end()) return it->second;
        if (key == "white") return Spectrum::white();
        if (key == "black") return Spectrum::black();
    } else if (key == "color") {
        if (args.size() != 1) {
            throw FormatError("Color takes 1 argument (got " +
                    std::to_string(args.size()) + ")");
        }
        return Color(args[0]);
    } else if (key == "rgb" || key == "hsv") {
        if (args.size() != 3) {
            throw FormatError(key + " takes 3 arguments (got " +
                    std::to_string(args.size()) + ")");
        }
        if (key == "rgb") {
            return Color::from_rgb(RGBModel(Bit8(args[0]), Bit8(args[1]),
                        Bit8(args[2])));
        }
        return Color::from_hsv(HSVModel(DegUnit(args[0]), Percent(args[1]),
                    Bit8(args[2])));
    }

    HueName hue_name = HueName::grey;
    try {
        hue_name = hue_from_string(name);
    } catch (const FormatError&) {
        throw FormatError("\"" + name + "\" is not a variable or hue");
    }
    const Hue& hue = Spectrum::get(hue_name);
    if (args.size() > 3) {
        throw FormatError(hue.str() + " takes at most 3 arguments (got " +
                std::to_string(args.size()) + ")");
    }
    const int level = args.size() > 0 ?
        util::parse_int(args[0], "Level") : LEVEL_MAX;
    const int saturation = args.size() > 1 ?
        util::parse_int(args[1], "Saturation") : SAT_MAX;
    const bool background = args.size() > 2 && parse_flag(args[2]);
    return hue(level, saturation, background);
}

bool Shell::eval_line(std::string line) {
    util::trim(line);
    if (line.empty()) return true;
    if (line == "exit") {
        // Exit shell, if applicable
        closed = true;
        return true;
    }

    try {
        std::string cmd;
        if (line[0] == '%') {
            cmd = get_word(line);
        }
        util::trim(line);
        if (cmd == "%del") {
            // Delete variable
            if (vars.erase(line)) {
                os << "del " << line << std::endl;
            } else {
                os << "Undefined variable " << line << "\n";
                return false;
            }
        } else if (cmd == "%hues") {
            for (const Hue& hue : Spectrum::hues()) {
                os << hue.render(hue.str()) << " " << hue.degree() << "\n";
            }
        } else if (cmd == "%table") {
            if (line.empty()) {
                os << Spectrum::table();
            } else {
                os << Spectrum::get(line).table();
            }
        } else if (cmd == "%json") {
            if (line.empty()) {
                Spectrum::export_json(os, true) << "\n";
            } else {
                os << nlohmann::json(eval_expr(line)).dump(4) << "\n";
            }
        } else if (!cmd.empty()) {
            os << "Unknown command " << cmd << "\n";
            return false;
        } else if (line.size() > 3 && line.compare(line.size() - 3, 3, ".bg") == 0
                   && util::is_varname(line.substr(0, line.size() - 3))) {
            // Mark as background / foreground
            auto it = vars.find(line.substr(0, line.size() - 3));
            if (it == vars.end()) {
                os << "Undefined variable " << line.substr(0, line.size() - 3) << "\n";
                return false;
            }
            it->second.set_background(true);
            print(it->second);
        } else if (line.size() > 3 && line.compare(line.size() - 3, 3, ".fg") == 0
                   && util::is_varname(line.substr(0, line.size() - 3))) {
            auto it = vars.find(line.substr(0, line.size() - 3));
            if (it == vars.end()) {
                os << "Undefined variable " << line.substr(0, line.size() - 3) << "\n";
                return false;
            }
            it->second.set_background(false);
            print(it->second);
        } else {
            // Assignment, possibly with operator (x >>= 2)
            size_t pos = std::string::npos;
            if (util::is_varname_first(line[0])) {
                size_t stkh = 0;
                for (size_t i = 0; i < line.size(); ++i) {
                    if (line[i] == '(' || line[i] == '{') ++stkh;
                    else if ((line[i] == ')' || line[i] == '}') && stkh) --stkh;
                    else if (stkh == 0 && line[i] == '=') {
                        pos = i;
                        break;
                    }
                }
            }
            if (pos == std::string::npos) {
                print(eval_expr(line));
                return true;
            }
            std::string var = line.substr(0, pos), op;
            util::trim(var);
            while (var.size() && is_op_char(var.back())) {
                op.insert(op.begin(), var.back());
                var.pop_back();
            }
            util::trim(var);
            if (!util::is_varname(var)) {
                os << "'" << var << "' is not a valid variable name\n";
                return false;
            }
            if (is_reserved(var)) {
                os << "'" << var << "' is reserved\n";
                return false;
            }
            const std::string rhs = line.substr(pos + 1);
            if (op.empty()) {
                // Usual assignment
                Color color = eval_expr(rhs);
                vars.erase(var);
                vars.emplace(var, color);
            } else {
                // Operator assignment
                auto it = vars.find(var);
                if (it == vars.end()) {
                    os << "Undefined variable \"" << var
                        << "\" (operator assignment)\n";
                    return false;
                }
                // Applied to a copy so a failure leaves the variable as is
                Color color = it->second;
                apply_op(color, op, util::parse_int(rhs, "Amount"));
                it->second = color;
            }
            os << var << " = ";
            print(vars.at(var));
        }
    } catch (const RangeError& e) {
        os << e.what() << "\n";
        return false;
    } catch (const FormatError& e) {
        os << e.what() << "\n";
        return false;
    } catch (const nlohmann::json::exception& e) {
        os << "JSON error: " << e.what() << "\n";
        return false;
    }
    return true;
}

}  // namespace hues
