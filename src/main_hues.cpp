#include "shell.hpp"
#include "version.hpp"
#include <cstring>
#include <string>
#include <vector>
#include <iostream>

namespace {
void print_usage(const char* prog) {
    std::cout << "usage: " << prog << " [-q] [-c LINE]...\n"
        "  (no -c)  read lines from stdin until 'exit' or EOF\n"
        "  -c LINE  evaluate LINE and exit; may be repeated\n"
        "  -q       do not print the banner\n"
        "  -h       show this help\n";
}
}  // namespace

int main(int argc, char ** argv) {
    using namespace hues;
    bool banner = true;
    std::vector<std::string> lines;
    for (int i = 1; i < argc; ++i) {
        if (!std::strcmp(argv[i], "-h") || !std::strcmp(argv[i], "--help")) {
            print_usage(argv[0]);
            return 0;
        } else if (!std::strcmp(argv[i], "-q")) {
            banner = false;
        } else if (!std::strcmp(argv[i], "-c")) {
            if (i + 1 >= argc) {
                std::cerr << argv[0] << ": -c requires an argument\n";
                return 2;
            }
            lines.push_back(argv[++i]);
        } else {
            std::cerr << argv[0] << ": unknown option " << argv[i] << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    if (lines.size()) {
        Shell shell(std::cout, false);
        int status = 0;
        for (const std::string& line : lines) {
            if (!shell.eval_line(line)) status = 1;
            if (shell.closed) break;
        }
        return status;
    }

    Shell shell(std::cout, banner);
    std::string line;
    while (!shell.closed) {
        std::cout << ">>> " << std::flush;
        std::getline(std::cin, line);
        if (!std::cin) break;
        shell.eval_line(line);
    }
    return 0;
}
