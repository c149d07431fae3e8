#include "quizterm/numeric.h"
#include "quizterm/ode.h"
#include "quizterm/symbolic.h"
#include "quizterm/term.h"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void print_usage() {
    std::cout << "Usage:\n";
    std::cout << "  quizterm_cli parse <expr>\n";
    std::cout << "  quizterm_cli tex <expr>\n";
    std::cout << "  quizterm_cli symengine <expr>\n";
    std::cout << "  quizterm_cli eval <expr> [name=value ...]\n";
    std::cout << "  quizterm_cli compare <lhs> <rhs>\n";
    std::cout << "  quizterm_cli compare_ode <lhs> <rhs>\n";
}

std::string format_complex(const quizterm::Complex& value) {
    const quizterm::Term term(quizterm::Node::constant(value));
    return term.to_display_string();
}

}

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage();
        return 1;
    }
    const std::string command = argv[1];
    try {
        if (command == "parse" || command == "tex" || command == "symengine") {
            const quizterm::Term term = quizterm::parse(argv[2]);
            if (command == "parse") {
                std::cout << term.to_display_string() << std::endl;
            } else if (command == "tex") {
                std::cout << term.to_tex_string() << std::endl;
            } else {
                std::cout << quizterm::to_symengine_string(term) << std::endl;
            }
            return 0;
        }
        if (command == "eval") {
            const quizterm::Term term = quizterm::parse(argv[2]);
            quizterm::Bindings bindings;
            for (int i = 3; i < argc; ++i) {
                const std::string assignment = argv[i];
                const auto eq = assignment.find('=');
                if (eq == std::string::npos || eq == 0) {
                    std::cerr << "Invalid binding '" << assignment << "', expected name=value"
                              << std::endl;
                    return 1;
                }
                bindings[assignment.substr(0, eq)] =
                    quizterm::parse(assignment.substr(eq + 1)).eval();
            }
            std::cout << format_complex(term.eval(bindings)) << std::endl;
            return 0;
        }
        if (command == "compare" || command == "compare_ode") {
            if (argc < 4) {
                print_usage();
                return 1;
            }
            const quizterm::Term lhs = quizterm::parse(argv[2]);
            const quizterm::Term rhs = quizterm::parse(argv[3]);
            const bool equal = command == "compare" ? quizterm::compare(lhs, rhs)
                                                    : quizterm::compare_ode(lhs, rhs);
            std::cout << (equal ? "true" : "false") << std::endl;
            return 0;
        }
        print_usage();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << std::endl;
        return 1;
    }
}
