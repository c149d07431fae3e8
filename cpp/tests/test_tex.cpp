#include "quizterm/term.h"
#include <cassert>
#include <iostream>
#include <string>

namespace {

std::string tex(const std::string& source) {
    return quizterm::parse(source).to_tex_string();
}

}

void test_arithmetic() {
    assert(tex("x/2") == "\\frac{ x }{2}");
    assert(tex("2*pi") == "{2}\\cdot { \\pi }");
    assert(tex("x^2") == "{ x }^{2}");
    assert(tex("x-1") == "{ x }-{1}");
    assert(tex("-x") == "- x ");
    std::cout << "[PASS] test_arithmetic\n";
}

void test_parentheses_follow_input() {
    assert(tex("(x+1)*2") == "{\\left({{ x }+{1}}\\right)}\\cdot {2}");
    assert(tex("x+1") == "{ x }+{1}");
    assert(tex("1/(x+x)") == "\\frac{1}{{ x }+{ x }}");
    std::cout << "[PASS] test_parentheses_follow_input\n";
}

void test_functions() {
    assert(tex("sin(x)") == "\\sin\\left( x \\right)");
    assert(tex("sqrt(x^2)") == "\\sqrt{{ x }^{2}}");
    assert(tex("|1/(x+x)|") == "\\left|\\frac{1}{{ x }+{ x }}\\right|");
    assert(tex("floor(x)") == "\\left\\lfloor  x \\right\\rfloor ");
    assert(tex("asinh x") == "\\operatorname{arsinh}\\left( x \\right)");
    assert(tex("atan x") == "\\arctan\\left( x \\right)");
    std::cout << "[PASS] test_functions\n";
}

void test_constants() {
    using quizterm::Node;
    using quizterm::Term;
    assert(Term(Node::constant(0.0, 1.0)).to_tex_string() == "i");
    assert(Term(Node::constant(0.0, -1.0)).to_tex_string() == "-i");
    assert(Term(Node::constant(2.0, -1.0)).to_tex_string() == "2-i");
    assert(Term(Node::constant(1.5, 2.0)).to_tex_string() == "1.5+2i");
    assert(Term(Node::constant(1e-12, 0.0)).to_tex_string() == "0");
    std::cout << "[PASS] test_constants\n";
}

int main() {
    std::cout << "=== TeX Rendering Tests ===\n";

    test_arithmetic();
    test_parentheses_follow_input();
    test_functions();
    test_constants();

    std::cout << "\n[SUCCESS] All TeX rendering tests passed\n";
    return 0;
}
