#include "quizterm/numeric.h"
#include "quizterm/term.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <random>
#include <string>

namespace {

struct Case {
    const char* lhs;
    const char* rhs;
    bool equal;
};

// Each pair must compare as stated; the grammar decides how a space, an
// implicit product or a function without parentheses binds.
const Case kCases[] = {
    {"xyz t", "x*y*z*t", true},
    {"2+4*5", "2+(4*5)", true},
    {"(2+4)*5", "30", true},
    {"2^3", "(2^3)", true},
    {"2^3^4", "((2^3)^4)", true},
    {"(2i)^3", "((2*(1i))^3)", true},
    {"-sin 3x + cos(x^5+1)", "(-(sin((3*x)))+cos(((x^5)+1)))", true},
    {"2^3", "8", true},
    {"2^3", "8.000001", false},
    {"2x", "x + x", true},
    {"2x", "x + x + 0.00001", false},
    {"cos 0", "1", true},
    {"cos(0)", "1", true},
    {"sinpi2", "sin(pi)*2", true},
    {"sin2pi", "sin(2*pi)", true},
    {"sin pi+pi", "sin(pi)+pi", true},
    {"sin pipi", "sin(pi*pi)", true},
    {"sin 2pi", "sin(2*pi)", true},
    {"sin 2*pi", "sin(2*pi)", true},
    {"sin 2*pi*5", "sin(2*pi*5)", true},
    {"sin 2*pi *5", "sin(2*pi)*5", true},
    {"sin (2*pi)", "sin(2*pi)", true},
    {"sin 2* pi", "sin(2*pi)", true},
    {"sin 2(pi)", "sin(2)*pi", true},
    {"sin 2 * pi", "sin(2)*pi", true},
    {"sin 2 *pi", "sin(2)*pi", true},
    {"sin 2 pi", "sin(2)*pi", true},
    {"sin pi^2", "sin(pi^2)", true},
    {"sin pi^2^2", "sin((pi^2)^2)", true},
    {"sin pi^2 ^2", "sin(pi^2)^2", true},
    {"sin pi ^2", "(sin(pi))^2", true},
    {"lnx", "ln(x)", true},
    {"lnx 2", "ln(x)*2", true},
    {"sin 2pi + 1", "1", true},
    {"sin 2 * pi + 1", "sin(2) * pi + 1", true},
    {"sin 2 pi + 1", "sin(2) * pi + 1", true},
    {"sin 2*pi*4 + 3", "3", true},
    {"sin 2 pi 4 + 3", "sin(2)*pi*4+3", true},
    {"sin(2pi)", "0", true},
    {"sin(pi/2)", "1", true},
    {"sqrt(-1)", "i", true},
    {"1/x", "x^(-1)", true},
    {"sinc2x+1", "sin(2x)/(2x)+1", true},
    {"x(x+1)", "x^2+x", true},
    {"|x-1|", "abs(x-1)", true},
    {"cosh x", "(e^x+e^(-x))/2", true},
    {"SIN x", "sin(x)", true},
    {"I", "i", true},
    {"log2(8)", "3", true},
    {"log10 1000", "3", true},
};

}

void test_grammar_cases() {
    std::mt19937 rng(42);
    for (const Case& c : kCases) {
        const bool equal =
            quizterm::compare(quizterm::parse(c.lhs), quizterm::parse(c.rhs), {}, rng);
        if (equal != c.equal) {
            std::cerr << "[FAIL] " << c.lhs << (c.equal ? " == " : " != ") << c.rhs << "\n";
        }
        assert(equal == c.equal);
    }
    std::cout << "[PASS] test_grammar_cases\n";
}

void test_display_string() {
    assert(quizterm::parse("2+4*5").to_display_string() == "(2+(4*5))");
    assert(quizterm::parse("-sin 3x + cos(x^5+1)").to_display_string() ==
           "(-(sin((3*x)))+cos(((x^5)+1)))");
    assert(quizterm::parse("2^3^4").to_display_string() == "((2^3)^4)");
    assert(quizterm::parse("0.5x").to_display_string() == "(0.5*x)");
    assert(quizterm::parse("C1 exp(2x)").to_display_string() == "(C1*exp((2*x)))");
    std::cout << "[PASS] test_display_string\n";
}

void test_display_string_reparses() {
    std::mt19937 rng(7);
    const char* sources[] = {"sin 2 pi 4 + 3", "|1/(x+x)|", "sqrt x ^2", "-x^2+y", "(1+2i)^(3+4i)",
                             "x/0.00000000000000000001", "0.000000000000001 x + 1"};
    for (const char* source : sources) {
        const quizterm::Term term = quizterm::parse(source);
        const quizterm::Term again = quizterm::parse(term.to_display_string());
        assert(quizterm::compare(term, again, {}, rng));
    }
    std::cout << "[PASS] test_display_string_reparses\n";
}

void test_display_overflowed_literal() {
    const std::string huge = "1" + std::string(400, '0');
    const quizterm::Term term = quizterm::parse(huge);
    assert(std::isinf(term.root().value.real()));
    const quizterm::Term again = quizterm::parse(term.to_display_string());
    assert(again.root().is_const());
    assert(std::isinf(again.root().value.real()));
    assert(again.root().value.real() > 0);

    const quizterm::Term negated = quizterm::parse("-" + huge);
    const quizterm::Term negated_again = quizterm::parse(negated.to_display_string());
    assert(quizterm::structurally_equal(negated, negated_again));
    std::cout << "[PASS] test_display_overflowed_literal\n";
}

void test_explicit_parentheses() {
    const quizterm::Term grouped = quizterm::parse("(x+1)");
    assert(grouped.root().explicit_parentheses);
    const quizterm::Term bare = quizterm::parse("x+1");
    assert(!bare.root().explicit_parentheses);
    assert(quizterm::structurally_equal(grouped, bare));
    std::cout << "[PASS] test_explicit_parentheses\n";
}

void test_whitespace_changes_structure() {
    assert(!quizterm::structurally_equal(quizterm::parse("sin 2pi"), quizterm::parse("sin 2 pi")));
    assert(quizterm::structurally_equal(quizterm::parse("sin 2pi"), quizterm::parse("sin(2*pi)")));
    assert(quizterm::structurally_equal(quizterm::parse("sin 2 pi"), quizterm::parse("sin(2)*pi")));
    std::cout << "[PASS] test_whitespace_changes_structure\n";
}

void test_identifiers() {
    const auto names = quizterm::parse("x + y*pi + e + C1 + C2 + true").variables();
    assert(names.size() == 4);
    assert(names.count("x") == 1);
    assert(names.count("y") == 1);
    assert(names.count("C1") == 1);
    assert(names.count("C2") == 1);
    assert(quizterm::parse("C1 + C2 + Cx").variables("C").size() == 3);
    std::cout << "[PASS] test_identifiers\n";
}

void test_parse_errors() {
    const char* unexpected[] = {"", "sin(", "*x", "2+"};
    for (const char* source : unexpected) {
        bool caught = false;
        try {
            quizterm::parse(source);
        } catch (const quizterm::UnexpectedTokenError&) {
            caught = true;
        }
        assert(caught && "Expected UnexpectedTokenError");
    }

    const char* unterminated[] = {"(x+1", "|x", "sin(x"};
    for (const char* source : unterminated) {
        bool caught = false;
        try {
            quizterm::parse(source);
        } catch (const quizterm::UnterminatedGroupError&) {
            caught = true;
        }
        assert(caught && "Expected UnterminatedGroupError");
    }

    bool caught = false;
    try {
        quizterm::parse("x)");
    } catch (const quizterm::UnexpectedTrailingInputError& e) {
        caught = true;
        assert(std::string(e.what()).find("ParseError") == 0);
    }
    assert(caught && "Expected UnexpectedTrailingInputError");
    std::cout << "[PASS] test_parse_errors\n";
}

int main() {
    std::cout << "=== Parser Tests ===\n";

    test_grammar_cases();
    test_display_string();
    test_display_string_reparses();
    test_display_overflowed_literal();
    test_explicit_parentheses();
    test_whitespace_changes_structure();
    test_identifiers();
    test_parse_errors();

    std::cout << "\n[SUCCESS] All parser tests passed\n";
    return 0;
}
