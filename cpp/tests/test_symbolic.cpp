#include "quizterm/symbolic.h"
#include <cassert>
#include <iostream>
#include <string>

namespace {

bool near(const quizterm::Complex& a, const quizterm::Complex& b) {
    return std::abs(a - b) < 1e-9;
}

}

void test_export_string() {
    assert(quizterm::to_symengine_string(quizterm::parse("x+x")) == "2*x");
    assert(quizterm::to_symengine_string(quizterm::parse("x*x")) == "x**2");
    assert(!quizterm::to_symengine_string(quizterm::parse("sinc(x) + round(y)")).empty());
    std::cout << "[PASS] test_export_string\n";
}

void test_reference_eval_agrees() {
    const quizterm::Bindings point = {{"x", quizterm::Complex(0.3, 0.2)},
                                      {"y", quizterm::Complex(0.7, -0.1)}};
    const char* sources[] = {"sin(x)*exp(y)", "x^y + ln(x)", "sqrt(x) - cosh(y)",
                             "atan(x) + 2pi", "log10(x) - log2(y)"};
    for (const char* source : sources) {
        const quizterm::Term term = quizterm::parse(source);
        assert(near(term.eval(point), quizterm::reference_eval(term, point)));
    }
    std::cout << "[PASS] test_reference_eval_agrees\n";
}

void test_reference_eval_unbound() {
    bool caught = false;
    try {
        quizterm::reference_eval(quizterm::parse("x + y"), {{"x", quizterm::Complex(1.0, 0.0)}});
    } catch (const quizterm::UnknownVariableError& e) {
        caught = true;
        assert(e.name() == "y");
    }
    assert(caught && "Expected UnknownVariableError");
    std::cout << "[PASS] test_reference_eval_unbound\n";
}

int main() {
    std::cout << "=== SymEngine Bridge Tests ===\n";

    test_export_string();
    test_reference_eval_agrees();
    test_reference_eval_unbound();

    std::cout << "\n[SUCCESS] All SymEngine bridge tests passed\n";
    return 0;
}
