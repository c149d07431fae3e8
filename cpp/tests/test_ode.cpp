#include "quizterm/ode.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <random>
#include <set>
#include <vector>

using namespace quizterm;

namespace {

bool ode_equal(const char* lhs, const char* rhs, std::mt19937& rng,
               const OdeOptions& options = OdeOptions()) {
    const StepHalvingMinimizer minimizer;
    return compare_ode(parse(lhs), parse(rhs), rng, minimizer, options);
}

}

void test_collapse_constants() {
    const Term collapsed = collapse_constants(parse("sin(exp(cos(C+3))) + 3*C1 + sin(C1+C2)"));
    assert(structurally_equal(collapsed, parse("C+C1+sin(C1+C2)")));
    assert(structurally_equal(collapse_constants(parse("C1*C1 + 2/C2")), parse("C1+C2")));
    assert(structurally_equal(collapse_constants(parse("C1*x")), parse("C1*x")));
    std::cout << "[PASS] test_collapse_constants\n";
}

void test_collapsed_term_matches() {
    std::mt19937 rng(42);
    const Term collapsed = collapse_constants(parse("sin(exp(cos(C+3))) + 3*C1 + sin(C1+C2)"));
    const StepHalvingMinimizer minimizer;
    assert(compare_ode(collapsed, parse("C+C1+sin(C1+C2)"), rng, minimizer));
    std::cout << "[PASS] test_collapsed_term_matches\n";
}

void test_plain_equivalence() {
    std::mt19937 rng(42);
    assert(ode_equal("(C*exp(2*x)-2)*exp(3*x)", "C*exp(5*x)-2*exp(3*x)", rng));
    std::cout << "[PASS] test_plain_equivalence\n";
}

void test_rescaled_constant() {
    // C must be replaced by C/6 on one side
    std::mt19937 rng(42);
    assert(ode_equal("sqrt(C-12*x^3)/3", "sqrt(2/3)*sqrt(C-2*x^3)", rng));
    std::cout << "[PASS] test_rescaled_constant\n";
}

void test_two_constants() {
    std::mt19937 rng(42);
    assert(ode_equal("C1 * exp(2x) + C2 * exp(-4x)", "2*C1 * exp(2x) + exp(C2) * exp(-4x)", rng));
    std::cout << "[PASS] test_two_constants\n";
}

void test_swapped_constants() {
    std::mt19937 rng(42);
    assert(ode_equal("C1 * exp(2x) + C2 * exp(-4x)", "C2 * exp(2x) + C1 * exp(-4x)", rng));
    std::cout << "[PASS] test_swapped_constants\n";
}

void test_renamed_constant() {
    std::mt19937 rng(42);
    assert(ode_equal("C*exp(2x)", "exp(2x)*C1", rng));
    std::cout << "[PASS] test_renamed_constant\n";
}

void test_not_equivalent() {
    std::mt19937 rng(42);
    assert(!ode_equal("C*exp(x)", "C*exp(2x)", rng));
    assert(!ode_equal("C1*exp(x) + C2", "C1*exp(-x) + C2", rng));
    assert(!ode_equal("x", "x+1", rng));
    std::cout << "[PASS] test_not_equivalent\n";
}

void test_constant_limit() {
    std::mt19937 rng(42);
    OdeOptions options;
    options.max_constants = 1;
    assert(!ode_equal("C1 * exp(2x) + C2 * exp(-4x)", "2*C1 * exp(2x) + exp(C2) * exp(-4x)", rng,
                      options));
    std::cout << "[PASS] test_constant_limit\n";
}

void test_permutation_limit() {
    // the swapped pair only matches under the second permutation tried
    const char* lhs = "C1 * exp(2x) + C2 * exp(-4x)";
    const char* rhs = "C2 * exp(2x) + C1 * exp(-4x)";
    OdeOptions options;
    options.max_permutations = 1;
    std::mt19937 rng(42);
    assert(!ode_equal(lhs, rhs, rng, options));
    options.max_permutations = 2;
    rng.seed(42);
    assert(ode_equal(lhs, rhs, rng, options));
    std::cout << "[PASS] test_permutation_limit\n";
}

void test_permutations() {
    assert(permutations(0).empty());
    assert(permutations(1).size() == 1);
    const auto three = permutations(3);
    assert(three.size() == 6);
    const std::set<std::vector<std::size_t>> distinct(three.begin(), three.end());
    assert(distinct.size() == 6);
    const std::vector<std::size_t> identity = {0, 1, 2};
    assert(three.front() == identity);

    int visited = 0;
    const bool completed = for_each_permutation(4, [&visited](const std::vector<std::size_t>&) {
        return ++visited < 5;
    });
    assert(!completed);
    assert(visited == 5);
    std::cout << "[PASS] test_permutations\n";
}

void test_step_halving_minimizer() {
    const StepHalvingMinimizer minimizer;
    const MinimizeResult quadratic = minimizer.minimize([](double k) { return (k - 0.3) * (k - 0.3); });
    assert(std::fabs(quadratic.argument - 0.3) < 1e-4);
    assert(quadratic.value < 1e-10);

    const MinimizeResult linear = minimizer.minimize([](double k) { return std::fabs(k + 1.0 / 6.0); });
    assert(std::fabs(linear.argument + 1.0 / 6.0) < 1e-9);

    const StepHalvingMinimizer limited(3);
    assert(limited.minimize([](double k) { return std::fabs(k - 100.0); }).iterations == 3);
    std::cout << "[PASS] test_step_halving_minimizer\n";
}

int main() {
    std::cout << "=== ODE Comparison Tests ===\n";

    test_collapse_constants();
    test_collapsed_term_matches();
    test_plain_equivalence();
    test_rescaled_constant();
    test_two_constants();
    test_swapped_constants();
    test_renamed_constant();
    test_not_equivalent();
    test_constant_limit();
    test_permutation_limit();
    test_permutations();
    test_step_halving_minimizer();

    std::cout << "\n[SUCCESS] All ODE comparison tests passed\n";
    return 0;
}
