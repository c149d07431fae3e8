#pragma once

#include <cstddef>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "errors.hpp"
#include "numeric.h"
#include "term.h"

namespace quizterm {

struct MinimizeResult {
    double argument;
    double value;
    int iterations;
};

// One-dimensional minimizer over the reals, used to find the factor that
// relates two integration constants.
class ScalarMinimizer {
public:
    virtual ~ScalarMinimizer() = default;
    virtual MinimizeResult minimize(const std::function<double(double)>& f) const = 0;
};

// Derivative-free line search: starting at 0, move to the best of
// f(k - step), f(k), f(k + step) and halve the step whenever the direction
// changes or the search stalls. Finds a local minimum only.
class StepHalvingMinimizer : public ScalarMinimizer {
public:
    explicit StepHalvingMinimizer(int max_iterations = 1000, double tolerance = 1e-11,
                                  double initial_step = 1.0);

    MinimizeResult minimize(const std::function<double(double)>& f) const override;

private:
    int max_iterations_;
    double tolerance_;
    double initial_step_;
};

struct OdeOptions {
    CompareOptions compare;
    std::size_t max_constants = 6;
    std::size_t max_permutations = 720;
};

// Variables named C, C1, C2, ... stand for undetermined constants.
bool is_integration_constant(const std::string& name);

// Replaces every operation that only decorates a single integration constant
// by that constant, bottom-up: op(C, 3) -> C, op(3, C) -> C, op(C, C) -> C,
// f(C) -> C. E.g. sin(exp(cos(C+3))) becomes C.
Term collapse_constants(Term term);

// Heap's algorithm over {0, ..., n-1}. The visitor returns false to stop.
// Returns false if the enumeration was stopped early.
bool for_each_permutation(std::size_t n,
                          const std::function<bool(const std::vector<std::size_t>&)>& visit);

std::vector<std::vector<std::size_t>> permutations(std::size_t n);

// Equivalence up to renaming, permuting and individually rescaling the
// integration constants, e.g. sqrt(C-12*x^3)/3 and sqrt(2/3)*sqrt(C-2*x^3).
//
// Cost is N! permutations times N line searches for N distinct constants;
// N is 1 to 3 for first and second order equations, and OdeOptions caps both
// N and the number of permutations tried.
bool compare_ode(const Term& u, const Term& v, std::mt19937& rng,
                 const ScalarMinimizer& minimizer, const OdeOptions& options = OdeOptions());

bool compare_ode(const Term& u, const Term& v);

}
