#pragma once

#include <random>

#include "errors.hpp"
#include "term.h"

namespace quizterm {

struct CompareOptions {
    int trials = 10;
    double epsilon = 1e-9;
    // real and imaginary parts are both drawn from [domain_min, domain_max)
    double domain_min = 0.0;
    double domain_max = 1.0;

    void validate() const;
};

struct ProbeResult {
    bool equal;
    int trials_executed;
    double max_error;
};

Complex random_complex(std::mt19937& rng, const CompareOptions& options = CompareOptions());

// Randomized identity test. Every free variable of u and v that is not in
// `fixed` is bound to an independent random complex value per trial; the
// probe stops at the first trial where |u - v| exceeds epsilon (or is NaN).
ProbeResult probe_equal(const Term& u, const Term& v, const Bindings& fixed, std::mt19937& rng,
                        const CompareOptions& options = CompareOptions());

bool compare(const Term& u, const Term& v, const Bindings& fixed, std::mt19937& rng,
             const CompareOptions& options = CompareOptions());

// Seeds a local engine from std::random_device.
bool compare(const Term& u, const Term& v, const Bindings& fixed = Bindings());

}
