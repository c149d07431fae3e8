#include "quizterm/numeric.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <string>

namespace quizterm {

void CompareOptions::validate() const {
    if (trials <= 0) {
        throw NumericError("Number of trials must be positive");
    }
    if (domain_min >= domain_max) {
        throw NumericError("Invalid domain: min must be less than max");
    }
    if (epsilon < 0.0) {
        throw NumericError("Epsilon must not be negative");
    }
}

Complex random_complex(std::mt19937& rng, const CompareOptions& options) {
    std::uniform_real_distribution<double> dist(options.domain_min, options.domain_max);
    const double re = dist(rng);
    const double im = dist(rng);
    return Complex(re, im);
}

ProbeResult probe_equal(const Term& u, const Term& v, const Bindings& fixed, std::mt19937& rng,
                        const CompareOptions& options) {
    options.validate();

    std::set<std::string> names = u.variables();
    const std::set<std::string> v_names = v.variables();
    names.insert(v_names.begin(), v_names.end());

    double max_error = 0.0;
    for (int trial = 0; trial < options.trials; ++trial) {
        Bindings point;
        for (const auto& name : names) {
            auto it = fixed.find(name);
            point[name] = it != fixed.end() ? it->second : random_complex(rng, options);
        }

        const Complex diff = u.eval(point) - v.eval(point);
        const double error = std::abs(diff);
        if (!(error <= options.epsilon)) {
            const double reported = std::isnan(error) ? std::numeric_limits<double>::infinity() : error;
            return ProbeResult{false, trial + 1, std::max(max_error, reported)};
        }
        max_error = std::max(max_error, error);
    }

    return ProbeResult{true, options.trials, max_error};
}

bool compare(const Term& u, const Term& v, const Bindings& fixed, std::mt19937& rng,
             const CompareOptions& options) {
    return probe_equal(u, v, fixed, rng, options).equal;
}

bool compare(const Term& u, const Term& v, const Bindings& fixed) {
    std::random_device device;
    std::mt19937 rng(device());
    return compare(u, v, fixed, rng);
}

}
