#include "quizterm/ode.h"

#include <map>
#include <set>
#include <utility>

namespace quizterm {

namespace {

// Names the parser can never produce, since '_' always lexes as its own token.
const char* const kScaleName = "_K";

std::string constant_name(std::size_t i) {
    return "C" + std::to_string(i);
}

std::string staging_name(std::size_t i) {
    return "_C" + std::to_string(i);
}

std::string swap_name(std::size_t i) {
    return "__C" + std::to_string(i);
}

bool is_constant_variable(const Node& node) {
    return node.is_variable() && is_integration_constant(node.name);
}

Node collapse(Node node) {
    for (Node& operand : node.operands) {
        operand = collapse(std::move(operand));
    }
    if (!node.is_apply()) {
        return node;
    }
    if (node.operands.size() == 1) {
        if (is_constant_variable(node.operands[0])) {
            Node constant = std::move(node.operands[0]);
            return constant;
        }
        return node;
    }
    const Node& lhs = node.operands[0];
    const Node& rhs = node.operands[1];
    const bool lhs_constant = is_constant_variable(lhs);
    const bool rhs_constant = is_constant_variable(rhs);
    if ((lhs_constant && rhs.is_const()) ||
        (lhs_constant && rhs_constant && lhs.name == rhs.name)) {
        Node constant = std::move(node.operands[0]);
        return constant;
    }
    if (rhs_constant && lhs.is_const()) {
        Node constant = std::move(node.operands[1]);
        return constant;
    }
    return node;
}

bool heap_permute(std::vector<std::size_t>& list, std::size_t k,
                  const std::function<bool(const std::vector<std::size_t>&)>& visit) {
    if (k == 1) {
        return visit(list);
    }
    for (std::size_t i = 0; i < k; ++i) {
        if (!heap_permute(list, k - 1, visit)) {
            return false;
        }
        const std::size_t j = k % 2 == 0 ? i : 0;
        std::swap(list[j], list[k - 1]);
    }
    return true;
}

// Renames C_i to C_permutation[i] in v, then fits one scale factor per
// constant while all other constants are pinned to zero.
bool matches_under_permutation(const Term& u, const Term& v,
                               const std::vector<std::size_t>& permutation,
                               const std::vector<std::string>& ordinary, std::mt19937& rng,
                               const ScalarMinimizer& minimizer, const CompareOptions& options) {
    const std::size_t n = permutation.size();
    Term pv = v.clone();
    for (std::size_t i = 0; i < n; ++i) {
        pv = rename_variable(std::move(pv), constant_name(i), swap_name(permutation[i]));
    }
    for (std::size_t i = 0; i < n; ++i) {
        pv = rename_variable(std::move(pv), swap_name(i), constant_name(i));
    }

    for (std::size_t k = 0; k < n; ++k) {
        const std::string ck = constant_name(k);
        std::map<std::string, Node> scaled;
        scaled[ck] = Node::apply(Operator::Mul, Node::variable(ck), Node::variable(kScaleName));
        pv = substitute(std::move(pv), scaled);

        Bindings zeroed;
        for (std::size_t j = 0; j < n; ++j) {
            if (j != k) {
                zeroed[constant_name(j)] = Complex(0.0, 0.0);
            }
        }

        Bindings point = zeroed;
        point[ck] = random_complex(rng, options);
        for (const auto& name : ordinary) {
            point[name] = random_complex(rng, options);
        }

        const Term distance(
            Node::apply(Operator::Abs, Node::apply(Operator::Sub, u.root(), pv.root())));
        const MinimizeResult best = minimizer.minimize([&](double scale) {
            point[kScaleName] = Complex(scale, 0.0);
            return distance.eval(point).real();
        });

        std::map<std::string, Node> fixed_scale;
        fixed_scale[kScaleName] = Node::constant(best.argument);
        pv = substitute(std::move(pv), fixed_scale);

        if (!compare(u, pv, zeroed, rng, options)) {
            return false;
        }
    }

    return compare(u, pv, Bindings(), rng, options);
}

}

StepHalvingMinimizer::StepHalvingMinimizer(int max_iterations, double tolerance,
                                           double initial_step)
    : max_iterations_(max_iterations), tolerance_(tolerance), initial_step_(initial_step) {}

MinimizeResult StepHalvingMinimizer::minimize(const std::function<double(double)>& f) const {
    double x = 0.0;
    double step = initial_step_;
    int last_direction = 2;
    int iterations = 0;
    while (iterations < max_iterations_) {
        double y = f(x);
        const double y_right = f(x + step);
        const double y_left = f(x - step);
        int direction = 0;
        if (y_right < y) {
            y = y_right;
            direction = 1;
        }
        if (y_left < y) {
            y = y_left;
            direction = -1;
        }
        x += direction * step;
        if (y < tolerance_) {
            break;
        }
        if (direction == 0 || direction != last_direction) {
            step /= 2.0;
        }
        last_direction = direction;
        ++iterations;
    }
    return MinimizeResult{x, f(x), iterations};
}

bool is_integration_constant(const std::string& name) {
    return !name.empty() && name[0] == 'C';
}

Term collapse_constants(Term term) {
    return Term(collapse(std::move(term).release()));
}

bool for_each_permutation(std::size_t n,
                          const std::function<bool(const std::vector<std::size_t>&)>& visit) {
    if (n == 0) {
        return true;
    }
    std::vector<std::size_t> list(n);
    for (std::size_t i = 0; i < n; ++i) {
        list[i] = i;
    }
    return heap_permute(list, n, visit);
}

std::vector<std::vector<std::size_t>> permutations(std::size_t n) {
    std::vector<std::vector<std::size_t>> result;
    for_each_permutation(n, [&result](const std::vector<std::size_t>& permutation) {
        result.push_back(permutation);
        return true;
    });
    return result;
}

bool compare_ode(const Term& u, const Term& v, std::mt19937& rng,
                 const ScalarMinimizer& minimizer, const OdeOptions& options) {
    if (compare(u, v, Bindings(), rng, options.compare)) {
        return true;
    }

    Term tu = collapse_constants(u.clone());
    Term tv = collapse_constants(v.clone());

    std::set<std::string> names = tu.variables();
    const std::set<std::string> v_names = tv.variables();
    names.insert(v_names.begin(), v_names.end());

    std::vector<std::string> constants;
    std::vector<std::string> ordinary;
    for (const auto& name : names) {
        if (is_integration_constant(name)) {
            constants.push_back(name);
        } else {
            ordinary.push_back(name);
        }
    }

    const std::size_t n = constants.size();
    if (n > options.max_constants) {
        return false;
    }

    // two passes, so that e.g. C1 -> C0 cannot clash with an existing C0
    for (std::size_t i = 0; i < n; ++i) {
        tu = rename_variable(std::move(tu), constants[i], staging_name(i));
        tv = rename_variable(std::move(tv), constants[i], staging_name(i));
    }
    for (std::size_t i = 0; i < n; ++i) {
        tu = rename_variable(std::move(tu), staging_name(i), constant_name(i));
        tv = rename_variable(std::move(tv), staging_name(i), constant_name(i));
    }

    bool equal = false;
    std::size_t tried = 0;
    for_each_permutation(n, [&](const std::vector<std::size_t>& permutation) {
        if (tried++ >= options.max_permutations) {
            return false;
        }
        if (matches_under_permutation(tu, tv, permutation, ordinary, rng, minimizer,
                                      options.compare)) {
            equal = true;
            return false;
        }
        return true;
    });
    return equal;
}

bool compare_ode(const Term& u, const Term& v) {
    std::random_device device;
    std::mt19937 rng(device());
    const StepHalvingMinimizer minimizer;
    return compare_ode(u, v, rng, minimizer);
}

}
