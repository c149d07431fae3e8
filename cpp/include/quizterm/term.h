#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>

#include "errors.hpp"
#include "node.h"

namespace quizterm {

using Bindings = std::map<std::string, Complex>;

// pi, e, i, true and false are resolved by the evaluator, never bound.
bool is_reserved_name(const std::string& name);

class Term {
public:
    Term();
    explicit Term(Node root);

    // Parses permissive math input, e.g. "2x", "sin 2pi", "|x-1|", "C1 exp(2x)".
    // Throws a ParseError subclass on malformed input.
    static Term parse(const std::string& source);

    // Evaluates over the complex numbers. Every free variable must be bound;
    // throws UnknownVariableError otherwise. Numeric singularities are not
    // errors and show up as NaN/Inf components.
    Complex eval(const Bindings& bindings = Bindings()) const;

    Term clone() const { return Term(root_); }

    const Node& root() const { return root_; }
    Node release() && { return std::move(root_); }

    std::set<std::string> variables(const std::string& prefix = "") const;

    // Fully parenthesized form that parses back to an equivalent term.
    std::string to_display_string() const;

    // TeX markup. Parentheses appear only where the input had them.
    std::string to_tex_string() const;

private:
    Node root_;
};

Term parse(const std::string& source);

Term rename_variable(Term term, const std::string& from, const std::string& to);
Term substitute(Term term, const std::map<std::string, Node>& replacements);

bool structurally_equal(const Term& a, const Term& b);

}
