#pragma once

#include <complex>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace quizterm {

using Complex = std::complex<double>;

enum class Operator {
    Add,
    Sub,
    Mul,
    Div,
    Pow,
    Neg,
    Abs,
    Sin,
    Cos,
    Tan,
    Cot,
    Sinc,
    Exp,
    Ln,
    Log,
    Log2,
    Log10,
    Sqrt,
    Sinh,
    Cosh,
    Tanh,
    Asin,
    Acos,
    Atan,
    Asinh,
    Acosh,
    Atanh,
    Floor,
    Ceil,
    Round
};

// Number of operands an Apply node of this operator holds (1 or 2).
std::size_t operator_arity(Operator op);

// Textual name: the symbol for arithmetic, the function id otherwise.
const char* operator_name(Operator op);

// Named functions that may prefix a token, e.g. "sin" in "sin2x".
const std::vector<std::pair<std::string, Operator>>& function_names();

struct Node {
    enum class Kind { Const, Variable, Apply };

    Kind kind = Kind::Const;
    Complex value;
    std::string name;
    Operator op = Operator::Add;
    std::vector<Node> operands;
    bool explicit_parentheses = false;

    static Node constant(double re, double im = 0.0);
    static Node constant(const Complex& value);
    static Node variable(const std::string& name);
    static Node apply(Operator op, std::vector<Node> operands);
    static Node apply(Operator op, Node operand);
    static Node apply(Operator op, Node lhs, Node rhs);

    bool is_const() const { return kind == Kind::Const; }
    bool is_variable() const { return kind == Kind::Variable; }
    bool is_apply() const { return kind == Kind::Apply; }
};

// Structural identity, ignoring explicit_parentheses.
bool structurally_equal(const Node& a, const Node& b);

}
