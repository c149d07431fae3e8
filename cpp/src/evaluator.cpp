#include "quizterm/term.h"

#include <cmath>
#include <utility>

namespace quizterm {

namespace {

const double kEpsilon = 1e-9;
const double kPi = 3.14159265358979323846;
const double kEuler = 2.71828182845904523536;

Node c(double re, double im = 0.0) {
    return Node::constant(re, im);
}

Node c(const Complex& value) {
    return Node::constant(value);
}

Node f(Operator op, Node u) {
    return Node::apply(op, std::move(u));
}

Node f(Operator op, Node u, Node v) {
    return Node::apply(op, std::move(u), std::move(v));
}

// JavaScript-style rounding, halves go towards +inf.
double round_half_up(double x) {
    return std::floor(x + 0.5);
}

Complex evaluate(const Node& node, const Bindings& bindings);

// v is only meaningful for the binary operators.
Complex apply_operator(Operator op, const Complex& u, const Complex& v, const Bindings& bindings) {
    const double re = u.real();
    const double im = u.imag();
    const double vr = v.real();
    const double vi = v.imag();
    switch (op) {
        case Operator::Add:
            return Complex(re + vr, im + vi);
        case Operator::Sub:
            return Complex(re - vr, im - vi);
        case Operator::Mul:
            return Complex(re * vr - im * vi, re * vi + im * vr);
        case Operator::Div: {
            // a zero denominator yields NaN/Inf, which every comparison rejects
            const double d = vr * vr + vi * vi;
            return Complex((re * vr + im * vi) / d, (im * vr - re * vi) / d);
        }
        case Operator::Pow:
            // u^v = exp(v * ln(u))
            return evaluate(f(Operator::Exp, f(Operator::Mul, c(v), f(Operator::Ln, c(u)))),
                            bindings);
        case Operator::Neg:
            return Complex(-re, -im);
        case Operator::Abs:
            return Complex(std::sqrt(re * re + im * im), 0.0);
        case Operator::Sin:
            return Complex(std::sin(re) * std::cosh(im), std::cos(re) * std::sinh(im));
        case Operator::Cos:
            return Complex(std::cos(re) * std::cosh(im), -std::sin(re) * std::sinh(im));
        case Operator::Tan: {
            const double d = std::cos(re) * std::cos(re) + std::sinh(im) * std::sinh(im);
            return Complex(std::sin(re) * std::cos(re) / d, std::sinh(im) * std::cosh(im) / d);
        }
        case Operator::Cot: {
            const double d = std::sin(re) * std::sin(re) + std::sinh(im) * std::sinh(im);
            return Complex(std::sin(re) * std::cos(re) / d, -std::sinh(im) * std::cosh(im) / d);
        }
        case Operator::Sinc:
            return evaluate(f(Operator::Div, f(Operator::Sin, c(u)), c(u)), bindings);
        case Operator::Exp:
            return Complex(std::exp(re) * std::cos(im), std::exp(re) * std::sin(im));
        case Operator::Ln:
        case Operator::Log: {
            // ln(u) = ln|u| + i arg(u); tiny imaginary parts count as zero so
            // that ln(-1) never lands on the "-0" side of the branch cut
            const double arg_im = std::fabs(im) < kEpsilon ? 0.0 : im;
            return Complex(std::log(std::sqrt(re * re + im * im)), std::atan2(arg_im, re));
        }
        case Operator::Log2:
            return evaluate(f(Operator::Div, f(Operator::Ln, c(u)), f(Operator::Ln, c(2.0))),
                            bindings);
        case Operator::Log10:
            return evaluate(f(Operator::Div, f(Operator::Ln, c(u)), f(Operator::Ln, c(10.0))),
                            bindings);
        case Operator::Sqrt:
            return evaluate(f(Operator::Pow, c(u), c(0.5)), bindings);
        case Operator::Sinh:
            // 0.5 * (exp(u) - exp(-u))
            return evaluate(f(Operator::Mul, c(0.5),
                              f(Operator::Sub, f(Operator::Exp, c(u)),
                                f(Operator::Exp, f(Operator::Neg, c(u))))),
                            bindings);
        case Operator::Cosh:
            // 0.5 * (exp(u) + exp(-u))
            return evaluate(f(Operator::Mul, c(0.5),
                              f(Operator::Add, f(Operator::Exp, c(u)),
                                f(Operator::Exp, f(Operator::Neg, c(u))))),
                            bindings);
        case Operator::Tanh:
            // (exp(u) - exp(-u)) / (exp(u) + exp(-u))
            return evaluate(f(Operator::Div,
                              f(Operator::Sub, f(Operator::Exp, c(u)),
                                f(Operator::Exp, f(Operator::Neg, c(u)))),
                              f(Operator::Add, f(Operator::Exp, c(u)),
                                f(Operator::Exp, f(Operator::Neg, c(u))))),
                            bindings);
        case Operator::Asin:
            // -i * ln(i*u + sqrt(1 - u^2))
            return evaluate(
                f(Operator::Mul, c(0.0, -1.0),
                  f(Operator::Ln,
                    f(Operator::Add, f(Operator::Mul, c(0.0, 1.0), c(u)),
                      f(Operator::Sqrt, f(Operator::Sub, c(1.0), f(Operator::Mul, c(u), c(u))))))),
                bindings);
        case Operator::Acos:
            // -i * ln(u + i * sqrt(1 - u^2))
            return evaluate(
                f(Operator::Mul, c(0.0, -1.0),
                  f(Operator::Ln,
                    f(Operator::Add, c(u),
                      f(Operator::Mul, c(0.0, 1.0),
                        f(Operator::Sqrt,
                          f(Operator::Sub, c(1.0), f(Operator::Mul, c(u), c(u)))))))),
                bindings);
        case Operator::Atan:
            // i/2 * ln((1 - i*u) / (1 + i*u))
            return evaluate(
                f(Operator::Mul, c(0.0, 0.5),
                  f(Operator::Ln,
                    f(Operator::Div,
                      f(Operator::Sub, c(1.0), f(Operator::Mul, c(0.0, 1.0), c(u))),
                      f(Operator::Add, c(1.0), f(Operator::Mul, c(0.0, 1.0), c(u)))))),
                bindings);
        case Operator::Asinh:
            // ln(u + sqrt(u^2 + 1))
            return evaluate(
                f(Operator::Ln,
                  f(Operator::Add, c(u),
                    f(Operator::Sqrt, f(Operator::Add, f(Operator::Mul, c(u), c(u)), c(1.0))))),
                bindings);
        case Operator::Acosh:
            // ln(u + sqrt(u^2 - 1))
            return evaluate(
                f(Operator::Ln,
                  f(Operator::Add, c(u),
                    f(Operator::Sqrt, f(Operator::Sub, f(Operator::Mul, c(u), c(u)), c(1.0))))),
                bindings);
        case Operator::Atanh:
            // 0.5 * ln((1 + u) / (1 - u))
            return evaluate(f(Operator::Mul, c(0.5),
                              f(Operator::Ln, f(Operator::Div, f(Operator::Add, c(1.0), c(u)),
                                                f(Operator::Sub, c(1.0), c(u))))),
                            bindings);
        case Operator::Floor:
            return Complex(std::floor(re), std::floor(im));
        case Operator::Ceil:
            return Complex(std::ceil(re), std::ceil(im));
        case Operator::Round:
            return Complex(round_half_up(re), round_half_up(im));
    }
    throw UnimplementedOperatorError(operator_name(op));
}

Complex resolve(const std::string& name, const Bindings& bindings) {
    if (name == "pi") {
        return Complex(kPi, 0.0);
    }
    if (name == "e") {
        return Complex(kEuler, 0.0);
    }
    if (name == "i") {
        return Complex(0.0, 1.0);
    }
    if (name == "true") {
        return Complex(1.0, 0.0);
    }
    if (name == "false") {
        return Complex(0.0, 0.0);
    }
    auto it = bindings.find(name);
    if (it == bindings.end()) {
        throw UnknownVariableError(name);
    }
    return it->second;
}

Complex evaluate(const Node& node, const Bindings& bindings) {
    switch (node.kind) {
        case Node::Kind::Const:
            return node.value;
        case Node::Kind::Variable:
            return resolve(node.name, bindings);
        case Node::Kind::Apply:
            break;
    }
    if (node.operands.empty() || node.operands.size() > 2) {
        throw UnimplementedOperatorError(operator_name(node.op));
    }
    const Complex u = evaluate(node.operands[0], bindings);
    const Complex v = node.operands.size() == 2 ? evaluate(node.operands[1], bindings) : Complex();
    return apply_operator(node.op, u, v, bindings);
}

}

Complex Term::eval(const Bindings& bindings) const {
    return evaluate(root_, bindings);
}

}
