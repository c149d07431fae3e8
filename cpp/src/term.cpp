#include "quizterm/term.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace quizterm {

namespace {

// Shortest decimal form that reads back to the same double. Never uses an
// exponent, since "1e-05" would lex as 1*e-05. An overflowed literal is
// written as a numeral run that overflows again on reparse.
std::string format_number(double value) {
    if (std::isinf(value)) {
        return std::string(value < 0 ? "-1" : "1") + std::string(309, '0');
    }
    char buffer[64];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    std::string text(buffer);
    if (text.find_first_of("eE") == std::string::npos) {
        return text;
    }
    const int exponent = static_cast<int>(std::floor(std::log10(std::fabs(value))));
    const int first = exponent < 0 ? -exponent : 0;
    for (int decimals = first; decimals <= first + 20; ++decimals) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed);
        oss.precision(decimals);
        oss << value;
        text = oss.str();
        if (std::strtod(text.c_str(), nullptr) == value) {
            break;
        }
    }
    if (text.find('.') != std::string::npos) {
        text.erase(text.find_last_not_of('0') + 1);
        if (text.back() == '.') {
            text.pop_back();
        }
    }
    return text;
}

std::string display_constant(const Complex& value) {
    const double re = value.real();
    const double im = value.imag();
    const bool has_re = re != 0.0;
    const bool has_im = im != 0.0;
    if (has_re && has_im) {
        if (im >= 0) {
            return "(" + format_number(re) + "+" + format_number(im) + "i)";
        }
        return "(" + format_number(re) + "-" + format_number(-im) + "i)";
    }
    if (has_re) {
        return re > 0 ? format_number(re) : "(" + format_number(re) + ")";
    }
    if (has_im) {
        return "(" + format_number(im) + "i)";
    }
    return "0";
}

std::string display(const Node& node) {
    switch (node.kind) {
        case Node::Kind::Const:
            return display_constant(node.value);
        case Node::Kind::Variable:
            return node.name;
        case Node::Kind::Apply:
            break;
    }
    if (node.operands.size() == 1) {
        return std::string(operator_name(node.op)) + "(" + display(node.operands[0]) + ")";
    }
    return "(" + display(node.operands[0]) + operator_name(node.op) + display(node.operands[1]) +
           ")";
}

std::string tex_constant(const Complex& value) {
    const double eps = 1e-9;
    const bool has_re = std::fabs(value.real()) > eps;
    const bool has_im = std::fabs(value.imag()) > eps;
    if (!has_re && !has_im) {
        return "0";
    }
    std::string re = has_re ? format_number(value.real()) : "";
    std::string im = has_im ? format_number(value.imag()) + "i" : "";
    if (im == "1i") {
        im = "i";
    } else if (im == "-1i") {
        im = "-i";
    }
    if (has_re && has_im && value.imag() >= 0) {
        im = "+" + im;
    }
    return re + im;
}

const char* tex_function(Operator op) {
    switch (op) {
        case Operator::Sin: return "\\sin";
        case Operator::Cos: return "\\cos";
        case Operator::Tan: return "\\tan";
        case Operator::Cot: return "\\cot";
        case Operator::Sinc: return "\\operatorname{sinc}";
        case Operator::Exp: return "\\exp";
        case Operator::Ln: return "\\ln";
        case Operator::Log: return "\\log";
        case Operator::Log2: return "\\log_2";
        case Operator::Log10: return "\\log_{10}";
        case Operator::Sinh: return "\\sinh";
        case Operator::Cosh: return "\\cosh";
        case Operator::Tanh: return "\\tanh";
        case Operator::Asin: return "\\arcsin";
        case Operator::Acos: return "\\arccos";
        case Operator::Atan: return "\\arctan";
        case Operator::Asinh: return "\\operatorname{arsinh}";
        case Operator::Acosh: return "\\operatorname{arcosh}";
        case Operator::Atanh: return "\\operatorname{artanh}";
        case Operator::Round: return "\\operatorname{round}";
        default: return "";
    }
}

std::string tex(const Node& node, bool suppress_parentheses) {
    std::string s;
    switch (node.kind) {
        case Node::Kind::Const:
            s = tex_constant(node.value);
            break;
        case Node::Kind::Variable:
            s = " " + (node.name == "pi" ? std::string("\\pi") : node.name) + " ";
            break;
        case Node::Kind::Apply: {
            const Node& u = node.operands[0];
            switch (node.op) {
                case Operator::Neg:
                    s = "-" + tex(u, false);
                    break;
                case Operator::Add:
                case Operator::Sub:
                case Operator::Pow:
                    s = "{" + tex(u, false) + "}" + operator_name(node.op) + "{" +
                        tex(node.operands[1], false) + "}";
                    break;
                case Operator::Mul:
                    s = "{" + tex(u, false) + "}\\cdot {" + tex(node.operands[1], false) + "}";
                    break;
                case Operator::Div:
                    s = "\\frac{" + tex(u, true) + "}{" + tex(node.operands[1], true) + "}";
                    break;
                case Operator::Sqrt:
                    s = "\\sqrt{" + tex(u, true) + "}";
                    break;
                case Operator::Abs:
                    s = "\\left|" + tex(u, true) + "\\right|";
                    break;
                case Operator::Floor:
                    s = "\\left\\lfloor " + tex(u, true) + "\\right\\rfloor ";
                    break;
                case Operator::Ceil:
                    s = "\\left\\lceil " + tex(u, true) + "\\right\\rceil ";
                    break;
                default:
                    s = std::string(tex_function(node.op)) + "\\left(" + tex(u, true) + "\\right)";
                    break;
            }
            break;
        }
    }
    if (!suppress_parentheses && node.explicit_parentheses) {
        s = "\\left({" + s + "}\\right)";
    }
    return s;
}

void collect_variables(const Node& node, const std::string& prefix, std::set<std::string>& out) {
    if (node.is_variable() && !is_reserved_name(node.name) &&
        node.name.compare(0, prefix.size(), prefix) == 0) {
        out.insert(node.name);
    }
    for (const Node& operand : node.operands) {
        collect_variables(operand, prefix, out);
    }
}

Node rename_node(Node node, const std::string& from, const std::string& to) {
    if (node.is_variable() && node.name == from) {
        node.name = to;
    }
    for (Node& operand : node.operands) {
        operand = rename_node(std::move(operand), from, to);
    }
    return node;
}

Node substitute_node(Node node, const std::map<std::string, Node>& replacements) {
    if (node.is_variable()) {
        auto it = replacements.find(node.name);
        if (it != replacements.end()) {
            return it->second;
        }
        return node;
    }
    for (Node& operand : node.operands) {
        operand = substitute_node(std::move(operand), replacements);
    }
    return node;
}

}

bool is_reserved_name(const std::string& name) {
    return name == "pi" || name == "e" || name == "i" || name == "true" || name == "false";
}

Term::Term() : root_(Node::constant(0.0)) {}

Term::Term(Node root) : root_(std::move(root)) {}

std::set<std::string> Term::variables(const std::string& prefix) const {
    std::set<std::string> names;
    collect_variables(root_, prefix, names);
    return names;
}

std::string Term::to_display_string() const {
    return display(root_);
}

std::string Term::to_tex_string() const {
    return tex(root_, false);
}

Term rename_variable(Term term, const std::string& from, const std::string& to) {
    return Term(rename_node(std::move(term).release(), from, to));
}

Term substitute(Term term, const std::map<std::string, Node>& replacements) {
    return Term(substitute_node(std::move(term).release(), replacements));
}

bool structurally_equal(const Term& a, const Term& b) {
    return structurally_equal(a.root(), b.root());
}

}
