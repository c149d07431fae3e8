#include "quizterm/node.h"

namespace quizterm {

std::size_t operator_arity(Operator op) {
    switch (op) {
        case Operator::Add:
        case Operator::Sub:
        case Operator::Mul:
        case Operator::Div:
        case Operator::Pow:
            return 2;
        case Operator::Neg:
        case Operator::Abs:
        case Operator::Sin:
        case Operator::Cos:
        case Operator::Tan:
        case Operator::Cot:
        case Operator::Sinc:
        case Operator::Exp:
        case Operator::Ln:
        case Operator::Log:
        case Operator::Log2:
        case Operator::Log10:
        case Operator::Sqrt:
        case Operator::Sinh:
        case Operator::Cosh:
        case Operator::Tanh:
        case Operator::Asin:
        case Operator::Acos:
        case Operator::Atan:
        case Operator::Asinh:
        case Operator::Acosh:
        case Operator::Atanh:
        case Operator::Floor:
        case Operator::Ceil:
        case Operator::Round:
            return 1;
    }
    throw TermError("operator without arity");
}

const char* operator_name(Operator op) {
    switch (op) {
        case Operator::Add: return "+";
        case Operator::Sub: return "-";
        case Operator::Mul: return "*";
        case Operator::Div: return "/";
        case Operator::Pow: return "^";
        case Operator::Neg: return "-";
        case Operator::Abs: return "abs";
        case Operator::Sin: return "sin";
        case Operator::Cos: return "cos";
        case Operator::Tan: return "tan";
        case Operator::Cot: return "cot";
        case Operator::Sinc: return "sinc";
        case Operator::Exp: return "exp";
        case Operator::Ln: return "ln";
        case Operator::Log: return "log";
        case Operator::Log2: return "log2";
        case Operator::Log10: return "log10";
        case Operator::Sqrt: return "sqrt";
        case Operator::Sinh: return "sinh";
        case Operator::Cosh: return "cosh";
        case Operator::Tanh: return "tanh";
        case Operator::Asin: return "asin";
        case Operator::Acos: return "acos";
        case Operator::Atan: return "atan";
        case Operator::Asinh: return "asinh";
        case Operator::Acosh: return "acosh";
        case Operator::Atanh: return "atanh";
        case Operator::Floor: return "floor";
        case Operator::Ceil: return "ceil";
        case Operator::Round: return "round";
    }
    return "?";
}

const std::vector<std::pair<std::string, Operator>>& function_names() {
    static const std::vector<std::pair<std::string, Operator>> names = {
        {"abs", Operator::Abs},     {"acos", Operator::Acos},   {"acosh", Operator::Acosh},
        {"asin", Operator::Asin},   {"asinh", Operator::Asinh}, {"atan", Operator::Atan},
        {"atanh", Operator::Atanh}, {"ceil", Operator::Ceil},   {"cos", Operator::Cos},
        {"cosh", Operator::Cosh},   {"cot", Operator::Cot},     {"exp", Operator::Exp},
        {"floor", Operator::Floor}, {"ln", Operator::Ln},       {"log", Operator::Log},
        {"log10", Operator::Log10}, {"log2", Operator::Log2},   {"round", Operator::Round},
        {"sin", Operator::Sin},     {"sinc", Operator::Sinc},   {"sinh", Operator::Sinh},
        {"sqrt", Operator::Sqrt},   {"tan", Operator::Tan},     {"tanh", Operator::Tanh},
    };
    return names;
}

Node Node::constant(double re, double im) {
    return constant(Complex(re, im));
}

Node Node::constant(const Complex& value) {
    Node node;
    node.kind = Kind::Const;
    node.value = value;
    return node;
}

Node Node::variable(const std::string& name) {
    Node node;
    node.kind = Kind::Variable;
    node.name = name;
    return node;
}

Node Node::apply(Operator op, std::vector<Node> operands) {
    if (operands.size() != operator_arity(op)) {
        throw TermError(std::string("operator '") + operator_name(op) + "' expects " +
                        std::to_string(operator_arity(op)) + " operand(s), got " +
                        std::to_string(operands.size()));
    }
    Node node;
    node.kind = Kind::Apply;
    node.op = op;
    node.operands = std::move(operands);
    return node;
}

Node Node::apply(Operator op, Node operand) {
    std::vector<Node> operands;
    operands.push_back(std::move(operand));
    return apply(op, std::move(operands));
}

Node Node::apply(Operator op, Node lhs, Node rhs) {
    std::vector<Node> operands;
    operands.reserve(2);
    operands.push_back(std::move(lhs));
    operands.push_back(std::move(rhs));
    return apply(op, std::move(operands));
}

bool structurally_equal(const Node& a, const Node& b) {
    if (a.kind != b.kind) {
        return false;
    }
    switch (a.kind) {
        case Node::Kind::Const:
            return a.value == b.value;
        case Node::Kind::Variable:
            return a.name == b.name;
        case Node::Kind::Apply:
            if (a.op != b.op || a.operands.size() != b.operands.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.operands.size(); ++i) {
                if (!structurally_equal(a.operands[i], b.operands[i])) {
                    return false;
                }
            }
            return true;
    }
    return false;
}

}
