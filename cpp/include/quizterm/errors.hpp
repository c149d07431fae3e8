#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace quizterm {

class QuizTermError : public std::runtime_error {
public:
    explicit QuizTermError(const std::string& msg) : std::runtime_error(msg) {}
};

class ParseError : public QuizTermError {
public:
    ParseError(const std::string& msg, std::size_t position)
        : QuizTermError("ParseError: " + msg + " at position " + std::to_string(position)),
          position_(position) {}

    std::size_t position() const { return position_; }

private:
    std::size_t position_;
};

class UnexpectedTokenError : public ParseError {
public:
    UnexpectedTokenError(const std::string& token, std::size_t position)
        : ParseError(token.empty() ? "unexpected end of input"
                                   : "unexpected token '" + token + "'",
                     position) {}
};

class UnexpectedTrailingInputError : public ParseError {
public:
    UnexpectedTrailingInputError(const std::string& token, std::size_t position)
        : ParseError("remaining input '" + token + "'", position) {}
};

class UnterminatedGroupError : public ParseError {
public:
    UnterminatedGroupError(char expected, std::size_t position)
        : ParseError(std::string("expected '") + expected + "'", position) {}
};

class EvalError : public QuizTermError {
public:
    explicit EvalError(const std::string& msg) : QuizTermError("EvalError: " + msg) {}
};

class UnknownVariableError : public EvalError {
public:
    explicit UnknownVariableError(const std::string& name)
        : EvalError("unknown variable '" + name + "'"), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class UnimplementedOperatorError : public EvalError {
public:
    explicit UnimplementedOperatorError(const std::string& name)
        : EvalError("unimplemented operator '" + name + "'") {}
};

class TermError : public QuizTermError {
public:
    explicit TermError(const std::string& msg) : QuizTermError("TermError: " + msg) {}
};

class NumericError : public QuizTermError {
public:
    explicit NumericError(const std::string& msg) : QuizTermError("NumericError: " + msg) {}
};

class SymbolicError : public QuizTermError {
public:
    explicit SymbolicError(const std::string& msg) : QuizTermError("SymbolicError: " + msg) {}
};

class MatrixError : public QuizTermError {
public:
    explicit MatrixError(const std::string& msg) : QuizTermError("MatrixError: " + msg) {}
};

}
