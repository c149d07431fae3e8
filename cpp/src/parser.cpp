#include "quizterm/term.h"
#include "quizterm/lexer.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

namespace quizterm {

namespace {

// Recursive descent over the permissive grammar
//
//   expr  = add
//   add   = mul { ("+"|"-") mul }
//   mul   = pow { ("*"|"/"|implicit) pow }
//   pow   = unary { "^" unary }
//   unary = "-" mul | infix
//   infix = NUM | fn mul | fn "(" expr ")" | "(" expr ")" | "|" expr "|" | ID
//
// stop_at_space is set while parsing an unparenthesized function argument:
// then "sin 2pi" is sin(2*pi), but "sin 2 pi" is sin(2)*pi.
class Parser {
public:
    explicit Parser(const std::string& source) : lexer_(source) {
        lexer_.next();
    }

    Node parse() {
        Node root = parse_expr(false);
        if (!lexer_.at_end()) {
            throw UnexpectedTrailingInputError(lexer_.token(), lexer_.position());
        }
        return root;
    }

private:
    Node parse_expr(bool stop_at_space) {
        return parse_add(stop_at_space);
    }

    Node parse_add(bool stop_at_space) {
        Node node = parse_mul(stop_at_space);
        while (lexer_.token() == "+" || lexer_.token() == "-") {
            if (stop_at_space && lexer_.skipped_whitespace()) {
                break;
            }
            const Operator op = lexer_.token() == "+" ? Operator::Add : Operator::Sub;
            lexer_.next();
            node = Node::apply(op, std::move(node), parse_mul(stop_at_space));
        }
        return node;
    }

    Node parse_mul(bool stop_at_space) {
        Node node = parse_pow(stop_at_space);
        while (true) {
            if (stop_at_space && lexer_.skipped_whitespace()) {
                break;
            }
            const std::string& token = lexer_.token();
            Operator op = Operator::Mul;
            if (token == "*" || token == "/") {
                op = token == "*" ? Operator::Mul : Operator::Div;
                lexer_.next();
            } else if (!stop_at_space && token == "(") {
                // x(x+1) -> x*(x+1)
            } else if (!token.empty() && (is_alpha(token[0]) || is_numeral(token[0]))) {
                // x2 -> x*2, xy -> x*y
            } else {
                break;
            }
            node = Node::apply(op, std::move(node), parse_pow(stop_at_space));
        }
        return node;
    }

    Node parse_pow(bool stop_at_space) {
        Node node = parse_unary(stop_at_space);
        while (lexer_.token() == "^") {
            if (stop_at_space && lexer_.skipped_whitespace()) {
                break;
            }
            lexer_.next();
            node = Node::apply(Operator::Pow, std::move(node), parse_unary(stop_at_space));
        }
        return node;
    }

    Node parse_unary(bool stop_at_space) {
        if (lexer_.token() == "-") {
            lexer_.next();
            return Node::apply(Operator::Neg, parse_mul(stop_at_space));
        }
        return parse_infix();
    }

    Node parse_infix() {
        const std::string token = lexer_.token();
        if (token.empty()) {
            throw UnexpectedTokenError(token, lexer_.position());
        }
        if (is_numeral(token[0])) {
            return parse_number();
        }
        Operator function = Operator::Abs;
        const std::size_t function_length = match_function(token, function);
        if (function_length > 0) {
            lexer_.next(function_length);
            // the lexer splits "log2" into "log" "2"
            if (function == Operator::Log && !lexer_.skipped_whitespace() &&
                (lexer_.token() == "2" || lexer_.token() == "10")) {
                function = lexer_.token() == "2" ? Operator::Log2 : Operator::Log10;
                lexer_.next();
            }
            Node argument;
            if (lexer_.token() == "(") {
                lexer_.next();
                argument = parse_expr(false);
                expect(')');
            } else {
                argument = parse_mul(true);
            }
            return Node::apply(function, std::move(argument));
        }
        if (token == "(") {
            lexer_.next();
            Node node = parse_expr(false);
            expect(')');
            node.explicit_parentheses = true;
            return node;
        }
        if (token == "|") {
            lexer_.next();
            Node argument = parse_expr(false);
            expect('|');
            return Node::apply(Operator::Abs, std::move(argument));
        }
        if (is_alpha(token[0])) {
            return parse_identifier(token);
        }
        throw UnexpectedTokenError(token, lexer_.position());
    }

    Node parse_number() {
        std::string literal = lexer_.token();
        lexer_.next();
        if (lexer_.token() == ".") {
            literal += ".";
            lexer_.next();
            if (!lexer_.at_end() && is_numeral(lexer_.token()[0])) {
                literal += lexer_.token();
                lexer_.next();
            }
        }
        return Node::constant(std::strtod(literal.c_str(), nullptr));
    }

    Node parse_identifier(const std::string& token) {
        static const char* const kMultiLetter[] = {"pi", "true", "false", "C1", "C2"};
        std::string id;
        for (const char* candidate : kMultiLetter) {
            if (token.compare(0, std::strlen(candidate), candidate) == 0) {
                id = candidate;
                break;
            }
        }
        if (id.empty()) {
            id = token.substr(0, 1);
        }
        const std::size_t consumed = id.size();
        if (id == "I") {
            id = "i";
        }
        lexer_.next(consumed);
        return Node::variable(id);
    }

    // Longest function name that prefixes the token, case-insensitive.
    static std::size_t match_function(const std::string& token, Operator& function) {
        std::string lower = token;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        std::size_t best = 0;
        for (const auto& entry : function_names()) {
            const std::string& name = entry.first;
            if (name.size() > best && lower.compare(0, name.size(), name) == 0) {
                best = name.size();
                function = entry.second;
            }
        }
        return best;
    }

    void expect(char closing) {
        if (lexer_.token() != std::string(1, closing)) {
            throw UnterminatedGroupError(closing, lexer_.position());
        }
        lexer_.next();
    }

    Lexer lexer_;
};

}

Term Term::parse(const std::string& source) {
    Parser parser(source);
    return Term(parser.parse());
}

Term parse(const std::string& source) {
    return Term::parse(source);
}

}
