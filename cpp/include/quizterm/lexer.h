#pragma once

#include <cstddef>
#include <string>

namespace quizterm {

bool is_numeral(char ch);
bool is_alpha(char ch);

// Splits permissive math input into tokens. The lexer never fails: at the end
// of the input the current token is empty.
class Lexer {
public:
    explicit Lexer(std::string source);

    // Advances to the next token.
    void next();

    // Consumes only the first num_chars characters of the current token and
    // keeps the remainder as the current token, e.g. "sin" out of "sinpi".
    void next(std::size_t num_chars);

    const std::string& token() const { return token_; }
    bool skipped_whitespace() const { return skipped_whitespace_; }
    bool at_end() const { return token_.empty(); }
    std::size_t position() const { return pos_; }

private:
    std::string source_;
    std::size_t pos_;
    std::string token_;
    bool skipped_whitespace_;
};

}
