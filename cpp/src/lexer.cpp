#include "quizterm/lexer.h"

#include <cstring>
#include <utility>

namespace quizterm {

namespace {

const char* const kDelimiters = "^%#*$()[]{},.:;+-*/_!<>=?|";

bool is_whitespace(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

bool is_delimiter(char ch) {
    return ch != '\0' && std::strchr(kDelimiters, ch) != nullptr;
}

// "C", "C1", "C12", ... stay one token so that ODE constants survive.
bool is_constant_prefix(const std::string& token) {
    if (token.empty() || token[0] != 'C') {
        return false;
    }
    for (std::size_t i = 1; i < token.size(); ++i) {
        if (!is_numeral(token[i])) {
            return false;
        }
    }
    return true;
}

}

bool is_numeral(char ch) {
    return ch >= '0' && ch <= '9';
}

bool is_alpha(char ch) {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || ch == '_';
}

Lexer::Lexer(std::string source)
    : source_(std::move(source)), pos_(0), token_(), skipped_whitespace_(false) {}

void Lexer::next(std::size_t num_chars) {
    if (num_chars > 0 && token_.size() > num_chars) {
        token_ = token_.substr(num_chars);
        skipped_whitespace_ = false;
        return;
    }
    next();
}

void Lexer::next() {
    token_.clear();
    skipped_whitespace_ = false;
    const std::size_t n = source_.size();
    while (pos_ < n && is_whitespace(source_[pos_])) {
        skipped_whitespace_ = true;
        ++pos_;
    }
    while (pos_ < n) {
        const char ch = source_[pos_];
        if (is_whitespace(ch)) {
            return;
        }
        if (!token_.empty()) {
            const bool numeral_then_alpha = is_numeral(token_[0]) && is_alpha(ch);
            const bool alpha_then_numeral = is_alpha(token_[0]) && is_numeral(ch);
            if (numeral_then_alpha || (alpha_then_numeral && !is_constant_prefix(token_))) {
                return;
            }
        }
        if (is_delimiter(ch)) {
            if (!token_.empty()) {
                return;
            }
            token_ += ch;
            ++pos_;
            return;
        }
        token_ += ch;
        ++pos_;
    }
}

}
