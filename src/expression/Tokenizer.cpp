#include "expression/Tokenizer.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "errors/IntegrationErrors.hpp"

namespace expression {

namespace {

bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool isIdentifierStart(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool isIdentifierPart(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

[[noreturn]] void syntaxError(const std::string& message, std::size_t position) {
    throw errors::ExpressionError(errors::ExpressionErrorKind::SyntaxError,
                                  message + " at position " + std::to_string(position), position);
}

} // namespace

Tokenizer::Tokenizer(std::string sourceText) : source_(std::move(sourceText)) {}

std::vector<Token> Tokenizer::tokenize() {
    if (source_.size() > kMaxLength) {
        syntaxError("expression is longer than " + std::to_string(kMaxLength) + " characters",
                    kMaxLength);
    }

    std::vector<Token> tokens;
    while (true) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        const std::size_t start = index_;
        const char ch = peek();
        switch (ch) {
        case '+':
            tokens.push_back({TokenType::Plus, 0.0, "+", start});
            ++index_;
            break;
        case '-':
            tokens.push_back({TokenType::Minus, 0.0, "-", start});
            ++index_;
            break;
        case '*':
            if (peek(1) == '*') {
                tokens.push_back({TokenType::Power, 0.0, "**", start});
                index_ += 2;
            } else {
                tokens.push_back({TokenType::Star, 0.0, "*", start});
                ++index_;
            }
            break;
        case '/':
            tokens.push_back({TokenType::Slash, 0.0, "/", start});
            ++index_;
            break;
        case '(':
            tokens.push_back({TokenType::LParen, 0.0, "(", start});
            ++index_;
            break;
        case ')':
            tokens.push_back({TokenType::RParen, 0.0, ")", start});
            ++index_;
            break;
        default:
            if (isDigit(ch) || (ch == '.' && isDigit(peek(1)))) {
                tokens.push_back(makeNumber());
            } else if (isIdentifierStart(ch)) {
                tokens.push_back(makeIdentifier());
            } else {
                syntaxError(std::string("unexpected character '") + ch + "'", start);
            }
            break;
        }
    }

    tokens.push_back({TokenType::End, 0.0, "", source_.size()});
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index_ >= source_.size();
}

char Tokenizer::peek(std::size_t offset) const {
    return index_ + offset < source_.size() ? source_[index_ + offset] : '\0';
}

void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        ++index_;
    }
}

// digits [. digits] [(e|E) [+|-] digits], or . digits [exponent]
Token Tokenizer::makeNumber() {
    const std::size_t start = index_;
    while (isDigit(peek())) {
        ++index_;
    }
    if (peek() == '.') {
        ++index_;
        while (isDigit(peek())) {
            ++index_;
        }
    }
    // The exponent is only consumed when digits follow, so "2e" stays Number + Identifier.
    if (peek() == 'e' || peek() == 'E') {
        std::size_t offset = 1;
        if (peek(offset) == '+' || peek(offset) == '-') {
            ++offset;
        }
        if (isDigit(peek(offset))) {
            index_ += offset;
            while (isDigit(peek())) {
                ++index_;
            }
        }
    }
    if (peek() == '.') {
        syntaxError("malformed number", start);
    }

    std::string text = source_.substr(start, index_ - start);
    // Underflow to a subnormal or zero is accepted; only overflow is an error.
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        syntaxError("malformed number '" + text + "'", start);
    }
    if (errno == ERANGE && std::isinf(value)) {
        syntaxError("number '" + text + "' is out of range", start);
    }
    return {TokenType::Number, value, std::move(text), start};
}

Token Tokenizer::makeIdentifier() {
    const std::size_t start = index_;
    while (!isAtEnd() && isIdentifierPart(peek())) {
        ++index_;
    }
    return {TokenType::Identifier, 0.0, source_.substr(start, index_ - start), start};
}

} // namespace expression
