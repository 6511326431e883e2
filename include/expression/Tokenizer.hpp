/**
 * @file Tokenizer.hpp
 * @brief Lexical analysis of user supplied expression text.
 *
 * The tokenizer splits the text into numbers, identifiers, operators and parentheses.
 * Anything else is rejected with an ExpressionError of kind SyntaxError; nothing is
 * skipped silently apart from whitespace.
 */
#ifndef NUMINT_TOKENIZER_HPP
#define NUMINT_TOKENIZER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace expression {

/**
 * @enum TokenType
 * @brief Kinds of lexical tokens.
 */
enum class TokenType
{
    Number,     ///< Decimal or scientific literal, e.g. 2, .5, 1e-3
    Identifier, ///< Variable, constant or function name
    Plus,       ///< +
    Minus,      ///< -
    Star,       ///< *
    Slash,      ///< /
    Power,      ///< **
    LParen,     ///< (
    RParen,     ///< )
    End         ///< End of input sentinel
};

struct Token
{
    TokenType type;
    double numericValue;  ///< Only meaningful for Number tokens
    std::string text;
    std::size_t position; ///< Offset of the first character in the source text
};

/**
 * @brief Converts expression text into a token stream terminated by TokenType::End.
 */
class Tokenizer {
public:
    /// Longest expression text accepted, in characters.
    static constexpr std::size_t kMaxLength = 1024;

    explicit Tokenizer(std::string sourceText);

    /**
     * @brief Tokenizes the whole source text.
     * @throws errors::ExpressionError (SyntaxError) on an unrecognised character,
     *         a malformed or out of range number, or text longer than kMaxLength.
     */
    std::vector<Token> tokenize();

private:
    std::string source_;
    std::size_t index_ = 0;

    bool isAtEnd() const;
    char peek(std::size_t offset = 0) const;
    void skipWhitespace();
    Token makeNumber();
    Token makeIdentifier();
};

} // namespace expression

#endif // NUMINT_TOKENIZER_HPP
