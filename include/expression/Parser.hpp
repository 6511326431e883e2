/**
 * @file Parser.hpp
 * @brief Recursive-descent parser building the expression AST from a token stream.
 *
 * Grammar (lowest to highest precedence):
 * @code
 *   Expression -> Term { ("+" | "-") Term }
 *   Term       -> Unary { ("*" | "/") Unary }
 *   Unary      -> ("+" | "-") Unary | Power
 *   Power      -> Primary [ "**" Unary ]            (right-associative)
 *   Primary    -> Number | "x" | "pi" | "e"
 *               | Function "(" Expression ")" | "(" Expression ")"
 *   Function   -> "sin" | "cos" | "tan" | "exp" | "log" | "sqrt"
 * @endcode
 * As in conventional mathematical notation `-x**2` is `-(x**2)` and `2**-1` is `0.5`.
 * Symbols outside this grammar are rejected at parse time.
 */
#ifndef NUMINT_PARSER_HPP
#define NUMINT_PARSER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "ExpressionNodes.hpp"
#include "Tokenizer.hpp"

namespace expression {

class Parser {
public:
    /// Deepest nesting of unary operators, powers, calls and parentheses accepted.
    static constexpr std::size_t kMaxDepth = 128;

    explicit Parser(std::vector<Token> tokens);

    /**
     * @brief Parses the whole token stream into a single expression tree.
     * @throws errors::ExpressionError SyntaxError for malformed input,
     *         UnknownSymbol for an identifier outside the supported set.
     */
    NodePtr parse();

private:
    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    std::size_t depth_ = 0;

    const Token& peek() const;
    const Token& previous() const;
    bool check(TokenType type) const;
    bool match(TokenType type);
    bool isAtEnd() const;
    void expect(TokenType type, const std::string& what);

    NodePtr parseExpression();
    NodePtr parseTerm();
    NodePtr parseUnary();
    NodePtr parsePower();
    NodePtr parsePrimary();
    NodePtr parseIdentifier(const Token& identifier);

    friend class DepthGuard;
};

} // namespace expression

#endif // NUMINT_PARSER_HPP
