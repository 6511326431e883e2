#include "expression/Parser.hpp"

#include "errors/IntegrationErrors.hpp"

namespace expression {

namespace {

[[noreturn]] void syntaxError(const std::string& message, std::size_t position) {
    throw errors::ExpressionError(errors::ExpressionErrorKind::SyntaxError,
                                  message + " at position " + std::to_string(position), position);
}

std::string describe(const Token& token) {
    return token.type == TokenType::End ? std::string("end of expression")
                                        : "'" + token.text + "'";
}

} // namespace

// Bounds recursion for every rule that can nest.
class DepthGuard {
public:
    explicit DepthGuard(Parser& parser) : parser_(parser) {
        if (++parser_.depth_ > Parser::kMaxDepth) {
            syntaxError("expression is nested too deeply", parser_.peek().position);
        }
    }
    ~DepthGuard() { --parser_.depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    Parser& parser_;
};

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::End) {
        const std::size_t position = tokens_.empty() ? 0 : tokens_.back().position;
        tokens_.push_back({TokenType::End, 0.0, "", position});
    }
}

NodePtr Parser::parse() {
    if (isAtEnd()) {
        syntaxError("expression is empty", peek().position);
    }
    auto root = parseExpression();
    if (!isAtEnd()) {
        syntaxError("unexpected " + describe(peek()), peek().position);
    }
    return root;
}

const Token& Parser::peek() const {
    return tokens_[current_];
}

const Token& Parser::previous() const {
    return tokens_[current_ - 1];
}

bool Parser::check(TokenType type) const {
    return peek().type == type;
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && check(type)) {
        ++current_;
        return true;
    }
    return false;
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

void Parser::expect(TokenType type, const std::string& what) {
    if (!match(type)) {
        syntaxError("expected " + what + " but found " + describe(peek()), peek().position);
    }
}

// Expression -> Term { ("+" | "-") Term }
NodePtr Parser::parseExpression() {
    auto node = parseTerm();
    while (true) {
        if (match(TokenType::Plus)) {
            node = std::make_unique<BinaryNode>(BinaryOperator::Add, std::move(node), parseTerm());
        } else if (match(TokenType::Minus)) {
            node = std::make_unique<BinaryNode>(BinaryOperator::Subtract, std::move(node), parseTerm());
        } else {
            return node;
        }
    }
}

// Term -> Unary { ("*" | "/") Unary }
NodePtr Parser::parseTerm() {
    auto node = parseUnary();
    while (true) {
        if (match(TokenType::Star)) {
            node = std::make_unique<BinaryNode>(BinaryOperator::Multiply, std::move(node), parseUnary());
        } else if (match(TokenType::Slash)) {
            node = std::make_unique<BinaryNode>(BinaryOperator::Divide, std::move(node), parseUnary());
        } else {
            return node;
        }
    }
}

// Unary -> ("+" | "-") Unary | Power
NodePtr Parser::parseUnary() {
    DepthGuard guard(*this);
    if (match(TokenType::Plus)) {
        return parseUnary();
    }
    if (match(TokenType::Minus)) {
        return std::make_unique<UnaryMinusNode>(parseUnary());
    }
    return parsePower();
}

// Power -> Primary [ "**" Unary ]
NodePtr Parser::parsePower() {
    auto base = parsePrimary();
    if (match(TokenType::Power)) {
        return std::make_unique<BinaryNode>(BinaryOperator::Power, std::move(base), parseUnary());
    }
    return base;
}

NodePtr Parser::parsePrimary() {
    if (match(TokenType::Number)) {
        return std::make_unique<NumberNode>(previous().numericValue);
    }

    if (match(TokenType::Identifier)) {
        return parseIdentifier(previous());
    }

    if (match(TokenType::LParen)) {
        DepthGuard guard(*this);
        auto node = parseExpression();
        expect(TokenType::RParen, "')'");
        return node;
    }

    syntaxError("unexpected " + describe(peek()), peek().position);
}

NodePtr Parser::parseIdentifier(const Token& identifier) {
    const std::string name = identifier.text;
    const std::size_t position = identifier.position;

    if (auto function = lookup_function(name)) {
        if (!check(TokenType::LParen)) {
            syntaxError("function '" + name + "' must be called with one argument", position);
        }
        ++current_;
        DepthGuard guard(*this);
        auto argument = parseExpression();
        expect(TokenType::RParen, "')' closing the argument of '" + name + "'");
        return std::make_unique<CallNode>(*function, std::move(argument));
    }

    NodePtr leaf;
    if (name == "x") {
        leaf = std::make_unique<VariableNode>();
    } else if (auto constant = lookup_constant(name)) {
        leaf = std::make_unique<ConstantNode>(*constant);
    } else {
        throw errors::ExpressionError(errors::ExpressionErrorKind::UnknownSymbol,
                                      "unknown symbol '" + name + "' at position " + std::to_string(position),
                                      position);
    }

    if (check(TokenType::LParen)) {
        syntaxError("'" + name + "' is not a function", position);
    }
    return leaf;
}

} // namespace expression
