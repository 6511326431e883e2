#include "expression/CompiledExpression.hpp"

#include "expression/Parser.hpp"
#include "expression/Tokenizer.hpp"

namespace expression {

CompiledExpression::CompiledExpression(std::string source, NodePtr root)
    : source_(std::move(source)), root_(std::move(root)) {}

CompiledExpression CompiledExpression::compile(const std::string& text) {
    Tokenizer tokenizer(text);
    Parser parser(tokenizer.tokenize());
    return CompiledExpression(text, parser.parse());
}

double CompiledExpression::evaluate(double x) const {
    return root_->evaluate(x);
}

CompiledExpression::StoringVector CompiledExpression::evaluate(const StoringVector& xs) const {
    StoringVector ys(xs.size());
    for (Eigen::Index i = 0; i < xs.size(); ++i) {
        ys(i) = root_->evaluate(xs(i));
    }
    return ys;
}

} // namespace expression
