#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <codenexus/core/types.h>
#include <codenexus/search/query_ast.h>
#include <codenexus/search/query_tokenizer.h>

namespace codenexus::search {

/**
 * @brief Recursive-descent parser for tag queries
 *
 * Grammar, loosest binding first:
 *   or      := and ("OR" and)*
 *   and     := not ("AND" not)*
 *   not     := "NOT" not | primary
 *   primary := "(" or ")" | term
 *
 * Operators must be explicit; two adjacent terms are a syntax error once the query
 * uses an operator or a group. A query with neither is one literal tag, so
 * "owner:john doe" is looked up as written.
 *
 * Nesting (groups and NOT) is capped at kMaxNestingDepth and AND/OR at
 * kMaxOperators, which bounds the depth of the returned tree.
 */
class QueryParser {
public:
    static constexpr size_t kMaxNestingDepth = 256;
    static constexpr size_t kMaxOperators = 1024;

    /**
     * @brief Parse a query string into an AST
     * @return The AST, or InvalidQuerySyntax naming the offending position
     */
    Result<std::unique_ptr<QueryNode>> parse(const std::string& query);

private:
    QueryTokenizer tokenizer_;
    std::vector<Token> tokens_;
    size_t currentToken_ = 0;
    size_t depth_ = 0;
    size_t operators_ = 0;

    std::unique_ptr<QueryNode> parseOrExpression();
    std::unique_ptr<QueryNode> parseAndExpression();
    std::unique_ptr<QueryNode> parseNotExpression();
    std::unique_ptr<QueryNode> parsePrimary();
    std::unique_ptr<QueryNode> makeLiteral(const std::string& text) const;

    void enterNesting();
    void countOperator();

    const Token& current() const;
    bool advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    bool isAtEnd() const;

    [[noreturn]] void throwError(const std::string& message);
};

/**
 * @brief Query parser exception, converted to a Result by parse()
 */
class QueryParserException : public std::runtime_error {
public:
    QueryParserException(const std::string& message, size_t position)
        : std::runtime_error(message), position_(position) {}

    size_t getPosition() const { return position_; }

private:
    size_t position_;
};

} // namespace codenexus::search
