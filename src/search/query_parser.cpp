#include <codenexus/search/query_parser.h>

#include <algorithm>

namespace codenexus::search {

namespace {

std::string trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

Result<std::unique_ptr<QueryNode>> QueryParser::parse(const std::string& query) {
    tokens_ = tokenizer_.tokenize(query);
    currentToken_ = 0;
    depth_ = 0;
    operators_ = 0;

    if (isAtEnd()) {
        return Error{ErrorCode::InvalidQuerySyntax, "Empty query string"};
    }

    try {
        for (const auto& token : tokens_) {
            if (token.type == TokenType::UnterminatedQuote) {
                throw QueryParserException("Unterminated quote at position " +
                                               std::to_string(token.position),
                                           token.position);
            }
        }

        // No operators, groups or quotes: the whole text is one tag
        const bool plain = std::none_of(tokens_.begin(), tokens_.end(), [](const Token& t) {
            return t.isOperator() || t.quoted || t.type == TokenType::LeftParen ||
                   t.type == TokenType::RightParen;
        });
        if (plain) {
            return makeLiteral(trimmed(query));
        }

        auto ast = parseOrExpression();

        // Ensure we've consumed all tokens
        if (!isAtEnd()) {
            if (check(TokenType::RightParen)) {
                throwError("Unmatched ')'");
            }
            throwError("Expected AND or OR before '" + current().value + "'");
        }

        return ast;
    } catch (const QueryParserException& e) {
        return Error{ErrorCode::InvalidQuerySyntax, e.what()};
    }
}

std::unique_ptr<QueryNode> QueryParser::parseOrExpression() {
    auto left = parseAndExpression();

    while (match(TokenType::Or)) {
        countOperator();
        auto right = parseAndExpression();
        left = std::make_unique<OrNode>(std::move(left), std::move(right));
    }

    return left;
}

std::unique_ptr<QueryNode> QueryParser::parseAndExpression() {
    auto left = parseNotExpression();

    while (match(TokenType::And)) {
        countOperator();
        auto right = parseNotExpression();
        left = std::make_unique<AndNode>(std::move(left), std::move(right));
    }

    return left;
}

std::unique_ptr<QueryNode> QueryParser::parseNotExpression() {
    if (match(TokenType::Not)) {
        enterNesting();
        auto child = parseNotExpression();
        --depth_;
        return std::make_unique<NotNode>(std::move(child));
    }
    return parsePrimary();
}

std::unique_ptr<QueryNode> QueryParser::parsePrimary() {
    if (match(TokenType::LeftParen)) {
        if (check(TokenType::RightParen)) {
            throwError("Empty parentheses");
        }
        enterNesting();
        auto expr = parseOrExpression();
        --depth_;
        if (!match(TokenType::RightParen)) {
            throwError("Expected ')' after grouped expression");
        }
        return std::make_unique<GroupNode>(std::move(expr));
    }

    if (check(TokenType::Term)) {
        const Token token = current();
        advance();
        if (token.quoted) {
            return std::make_unique<TermNode>(token.value);
        }
        return makeLiteral(token.value);
    }

    if (isAtEnd()) {
        throwError("Unexpected end of query, expected a tag or '('");
    }
    throwError("Expected a tag or '(' but found '" + current().value + "'");
}

std::unique_ptr<QueryNode> QueryParser::makeLiteral(const std::string& text) const {
    if (text.find('*') != std::string::npos) {
        return std::make_unique<WildcardNode>(text);
    }
    return std::make_unique<TermNode>(text);
}

void QueryParser::enterNesting() {
    if (++depth_ > kMaxNestingDepth) {
        throwError("Query nests deeper than " + std::to_string(kMaxNestingDepth) + " levels");
    }
}

void QueryParser::countOperator() {
    if (++operators_ > kMaxOperators) {
        throwError("Query has more than " + std::to_string(kMaxOperators) +
                   " AND/OR operators");
    }
}

const Token& QueryParser::current() const {
    if (currentToken_ >= tokens_.size()) {
        static Token endToken(TokenType::EndOfInput, "", 0, 0);
        return endToken;
    }
    return tokens_[currentToken_];
}

bool QueryParser::advance() {
    if (currentToken_ < tokens_.size()) {
        currentToken_++;
        return true;
    }
    return false;
}

bool QueryParser::check(TokenType type) const {
    return current().type == type;
}

bool QueryParser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

bool QueryParser::isAtEnd() const {
    return currentToken_ >= tokens_.size() || current().type == TokenType::EndOfInput;
}

void QueryParser::throwError(const std::string& message) {
    size_t position = current().position;
    throw QueryParserException(message + " at position " + std::to_string(position), position);
}

} // namespace codenexus::search
