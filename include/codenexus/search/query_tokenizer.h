#pragma once

#include <string>
#include <vector>

namespace codenexus::search {

/**
 * @brief Token types for tag query parsing
 */
enum class TokenType {
    Term,              // Tag literal, possibly containing '*'
    LeftParen,         // (
    RightParen,        // )
    And,               // AND
    Or,                // OR
    Not,               // NOT
    UnterminatedQuote, // '"' without its closing quote
    EndOfInput         // End of query string
};

/**
 * @brief Token structure
 */
struct Token {
    TokenType type;
    std::string value;
    size_t position; // Position in original query string
    size_t length;   // Length of token
    bool quoted = false;

    Token(TokenType t, const std::string& v, size_t pos, size_t len, bool q = false)
        : type(t), value(v), position(pos), length(len), quoted(q) {}

    bool isOperator() const {
        return type == TokenType::And || type == TokenType::Or || type == TokenType::Not;
    }

    bool isTerm() const { return type == TokenType::Term; }
};

/**
 * @brief Query tokenizer - breaks a tag query into tokens
 *
 * Operators are the upper-case words AND, OR and NOT; lower-case "and" is a term.
 * A term runs until whitespace, so "lang:c++" or "path:src/*" need no quoting.
 *
 * Parentheses are context sensitive. '(' opens a group only where a token starts;
 * inside a term it is part of the term. ')' is part of the term while it balances a
 * '(' of that term, closes a group when one is open, and is otherwise a plain
 * character. "fn:main()" and "(fn:main())" are both the tag fn:main().
 *
 * A term in double quotes is taken verbatim, spaces and parentheses included, and
 * is never a wildcard.
 */
class QueryTokenizer {
public:
    std::vector<Token> tokenize(const std::string& query);

private:
    std::string query_;
    size_t position_ = 0;
    size_t openGroups_ = 0;

    char peek() const;
    char advance();
    bool isAtEnd() const;
    void skipWhitespace();
    Token readTerm();
    Token readQuoted();
};

} // namespace codenexus::search
