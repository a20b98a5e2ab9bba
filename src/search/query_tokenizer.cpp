#include <cctype>
#include <codenexus/search/query_tokenizer.h>

namespace codenexus::search {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::vector<Token> QueryTokenizer::tokenize(const std::string& query) {
    query_ = query;
    position_ = 0;
    openGroups_ = 0;
    std::vector<Token> tokens;

    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd())
            break;

        size_t startPos = position_;
        char c = peek();

        if (c == '(') {
            advance();
            ++openGroups_;
            tokens.emplace_back(TokenType::LeftParen, "(", startPos, 1);
        } else if (c == ')' && openGroups_ > 0) {
            advance();
            --openGroups_;
            tokens.emplace_back(TokenType::RightParen, ")", startPos, 1);
        } else if (c == '"') {
            tokens.push_back(readQuoted());
        } else {
            Token token = readTerm();

            // Keywords are case-sensitive
            if (token.value == "AND") {
                tokens.emplace_back(TokenType::And, token.value, token.position, token.length);
            } else if (token.value == "OR") {
                tokens.emplace_back(TokenType::Or, token.value, token.position, token.length);
            } else if (token.value == "NOT") {
                tokens.emplace_back(TokenType::Not, token.value, token.position, token.length);
            } else {
                tokens.push_back(std::move(token));
            }
        }
    }

    tokens.emplace_back(TokenType::EndOfInput, "", query_.length(), 0);
    return tokens;
}

char QueryTokenizer::peek() const {
    if (isAtEnd())
        return '\0';
    return query_[position_];
}

char QueryTokenizer::advance() {
    if (isAtEnd())
        return '\0';
    return query_[position_++];
}

bool QueryTokenizer::isAtEnd() const {
    return position_ >= query_.length();
}

void QueryTokenizer::skipWhitespace() {
    while (!isAtEnd() && isSpace(peek())) {
        advance();
    }
}

Token QueryTokenizer::readTerm() {
    size_t startPos = position_;
    std::string value;
    size_t innerParens = 0;

    while (!isAtEnd() && !isSpace(peek())) {
        const char c = peek();
        if (c == '(') {
            ++innerParens;
        } else if (c == ')') {
            if (innerParens > 0) {
                --innerParens;
            } else if (openGroups_ > 0) {
                break;
            }
        }
        value += advance();
    }

    return Token(TokenType::Term, value, startPos, value.length());
}

Token QueryTokenizer::readQuoted() {
    size_t startPos = position_;
    advance(); // opening quote
    std::string value;

    while (!isAtEnd() && peek() != '"') {
        value += advance();
    }
    if (isAtEnd()) {
        return Token(TokenType::UnterminatedQuote, value, startPos, position_ - startPos);
    }
    advance(); // closing quote
    return Token(TokenType::Term, value, startPos, position_ - startPos, true);
}

} // namespace codenexus::search
