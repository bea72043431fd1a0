#pragma once

#include <cstddef>
#include <string>
#include <vector>

enum class TokenType {
    Identifier,
    String,
    Number,
    LParen, RParen, LBracket, RBracket, Comma, Dot, Star,
    Not, And, Or,
    Eq, Ne, Lt, Le, Gt, Ge,
    End,
    Error
};

struct Token {
    TokenType type;
    std::string text;    // Identifier name, unquoted string, number text or error message
    size_t offset;
};

// Tokenizer for the body of a ${{ }} expression. Never throws: malformed input
// yields a single Error token at the offending offset.
class ExprLexer {
public:
    explicit ExprLexer(const std::string& input);

    Token next();

    // All tokens up to and including End (or the first Error)
    std::vector<Token> tokenize();

private:
    void skip_whitespace();
    Token lex_string();
    Token lex_number();
    Token lex_identifier();

    const std::string& input_;
    size_t pos_ = 0;
};

const char* to_string(TokenType type);
