#include "ExprLexer.hpp"
#include <cctype>

ExprLexer::ExprLexer(const std::string& input) : input_(input) {}

void ExprLexer::skip_whitespace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
        ++pos_;
    }
}

Token ExprLexer::next() {
    skip_whitespace();
    if (pos_ >= input_.size()) {
        return {TokenType::End, "", pos_};
    }

    const size_t start = pos_;
    const char c = input_[pos_];
    const char n = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';

    switch (c) {
        case '(': ++pos_; return {TokenType::LParen, "(", start};
        case ')': ++pos_; return {TokenType::RParen, ")", start};
        case '[': ++pos_; return {TokenType::LBracket, "[", start};
        case ']': ++pos_; return {TokenType::RBracket, "]", start};
        case ',': ++pos_; return {TokenType::Comma, ",", start};
        case '*': ++pos_; return {TokenType::Star, "*", start};
        case '\'': return lex_string();
        case '!':
            if (n == '=') { pos_ += 2; return {TokenType::Ne, "!=", start}; }
            ++pos_;
            return {TokenType::Not, "!", start};
        case '=':
            if (n == '=') { pos_ += 2; return {TokenType::Eq, "==", start}; }
            return {TokenType::Error, "unexpected '=' (did you mean '==')", start};
        case '<':
            if (n == '=') { pos_ += 2; return {TokenType::Le, "<=", start}; }
            ++pos_;
            return {TokenType::Lt, "<", start};
        case '>':
            if (n == '=') { pos_ += 2; return {TokenType::Ge, ">=", start}; }
            ++pos_;
            return {TokenType::Gt, ">", start};
        case '&':
            if (n == '&') { pos_ += 2; return {TokenType::And, "&&", start}; }
            return {TokenType::Error, "unexpected '&' (did you mean '&&')", start};
        case '|':
            if (n == '|') { pos_ += 2; return {TokenType::Or, "||", start}; }
            return {TokenType::Error, "unexpected '|' (did you mean '||')", start};
        default:
            break;
    }

    if (c == '.') {
        // ".5" is a number, otherwise a property dereference
        if (std::isdigit(static_cast<unsigned char>(n))) return lex_number();
        ++pos_;
        return {TokenType::Dot, ".", start};
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || ((c == '-' || c == '+') && (std::isdigit(static_cast<unsigned char>(n)) || n == '.'))) {
        return lex_number();
    }
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        return lex_identifier();
    }

    return {TokenType::Error, std::string("unexpected character '") + c + "'", start};
}

Token ExprLexer::lex_string() {
    const size_t start = pos_;
    ++pos_; // opening quote
    std::string value;
    while (pos_ < input_.size()) {
        char c = input_[pos_];
        if (c == '\'') {
            // '' is an escaped quote
            if (pos_ + 1 < input_.size() && input_[pos_ + 1] == '\'') {
                value.push_back('\'');
                pos_ += 2;
                continue;
            }
            ++pos_;
            return {TokenType::String, value, start};
        }
        value.push_back(c);
        ++pos_;
    }
    return {TokenType::Error, "unterminated string literal", start};
}

Token ExprLexer::lex_number() {
    const size_t start = pos_;
    if (input_[pos_] == '-' || input_[pos_] == '+') ++pos_;

    if (pos_ + 1 < input_.size() && input_[pos_] == '0' && (input_[pos_ + 1] == 'x' || input_[pos_ + 1] == 'X')) {
        pos_ += 2;
        const size_t digits = pos_;
        while (pos_ < input_.size() && std::isxdigit(static_cast<unsigned char>(input_[pos_]))) ++pos_;
        if (pos_ == digits) {
            return {TokenType::Error, "malformed hexadecimal number", start};
        }
        return {TokenType::Number, input_.substr(start, pos_ - start), start};
    }

    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    if (pos_ < input_.size() && input_[pos_] == '.') {
        ++pos_;
        while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    }
    if (pos_ < input_.size() && (input_[pos_] == 'e' || input_[pos_] == 'E')) {
        size_t exp = pos_ + 1;
        if (exp < input_.size() && (input_[exp] == '+' || input_[exp] == '-')) ++exp;
        if (exp < input_.size() && std::isdigit(static_cast<unsigned char>(input_[exp]))) {
            pos_ = exp;
            while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) ++pos_;
        }
    }
    if (pos_ < input_.size() && (std::isalpha(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '_')) {
        return {TokenType::Error, "malformed number", start};
    }
    return {TokenType::Number, input_.substr(start, pos_ - start), start};
}

Token ExprLexer::lex_identifier() {
    const size_t start = pos_;
    while (pos_ < input_.size()) {
        unsigned char c = static_cast<unsigned char>(input_[pos_]);
        if (std::isalnum(c) || c == '_' || c == '-') {
            ++pos_;
        } else {
            break;
        }
    }
    return {TokenType::Identifier, input_.substr(start, pos_ - start), start};
}

std::vector<Token> ExprLexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next());
        if (tokens.back().type == TokenType::End || tokens.back().type == TokenType::Error) {
            break;
        }
    }
    return tokens;
}

const char* to_string(TokenType type) {
    switch (type) {
        case TokenType::Identifier: return "identifier";
        case TokenType::String:     return "string";
        case TokenType::Number:     return "number";
        case TokenType::LParen:     return "'('";
        case TokenType::RParen:     return "')'";
        case TokenType::LBracket:   return "'['";
        case TokenType::RBracket:   return "']'";
        case TokenType::Comma:      return "','";
        case TokenType::Dot:        return "'.'";
        case TokenType::Star:       return "'*'";
        case TokenType::Not:        return "'!'";
        case TokenType::And:        return "'&&'";
        case TokenType::Or:         return "'||'";
        case TokenType::Eq:         return "'=='";
        case TokenType::Ne:         return "'!='";
        case TokenType::Lt:         return "'<'";
        case TokenType::Le:         return "'<='";
        case TokenType::Gt:         return "'>'";
        case TokenType::Ge:         return "'>='";
        case TokenType::End:        return "end of expression";
        case TokenType::Error:      return "error";
    }
    return "unknown";
}
