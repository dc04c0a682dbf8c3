// tokenizer.cpp - Expression tokenizer

#include "tokenizer.hpp"
#include "../lib/log.h"
#include <cctype>
#include <cstring>
#include <utility>

namespace symcalc {

// ============================================================================
// Token
// ============================================================================

const char* token_type_name(TokenType type) {
    switch (type) {
    case TokenType::NUMBER: return "NUMBER";
    case TokenType::IDENTIFIER: return "IDENTIFIER";
    case TokenType::OPERATOR: return "OPERATOR";
    case TokenType::PUNCT: return "PUNCT";
    case TokenType::SPACE: return "SPACE";
    case TokenType::END: return "END";
    }
    return "UNKNOWN";
}

Token Token::make_number(const std::string& text, uint32_t column) {
    Token t;
    t.type = TokenType::NUMBER;
    t.text = text;
    t.op = Operator::PLUS;
    t.column = column;
    return t;
}

Token Token::make_identifier(const std::string& text, uint32_t column) {
    Token t;
    t.type = TokenType::IDENTIFIER;
    t.text = text;
    t.op = Operator::PLUS;
    t.column = column;
    return t;
}

Token Token::make_operator(Operator op, uint32_t column) {
    Token t;
    t.type = TokenType::OPERATOR;
    t.text = operator_symbol(op);
    t.op = op;
    t.column = column;
    return t;
}

Token Token::make_punct(char c, uint32_t column) {
    Token t;
    t.type = TokenType::PUNCT;
    t.text = std::string(1, c);
    t.op = Operator::PLUS;
    t.column = column;
    return t;
}

Token Token::make_space(uint32_t column) {
    Token t;
    t.type = TokenType::SPACE;
    t.text = " ";
    t.op = Operator::PLUS;
    t.column = column;
    return t;
}

Token Token::make_end(uint32_t column) {
    Token t;
    t.type = TokenType::END;
    t.op = Operator::PLUS;
    t.column = column;
    return t;
}

// ============================================================================
// Tokenizer
// ============================================================================

Tokenizer::Tokenizer(const char* text, size_t length)
    : src(text ? text : ""), len(text ? length : 0), pos(0) {}

bool Tokenizer::read_number(TokenList* out, CalcError* error) {
    size_t start = pos;
    bool seen_point = false;
    while (pos < len) {
        char c = src[pos];
        if (isdigit((unsigned char)c)) {
            pos++;
        } else if (c == '.') {
            if (seen_point) {
                return err_setf(error, ERR_INVALID_NUMBER, column(),
                                "second decimal point in number '%.*s'",
                                (int)(pos - start + 1), src + start);
            }
            seen_point = true;
            pos++;
        } else {
            break;
        }
    }
    std::string text(src + start, pos - start);
    if (text == ".") {
        return err_set(error, ERR_INVALID_NUMBER, (uint32_t)start + 1, "lone decimal point");
    }
    out->push_back(Token::make_number(text, (uint32_t)start + 1));
    return true;
}

void Tokenizer::read_identifier(TokenList* out) {
    size_t start = pos;
    while (pos < len && (isalnum((unsigned char)src[pos]) || src[pos] == '_')) pos++;
    out->push_back(Token::make_identifier(std::string(src + start, pos - start), (uint32_t)start + 1));
}

void Tokenizer::read_space(TokenList* out) {
    size_t start = pos;
    while (pos < len && isspace((unsigned char)src[pos])) pos++;
    out->push_back(Token::make_space((uint32_t)start + 1));
}

bool Tokenizer::tokenize(TokenList* out, CalcError* error) {
    TokenList tokens;
    pos = 0;
    while (pos < len) {
        char c = src[pos];
        if (isspace((unsigned char)c)) {
            read_space(&tokens);
        } else if (isdigit((unsigned char)c) || c == '.') {
            if (!read_number(&tokens, error)) return false;
        } else if (isalpha((unsigned char)c) || c == '_') {
            read_identifier(&tokens);
        } else if (c == '(' || c == ')' || c == '[' || c == ']' || c == ',') {
            tokens.push_back(Token::make_punct(c, column()));
            pos++;
        } else if (c == '=' && !(pos + 1 < len && src[pos + 1] == '=')) {
            tokens.push_back(Token::make_punct('=', column()));
            pos++;
        } else {
            Operator op;
            size_t used = operator_from_text(src + pos, len - pos, &op);
            if (used == 0) {
                return err_setf(error, ERR_UNEXPECTED_CHARACTER, column(),
                                "unrecognized character '%c'", c);
            }
            tokens.push_back(Token::make_operator(op, column()));
            pos += used;
        }
    }
    tokens.push_back(Token::make_end((uint32_t)len + 1));
    log_debug("tokenizer: %zu tokens from %zu chars", tokens.size(), len);
    *out = std::move(tokens);
    return true;
}

bool tokenize(const char* text, TokenList* out, CalcError* error) {
    Tokenizer tokenizer(text, text ? strlen(text) : 0);
    return tokenizer.tokenize(out, error);
}

} // namespace symcalc
