// token.hpp - Expression tokens
//
// Tokens are produced once per parse by the Tokenizer and consumed by the
// Parser. Whitespace is kept as a SPACE token: inside matrix brackets it
// separates elements, and the parser needs to see it.

#ifndef SYMCALC_TOKEN_HPP
#define SYMCALC_TOKEN_HPP

#include "operator.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace symcalc {

// ============================================================================
// Token Types
// ============================================================================

enum class TokenType : uint8_t {
    NUMBER,         // 12, 3.5, .25
    IDENTIFIER,     // x, sin, f2
    OPERATOR,       // + - * / ^ > < >= <= != == +=
    PUNCT,          // ( ) [ ] , =
    SPACE,          // run of whitespace
    END,            // end of input
};

const char* token_type_name(TokenType type);

// ============================================================================
// Token Structure
// ============================================================================

struct Token {
    TokenType type;
    std::string text;
    Operator op;            // valid for OPERATOR tokens
    uint32_t column;        // 1-based column of the first character

    // ========================================================================
    // Constructors
    // ========================================================================

    static Token make_number(const std::string& text, uint32_t column);
    static Token make_identifier(const std::string& text, uint32_t column);
    static Token make_operator(Operator op, uint32_t column);
    static Token make_punct(char c, uint32_t column);
    static Token make_space(uint32_t column);
    static Token make_end(uint32_t column);

    // ========================================================================
    // Predicates
    // ========================================================================

    bool is_number() const { return type == TokenType::NUMBER; }
    bool is_identifier() const { return type == TokenType::IDENTIFIER; }
    bool is_operator() const { return type == TokenType::OPERATOR; }
    bool is_operator(Operator o) const { return type == TokenType::OPERATOR && op == o; }
    bool is_punct(char c) const { return type == TokenType::PUNCT && text.size() == 1 && text[0] == c; }
    bool is_space() const { return type == TokenType::SPACE; }
    bool is_end() const { return type == TokenType::END; }

    // Can this token begin an operand (number, name, `(` or `[`)?
    bool starts_operand() const {
        return is_number() || is_identifier() || is_punct('(') || is_punct('[');
    }
};

typedef std::vector<Token> TokenList;

} // namespace symcalc

#endif // SYMCALC_TOKEN_HPP
