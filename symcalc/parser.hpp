// parser.hpp - Expression parser
//
// Precedence-climbing parser over the token list:
//
//   input       := SPACE* | definition | comparison
//   definition  := IDENT '(' [IDENT {',' IDENT}] ')' '=' comparison
//   comparison  := additive { (> < >= <= != == +=) additive }
//   additive    := multiplicative { (+ -) multiplicative }
//   multiplicative := unary { (* /) unary | <adjacent operand> }
//   unary       := (- +) unary | power
//   power       := primary [ '^' unary ]
//   primary     := NUMBER | IDENT | IDENT '(' args ')' | '(' comparison ')'
//                | bracket { bracket }
//   bracket     := '[' element { (',' | SPACE) element } ']'
//
// Outside brackets whitespace is ignored. Inside brackets it separates
// elements, so `[1 -2 3]` has three elements. Two or more adjacent bracket
// groups, or a bracket group of bracket groups, form a matrix.

#ifndef SYMCALC_PARSER_HPP
#define SYMCALC_PARSER_HPP

#include "ast.hpp"
#include "calc_error.hpp"
#include "token.hpp"
#include <vector>

namespace symcalc {

#define SYMCALC_MAX_PARSE_DEPTH 256

class Parser {
public:
    Parser();

    // Tokenize and parse. Returns null and fills error on failure.
    AstPtr parse(const char* text, CalcError* error);
    AstPtr parse_tokens(const TokenList& tokens, CalcError* error);

private:
    const TokenList* tokens;
    size_t pos;
    CalcError* error;
    bool failed;
    int depth;
    // true while directly inside [...], where whitespace is significant
    std::vector<bool> space_sensitive;

    const Token& peek();
    const Token& advance();
    void skip_spaces();
    bool in_brackets() const { return !space_sensitive.empty() && space_sensitive.back(); }
    std::nullptr_t fail(CalcErrorCode code, uint32_t column, const char* format, ...)
        __attribute__((format(printf, 4, 5)));

    bool looks_like_definition() const;
    AstPtr parse_definition();
    AstPtr parse_comparison();
    AstPtr parse_additive();
    AstPtr parse_multiplicative();
    AstPtr parse_unary();
    AstPtr parse_power();
    AstPtr parse_primary();
    AstPtr parse_call(const Token& name);
    AstPtr parse_brackets();
    AstPtr parse_bracket_group();
};

// Parse a single expression or definition
AstPtr parse_expression(const char* text, CalcError* error);

// Parse text that must be `name(params) = body`
AstPtr parse_definition(const char* text, CalcError* error);

} // namespace symcalc

#endif // SYMCALC_PARSER_HPP
