// tokenizer.hpp - Expression tokenizer
//
// Scans expression text into a flat token list:
// - numbers with an optional decimal point
// - identifiers (case-sensitive)
// - one and two character operators, longest match first
// - parentheses, brackets, comma and `=`
// - whitespace runs as SPACE tokens
//
// Any other character is a lexical error reported with its column.

#ifndef SYMCALC_TOKENIZER_HPP
#define SYMCALC_TOKENIZER_HPP

#include "token.hpp"
#include "calc_error.hpp"
#include <cstddef>

namespace symcalc {

class Tokenizer {
public:
    Tokenizer(const char* text, size_t len);

    // Tokenize the whole input. The list always ends with an END token.
    // Returns false and fills error on the first unrecognized character.
    bool tokenize(TokenList* out, CalcError* error);

private:
    const char* src;
    size_t len;
    size_t pos;

    uint32_t column() const { return (uint32_t)pos + 1; }
    bool read_number(TokenList* out, CalcError* error);
    void read_identifier(TokenList* out);
    void read_space(TokenList* out);
};

// Convenience wrapper over Tokenizer
bool tokenize(const char* text, TokenList* out, CalcError* error);

} // namespace symcalc

#endif // SYMCALC_TOKENIZER_HPP
