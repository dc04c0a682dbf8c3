// operator.hpp - Binary operator table
//
// Fixed set of binary operators with their text form and precedence.
// Precedence tiers, lowest first:
//   1  comparisons  > < >= <= != == +=
//   2  additive     + -
//   3  multiplicative * /
//   4  unary sign (not an Operator, see UnarySign)
//   5  power        ^   (right associative)

#ifndef SYMCALC_OPERATOR_HPP
#define SYMCALC_OPERATOR_HPP

#include <cstddef>
#include <cstdint>

namespace symcalc {

enum class Operator : uint8_t {
    PLUS,
    MINUS,
    MULT,
    DIV,
    EXP,
    GT,
    LT,
    GTE,
    LTE,
    NEQ,
    EQUAL,
    PEQUAL,     // accumulate `+=`
};

enum class UnarySign : uint8_t {
    POSITIVE,
    NEGATIVE,
};

#define SYMCALC_PREC_COMPARISON 1
#define SYMCALC_PREC_ADDITIVE   2
#define SYMCALC_PREC_MULTIPLY   3
#define SYMCALC_PREC_UNARY      4
#define SYMCALC_PREC_POWER      5

const char* operator_symbol(Operator op);
const char* operator_name(Operator op);
int operator_precedence(Operator op);
bool operator_is_right_assoc(Operator op);
bool operator_is_comparison(Operator op);

// Longest match at text[0..len). Returns the number of characters consumed
// (1 or 2), or 0 if no operator starts there.
size_t operator_from_text(const char* text, size_t len, Operator* out);

// Characters that can start an operator
bool is_operator_char(char c);

} // namespace symcalc

#endif // SYMCALC_OPERATOR_HPP
