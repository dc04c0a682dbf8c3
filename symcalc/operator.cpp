// operator.cpp - Binary operator table

#include "operator.hpp"
#include <cstring>

namespace symcalc {

struct OperatorInfo {
    Operator op;
    const char* symbol;
    const char* name;
    int precedence;
};

// two-character forms come first so a linear scan finds the longest match
static const OperatorInfo operator_table[] = {
    {Operator::GTE,    ">=", "GTE",    SYMCALC_PREC_COMPARISON},
    {Operator::LTE,    "<=", "LTE",    SYMCALC_PREC_COMPARISON},
    {Operator::NEQ,    "!=", "NEQ",    SYMCALC_PREC_COMPARISON},
    {Operator::EQUAL,  "==", "EQUAL",  SYMCALC_PREC_COMPARISON},
    {Operator::PEQUAL, "+=", "PEQUAL", SYMCALC_PREC_COMPARISON},
    {Operator::GT,     ">",  "GT",     SYMCALC_PREC_COMPARISON},
    {Operator::LT,     "<",  "LT",     SYMCALC_PREC_COMPARISON},
    {Operator::PLUS,   "+",  "PLUS",   SYMCALC_PREC_ADDITIVE},
    {Operator::MINUS,  "-",  "MINUS",  SYMCALC_PREC_ADDITIVE},
    {Operator::MULT,   "*",  "MULT",   SYMCALC_PREC_MULTIPLY},
    {Operator::DIV,    "/",  "DIV",    SYMCALC_PREC_MULTIPLY},
    {Operator::EXP,    "^",  "EXP",    SYMCALC_PREC_POWER},
};

static const size_t operator_count = sizeof(operator_table) / sizeof(operator_table[0]);

static const OperatorInfo& info_of(Operator op) {
    for (size_t i = 0; i < operator_count; i++) {
        if (operator_table[i].op == op) return operator_table[i];
    }
    return operator_table[operator_count - 1];
}

const char* operator_symbol(Operator op) { return info_of(op).symbol; }
const char* operator_name(Operator op) { return info_of(op).name; }
int operator_precedence(Operator op) { return info_of(op).precedence; }

bool operator_is_right_assoc(Operator op) { return op == Operator::EXP; }

bool operator_is_comparison(Operator op) {
    return info_of(op).precedence == SYMCALC_PREC_COMPARISON;
}

size_t operator_from_text(const char* text, size_t len, Operator* out) {
    if (!text || len == 0) return 0;
    for (size_t i = 0; i < operator_count; i++) {
        const char* sym = operator_table[i].symbol;
        size_t sym_len = strlen(sym);
        if (sym_len <= len && strncmp(text, sym, sym_len) == 0) {
            if (out) *out = operator_table[i].op;
            return sym_len;
        }
    }
    return 0;
}

bool is_operator_char(char c) {
    switch (c) {
    case '+': case '-': case '*': case '/': case '^':
    case '<': case '>': case '=': case '!':
        return true;
    default:
        return false;
    }
}

} // namespace symcalc
