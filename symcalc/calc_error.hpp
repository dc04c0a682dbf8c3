/**
 * @file calc_error.hpp
 * @brief symcalc structured error codes
 *
 * Every failing operation fills a CalcError with a numeric code, a message and
 * the column in the input text where the problem was detected. Codes are grouped
 * in ranges so callers can test the category without listing codes.
 */

#pragma once

#include <stdint.h>
#include <string>

namespace symcalc {

// ============================================================================
// Error Code Ranges
// ============================================================================

#define ERR_SYNTAX_BASE    100
#define ERR_SEMANTIC_BASE  200
#define ERR_RUNTIME_BASE   300
#define ERR_INTERNAL_BASE  500

// Category macros
#define ERR_IS_SYNTAX(code)    ((code) >= 100 && (code) < 200)
#define ERR_IS_SEMANTIC(code)  ((code) >= 200 && (code) < 300)
#define ERR_IS_RUNTIME(code)   ((code) >= 300 && (code) < 400)
#define ERR_IS_INTERNAL(code)  ((code) >= 500 && (code) < 600)

// ============================================================================
// Error Codes
// ============================================================================

typedef enum CalcErrorCode {
    ERR_OK = 0,

    // -------------------------------------------------------------------------
    // 1xx - Syntax Errors (lexical, grammar)
    // -------------------------------------------------------------------------
    ERR_SYNTAX_ERROR = 100,           // generic syntax error
    ERR_UNEXPECTED_CHARACTER = 101,   // character the tokenizer does not know
    ERR_UNEXPECTED_TOKEN = 102,       // token not valid at this position
    ERR_MISSING_TOKEN = 103,          // expected token missing (e.g. `)`)
    ERR_MISSING_OPERAND = 104,        // operator without right-hand operand
    ERR_UNBALANCED_BRACKETS = 105,    // unmatched `(` `)` `[` `]`
    ERR_INVALID_NUMBER = 106,         // malformed numeric literal
    ERR_INVALID_DEFINITION = 107,     // expected `name(params) = body`
    ERR_INVALID_MATRIX_SYNTAX = 108,  // malformed matrix/vector literal

    // -------------------------------------------------------------------------
    // 2xx - Semantic Errors
    // -------------------------------------------------------------------------
    ERR_SEMANTIC_ERROR = 200,         // generic semantic error
    ERR_DUPLICATE_DEFINITION = 201,   // function name already defined
    ERR_ARGUMENT_COUNT_MISMATCH = 202,// wrong number of function arguments
    ERR_UNDEFINED_FUNCTION = 203,     // reference to unknown function
    ERR_UNDEFINED_VARIABLE = 204,     // variable with no value where one is needed
    ERR_TYPE_MISMATCH = 205,          // e.g. matrix literal where a scalar is needed
    ERR_INVALID_CONFIG = 206,         // unknown or out-of-range configuration
    ERR_DIMENSION_MISMATCH = 207,     // matrix shapes do not fit the operation

    // -------------------------------------------------------------------------
    // 3xx - Runtime Errors
    // -------------------------------------------------------------------------
    ERR_RUNTIME_ERROR = 300,          // generic runtime error
    ERR_DIVISION_BY_ZERO = 301,       // division, modulo or gcf by zero
    ERR_SINGULAR_MATRIX = 302,        // matrix has no inverse
    ERR_NOT_CONVERGED = 303,          // iteration ceiling reached
    ERR_OVERFLOW = 304,               // result too large to represent
    ERR_INVALID_OPERATION = 305,      // operation not valid for the operands
    ERR_DOMAIN_ERROR = 306,           // argument outside the function's domain

    // -------------------------------------------------------------------------
    // 5xx - Internal Errors
    // -------------------------------------------------------------------------
    ERR_INTERNAL_ERROR = 500,         // generic internal error
    ERR_NOT_IMPLEMENTED = 501,        // shape the engine does not handle
    ERR_DECIMAL_FAILURE = 502,        // decimal library reported a failure
} CalcErrorCode;

// ============================================================================
// Error Structure
// ============================================================================

struct CalcError {
    CalcErrorCode code = ERR_OK;
    std::string message;
    uint32_t column = 0;            // 1-based column in the input, 0 if unknown

    bool ok() const { return code == ERR_OK; }
};

// ============================================================================
// Error API
// ============================================================================

// Error code utilities
const char* err_code_name(CalcErrorCode code);
const char* err_code_message(CalcErrorCode code);
const char* err_category_name(CalcErrorCode code);

// Taxonomy name reported to users: LexicalError, ParseError, DefinitionError,
// ArityError, UnknownIdentifierError, DivisionError, SingularMatrixError,
// ConvergenceError, or EvalError for the remaining runtime codes.
const char* err_kind_name(CalcErrorCode code);

// Fill an error; all are no-ops when error is null. Always returns false so
// callers can write `return err_set(...)`.
bool err_set(CalcError* error, CalcErrorCode code, uint32_t column, const char* message);
bool err_setf(CalcError* error, CalcErrorCode code, uint32_t column, const char* format, ...)
    __attribute__((format(printf, 4, 5)));
void err_clear(CalcError* error);

// "<Kind> [<code> <NAME>] at column N: message"
std::string err_format(const CalcError& error);

} // namespace symcalc
