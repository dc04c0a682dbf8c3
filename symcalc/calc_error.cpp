/**
 * @file calc_error.cpp
 * @brief symcalc structured error codes
 */

#include "calc_error.hpp"
#include "../lib/log.h"
#include <stdio.h>
#include <stdarg.h>

namespace symcalc {

// ============================================================================
// Error Code Name Lookup
// ============================================================================

typedef struct {
    CalcErrorCode code;
    const char* name;
    const char* message;
} ErrorCodeInfo;

static const ErrorCodeInfo error_code_table[] = {
    {ERR_OK, "OK", "Success"},

    // 1xx - Syntax Errors
    {ERR_SYNTAX_ERROR, "SYNTAX_ERROR", "Syntax error"},
    {ERR_UNEXPECTED_CHARACTER, "UNEXPECTED_CHARACTER", "Unrecognized character"},
    {ERR_UNEXPECTED_TOKEN, "UNEXPECTED_TOKEN", "Unexpected token"},
    {ERR_MISSING_TOKEN, "MISSING_TOKEN", "Missing expected token"},
    {ERR_MISSING_OPERAND, "MISSING_OPERAND", "Missing operand"},
    {ERR_UNBALANCED_BRACKETS, "UNBALANCED_BRACKETS", "Unbalanced brackets"},
    {ERR_INVALID_NUMBER, "INVALID_NUMBER", "Invalid number format"},
    {ERR_INVALID_DEFINITION, "INVALID_DEFINITION", "Invalid function definition"},
    {ERR_INVALID_MATRIX_SYNTAX, "INVALID_MATRIX_SYNTAX", "Invalid matrix syntax"},

    // 2xx - Semantic Errors
    {ERR_SEMANTIC_ERROR, "SEMANTIC_ERROR", "Semantic error"},
    {ERR_DUPLICATE_DEFINITION, "DUPLICATE_DEFINITION", "Duplicate definition"},
    {ERR_ARGUMENT_COUNT_MISMATCH, "ARGUMENT_COUNT_MISMATCH", "Wrong number of arguments"},
    {ERR_UNDEFINED_FUNCTION, "UNDEFINED_FUNCTION", "Function not found"},
    {ERR_UNDEFINED_VARIABLE, "UNDEFINED_VARIABLE", "Undefined variable"},
    {ERR_TYPE_MISMATCH, "TYPE_MISMATCH", "Type mismatch"},
    {ERR_INVALID_CONFIG, "INVALID_CONFIG", "Invalid configuration"},
    {ERR_DIMENSION_MISMATCH, "DIMENSION_MISMATCH", "Matrix dimension mismatch"},

    // 3xx - Runtime Errors
    {ERR_RUNTIME_ERROR, "RUNTIME_ERROR", "Runtime error"},
    {ERR_DIVISION_BY_ZERO, "DIVISION_BY_ZERO", "Division by zero"},
    {ERR_SINGULAR_MATRIX, "SINGULAR_MATRIX", "Matrix is singular"},
    {ERR_NOT_CONVERGED, "NOT_CONVERGED", "Iteration did not converge"},
    {ERR_OVERFLOW, "OVERFLOW", "Numeric overflow"},
    {ERR_INVALID_OPERATION, "INVALID_OPERATION", "Invalid operation"},
    {ERR_DOMAIN_ERROR, "DOMAIN_ERROR", "Argument outside function domain"},

    // 5xx - Internal Errors
    {ERR_INTERNAL_ERROR, "INTERNAL_ERROR", "Internal error"},
    {ERR_NOT_IMPLEMENTED, "NOT_IMPLEMENTED", "Not implemented"},
    {ERR_DECIMAL_FAILURE, "DECIMAL_FAILURE", "Decimal arithmetic failure"},
};

static const int error_code_count = sizeof(error_code_table) / sizeof(error_code_table[0]);

const char* err_code_name(CalcErrorCode code) {
    for (int i = 0; i < error_code_count; i++) {
        if (error_code_table[i].code == code) {
            return error_code_table[i].name;
        }
    }
    return "UNKNOWN_ERROR";
}

const char* err_code_message(CalcErrorCode code) {
    for (int i = 0; i < error_code_count; i++) {
        if (error_code_table[i].code == code) {
            return error_code_table[i].message;
        }
    }
    return "Unknown error";
}

const char* err_category_name(CalcErrorCode code) {
    if (ERR_IS_SYNTAX(code)) return "Syntax";
    if (ERR_IS_SEMANTIC(code)) return "Semantic";
    if (ERR_IS_RUNTIME(code)) return "Runtime";
    if (ERR_IS_INTERNAL(code)) return "Internal";
    return "Unknown";
}

const char* err_kind_name(CalcErrorCode code) {
    switch (code) {
    case ERR_OK: return "OK";
    case ERR_UNEXPECTED_CHARACTER: return "LexicalError";
    case ERR_DUPLICATE_DEFINITION: return "DefinitionError";
    case ERR_ARGUMENT_COUNT_MISMATCH: return "ArityError";
    case ERR_UNDEFINED_FUNCTION:
    case ERR_UNDEFINED_VARIABLE: return "UnknownIdentifierError";
    case ERR_DIVISION_BY_ZERO: return "DivisionError";
    case ERR_SINGULAR_MATRIX: return "SingularMatrixError";
    case ERR_NOT_CONVERGED: return "ConvergenceError";
    default: break;
    }
    if (ERR_IS_SYNTAX(code)) return "ParseError";
    if (ERR_IS_INTERNAL(code)) return "InternalError";
    return "EvalError";
}

// ============================================================================
// Error Creation
// ============================================================================

bool err_set(CalcError* error, CalcErrorCode code, uint32_t column, const char* message) {
    const char* text = message ? message : err_code_message(code);
    log_debug("error: %s (%d) at column %u: %s", err_code_name(code), (int)code, column, text);
    if (!error) return false;
    error->code = code;
    error->column = column;
    error->message = text;
    return false;
}

bool err_setf(CalcError* error, CalcErrorCode code, uint32_t column, const char* format, ...) {
    char buffer[512];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    return err_set(error, code, column, buffer);
}

void err_clear(CalcError* error) {
    if (!error) return;
    error->code = ERR_OK;
    error->column = 0;
    error->message.clear();
}

// ============================================================================
// Error Output
// ============================================================================

std::string err_format(const CalcError& error) {
    char header[160];
    if (error.column > 0) {
        snprintf(header, sizeof(header), "%s [%d %s] at column %u: ", err_kind_name(error.code),
                 (int)error.code, err_code_name(error.code), error.column);
    } else {
        snprintf(header, sizeof(header), "%s [%d %s]: ", err_kind_name(error.code),
                 (int)error.code, err_code_name(error.code));
    }
    std::string out = header;
    out += error.message.empty() ? err_code_message(error.code) : error.message;
    return out;
}

} // namespace symcalc
