// parser.cpp - Expression parser

#include "parser.hpp"
#include "tokenizer.hpp"
#include "../lib/log.h"
#include <cstdarg>
#include <cstdio>
#include <utility>

namespace symcalc {

// RAII guard for recursion depth
struct DepthGuard {
    int& depth;
    explicit DepthGuard(int& d) : depth(d) { depth++; }
    ~DepthGuard() { depth--; }
};

Parser::Parser() : tokens(nullptr), pos(0), error(nullptr), failed(false), depth(0) {}

// ============================================================================
// Token access
// ============================================================================

const Token& Parser::peek() {
    if (!in_brackets()) {
        while ((*tokens)[pos].is_space()) pos++;
    }
    return (*tokens)[pos];
}

const Token& Parser::advance() {
    const Token& t = peek();
    if (!t.is_end()) pos++;
    return t;
}

void Parser::skip_spaces() {
    while ((*tokens)[pos].is_space()) pos++;
}

std::nullptr_t Parser::fail(CalcErrorCode code, uint32_t column, const char* format, ...) {
    if (failed) return nullptr;
    failed = true;
    char buffer[256];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    log_debug("parser: %s at column %u", buffer, column);
    err_set(error, code, column, buffer);
    return nullptr;
}

// ============================================================================
// Entry points
// ============================================================================

AstPtr Parser::parse(const char* text, CalcError* err) {
    TokenList list;
    if (!tokenize(text, &list, err)) return nullptr;
    return parse_tokens(list, err);
}

AstPtr Parser::parse_tokens(const TokenList& list, CalcError* err) {
    tokens = &list;
    pos = 0;
    error = err;
    failed = false;
    depth = 0;
    space_sensitive.clear();

    if (list.empty() || list.back().type != TokenType::END) {
        return fail(ERR_INTERNAL_ERROR, 0, "token list is not terminated");
    }
    if (peek().is_end()) {
        // empty or whitespace-only input
        return make_space();
    }

    AstPtr root = looks_like_definition() ? parse_definition() : parse_comparison();
    if (!root) return nullptr;

    const Token& t = peek();
    if (!t.is_end()) {
        if (t.is_punct(')') || t.is_punct(']')) {
            return fail(ERR_UNBALANCED_BRACKETS, t.column, "unmatched '%s'", t.text.c_str());
        }
        return fail(ERR_UNEXPECTED_TOKEN, t.column, "unexpected '%s'", t.text.c_str());
    }
    return root;
}

// ============================================================================
// Definitions
// ============================================================================

bool Parser::looks_like_definition() const {
    for (const Token& t : *tokens) {
        if (t.is_punct('=')) return true;
    }
    return false;
}

AstPtr Parser::parse_definition() {
    const Token& name = advance();
    if (!name.is_identifier()) {
        return fail(ERR_INVALID_DEFINITION, name.column, "expected function name before '='");
    }
    if (!peek().is_punct('(')) {
        return fail(ERR_INVALID_DEFINITION, peek().column, "expected '(' after '%s'", name.text.c_str());
    }
    advance();

    std::vector<std::string> params;
    if (!peek().is_punct(')')) {
        while (true) {
            const Token& p = advance();
            if (!p.is_identifier()) {
                return fail(ERR_INVALID_DEFINITION, p.column, "parameter must be a name, got '%s'",
                            p.text.c_str());
            }
            for (const std::string& existing : params) {
                if (existing == p.text) {
                    return fail(ERR_INVALID_DEFINITION, p.column, "duplicate parameter '%s'",
                                p.text.c_str());
                }
            }
            params.push_back(p.text);
            if (peek().is_punct(',')) {
                advance();
                continue;
            }
            break;
        }
    }
    if (!peek().is_punct(')')) {
        return fail(ERR_INVALID_DEFINITION, peek().column, "expected ')' after parameters");
    }
    advance();
    if (!peek().is_punct('=')) {
        return fail(ERR_INVALID_DEFINITION, peek().column, "expected '=' after parameter list");
    }
    advance();
    if (peek().is_end()) {
        return fail(ERR_MISSING_OPERAND, peek().column, "function '%s' has no body", name.text.c_str());
    }

    AstPtr body = parse_comparison();
    if (!body) return nullptr;
    AstPtr def = make_function_def(name.text, std::move(params), std::move(body));
    def->column = name.column;
    return def;
}

// ============================================================================
// Binary levels
// ============================================================================

AstPtr Parser::parse_comparison() {
    DepthGuard guard(depth);
    if (depth > SYMCALC_MAX_PARSE_DEPTH) {
        return fail(ERR_SYNTAX_ERROR, peek().column, "expression nested too deeply");
    }
    AstPtr left = parse_additive();
    if (!left) return nullptr;
    while (peek().is_operator() && operator_is_comparison(peek().op)) {
        const Token& op = advance();
        skip_spaces();
        AstPtr right = parse_additive();
        if (!right) return nullptr;
        uint32_t column = op.column;
        left = make_binary(op.op, std::move(left), std::move(right));
        left->column = column;
    }
    return left;
}

AstPtr Parser::parse_additive() {
    AstPtr left = parse_multiplicative();
    if (!left) return nullptr;
    while (peek().is_operator(Operator::PLUS) || peek().is_operator(Operator::MINUS)) {
        const Token& op = advance();
        skip_spaces();
        AstPtr right = parse_multiplicative();
        if (!right) return nullptr;
        uint32_t column = op.column;
        left = make_binary(op.op, std::move(left), std::move(right));
        left->column = column;
    }
    return left;
}

AstPtr Parser::parse_multiplicative() {
    AstPtr left = parse_unary();
    if (!left) return nullptr;
    while (true) {
        const Token& t = peek();
        if (t.is_operator(Operator::MULT) || t.is_operator(Operator::DIV)) {
            Operator op = t.op;
            uint32_t column = t.column;
            advance();
            skip_spaces();
            AstPtr right = parse_unary();
            if (!right) return nullptr;
            left = make_binary(op, std::move(left), std::move(right));
            left->column = column;
        } else if (t.starts_operand() && !t.is_punct('[')) {
            // implicit multiplication: 3x, 2(x+1), (a)(b)
            uint32_t column = t.column;
            AstPtr right = parse_power();
            if (!right) return nullptr;
            left = make_binary(Operator::MULT, std::move(left), std::move(right), true);
            left->column = column;
        } else {
            break;
        }
    }
    return left;
}

AstPtr Parser::parse_unary() {
    const Token& t = peek();
    if (t.is_operator(Operator::MINUS) || t.is_operator(Operator::PLUS)) {
        UnarySign sign = t.op == Operator::MINUS ? UnarySign::NEGATIVE : UnarySign::POSITIVE;
        uint32_t column = t.column;
        advance();
        skip_spaces();
        DepthGuard guard(depth);
        if (depth > SYMCALC_MAX_PARSE_DEPTH) {
            return fail(ERR_SYNTAX_ERROR, column, "expression nested too deeply");
        }
        AstPtr body = parse_unary();
        if (!body) return nullptr;
        AstPtr node = make_unary(sign, std::move(body));
        node->column = column;
        return node;
    }
    return parse_power();
}

AstPtr Parser::parse_power() {
    AstPtr base = parse_primary();
    if (!base) return nullptr;
    if (peek().is_operator(Operator::EXP)) {
        uint32_t column = advance().column;
        skip_spaces();
        AstPtr exponent = parse_unary();
        if (!exponent) return nullptr;
        AstPtr node = make_binary(Operator::EXP, std::move(base), std::move(exponent));
        node->column = column;
        return node;
    }
    return base;
}

// ============================================================================
// Primary
// ============================================================================

AstPtr Parser::parse_primary() {
    const Token& t = peek();
    switch (t.type) {
    case TokenType::NUMBER: {
        Decimal value;
        if (!Decimal::parse(t.text.c_str(), &value)) {
            return fail(ERR_INVALID_NUMBER, t.column, "invalid number '%s'", t.text.c_str());
        }
        AstPtr node = make_literal(value);
        node->column = t.column;
        advance();
        return node;
    }
    case TokenType::IDENTIFIER: {
        Token name = advance();
        if (peek().is_punct('(')) return parse_call(name);
        AstPtr node = make_variable(name.text);
        node->column = name.column;
        return node;
    }
    case TokenType::PUNCT:
        if (t.is_punct('(')) {
            uint32_t column = t.column;
            advance();
            space_sensitive.push_back(false);
            AstPtr inner = parse_comparison();
            space_sensitive.pop_back();
            if (!inner) return nullptr;
            if (!peek().is_punct(')')) {
                return fail(ERR_UNBALANCED_BRACKETS, column, "missing ')' for '(' at column %u", column);
            }
            advance();
            return inner;
        }
        if (t.is_punct('[')) return parse_brackets();
        if (t.is_punct(')') || t.is_punct(']')) {
            return fail(ERR_UNBALANCED_BRACKETS, t.column, "unexpected '%s'", t.text.c_str());
        }
        return fail(ERR_UNEXPECTED_TOKEN, t.column, "unexpected '%s'", t.text.c_str());
    case TokenType::OPERATOR:
        return fail(ERR_MISSING_OPERAND, t.column, "missing operand before '%s'", t.text.c_str());
    case TokenType::SPACE:
        return fail(ERR_MISSING_OPERAND, t.column, "missing operand");
    case TokenType::END:
        return fail(ERR_MISSING_OPERAND, t.column, "unexpected end of input");
    }
    return fail(ERR_INTERNAL_ERROR, t.column, "unknown token type");
}

AstPtr Parser::parse_call(const Token& name) {
    uint32_t open_column = advance().column;   // '('
    space_sensitive.push_back(false);
    std::vector<AstPtr> args;
    if (!peek().is_punct(')')) {
        while (true) {
            AstPtr arg = parse_comparison();
            if (!arg) {
                space_sensitive.pop_back();
                return nullptr;
            }
            args.push_back(std::move(arg));
            if (peek().is_punct(',')) {
                advance();
                continue;
            }
            break;
        }
    }
    space_sensitive.pop_back();
    if (!peek().is_punct(')')) {
        return fail(ERR_UNBALANCED_BRACKETS, open_column, "missing ')' in call to '%s'", name.text.c_str());
    }
    advance();
    AstPtr node = make_call(name.text, std::move(args));
    node->column = name.column;
    return node;
}

// A run of bracket groups: one group is a vector, several are matrix rows
AstPtr Parser::parse_brackets() {
    uint32_t column = peek().column;
    AstPtr first = parse_bracket_group();
    if (!first) return nullptr;
    if (!peek().is_punct('[')) return first;

    if (first->type != AstNodeType::VECTOR) {
        return fail(ERR_INVALID_MATRIX_SYNTAX, peek().column, "matrix row must be a vector");
    }
    std::vector<AstPtr> rows;
    rows.push_back(std::move(first));
    while (peek().is_punct('[')) {
        uint32_t row_column = peek().column;
        AstPtr row = parse_bracket_group();
        if (!row) return nullptr;
        if (row->type != AstNodeType::VECTOR) {
            return fail(ERR_INVALID_MATRIX_SYNTAX, row_column, "matrix row must be a vector");
        }
        rows.push_back(std::move(row));
    }
    AstPtr matrix = make_matrix(std::move(rows));
    matrix->column = column;
    return matrix;
}

AstPtr Parser::parse_bracket_group() {
    uint32_t column = advance().column;   // '['
    space_sensitive.push_back(true);
    skip_spaces();

    std::vector<AstPtr> items;
    bool nested = (*tokens)[pos].is_punct('[');
    while (true) {
        skip_spaces();
        const Token& t = (*tokens)[pos];
        if (t.is_punct(']')) break;
        if (t.is_end()) {
            space_sensitive.pop_back();
            return fail(ERR_UNBALANCED_BRACKETS, column, "missing ']' for '[' at column %u", column);
        }
        AstPtr item;
        if (nested) {
            if (!t.is_punct('[')) {
                space_sensitive.pop_back();
                return fail(ERR_INVALID_MATRIX_SYNTAX, t.column, "expected '[' for matrix row");
            }
            item = parse_bracket_group();
        } else {
            item = parse_comparison();
        }
        if (!item) {
            space_sensitive.pop_back();
            return nullptr;
        }
        items.push_back(std::move(item));

        const Token& next = (*tokens)[pos];
        if (next.is_punct(',')) {
            pos++;
        } else if (!next.is_space() && !next.is_punct(']')) {
            space_sensitive.pop_back();
            if (next.is_end()) {
                return fail(ERR_UNBALANCED_BRACKETS, column, "missing ']' for '[' at column %u", column);
            }
            return fail(ERR_UNEXPECTED_TOKEN, next.column, "unexpected '%s' in brackets", next.text.c_str());
        }
    }
    space_sensitive.pop_back();
    pos++;  // ']'

    if (items.empty()) {
        return fail(ERR_INVALID_MATRIX_SYNTAX, column, "empty brackets");
    }
    AstPtr node = nested ? make_matrix(std::move(items)) : make_vector(std::move(items));
    node->column = column;
    return node;
}

// ============================================================================
// Convenience
// ============================================================================

AstPtr parse_expression(const char* text, CalcError* error) {
    Parser parser;
    return parser.parse(text, error);
}

AstPtr parse_definition(const char* text, CalcError* error) {
    Parser parser;
    AstPtr node = parser.parse(text, error);
    if (!node) return nullptr;
    if (node->type != AstNodeType::FUNCTION_DEF) {
        err_set(error, ERR_INVALID_DEFINITION, 1, "expected 'name(params) = expression'");
        return nullptr;
    }
    return node;
}

} // namespace symcalc
