// evaluator.cpp - Dual-mode expression evaluator

#include "evaluator.hpp"
#include "../lib/log.h"

namespace symcalc {

Evaluator::Evaluator(Context* ctx, const EvalConfig& cfg) : context_(ctx), config_(cfg), call_depth_(0) {}

Evaluator::Evaluator(Context* ctx, const EvalConfig& cfg, int depth)
    : context_(ctx), config_(cfg), call_depth_(depth) {}

bool Evaluator::evaluate(const AstNode* node, Term* out, CalcError* error) {
    if (!node) return err_set(error, ERR_INTERNAL_ERROR, 0, "no expression to evaluate");

    switch (node->type) {
    case AstNodeType::LITERAL:
        return eval_literal(node, out);
    case AstNodeType::VARIABLE:
        return eval_variable(node, out);
    case AstNodeType::UNARY:
        return eval_unary(node, out, error);
    case AstNodeType::BINARY:
        return eval_binary(node, out, error);
    case AstNodeType::CALL:
        return eval_call(node, out, error);
    case AstNodeType::SPACE:
        *out = Term::zero();
        return true;
    case AstNodeType::FUNCTION_DEF:
        return err_setf(error, ERR_TYPE_MISMATCH, node->column,
                        "definition of '%s' cannot be evaluated as a value", node->name.c_str());
    case AstNodeType::MATRIX:
    case AstNodeType::VECTOR:
        return err_set(error, ERR_TYPE_MISMATCH, node->column, "matrix where a scalar is expected");
    }
    return err_set(error, ERR_INTERNAL_ERROR, node->column, "unknown node type");
}

// ============================================================================
// Leaves
// ============================================================================

bool Evaluator::eval_literal(const AstNode* node, Term* out) {
    // only literals typed by the user raise the precision; synthesized
    // ones (constants, probe points) have no source column
    if (node->column > 0) {
        int digits = node->value.digits();
        if (digits > config_.precision) {
            config_.precision = digits > SYMCALC_MAX_PRECISION ? SYMCALC_MAX_PRECISION : digits;
            log_debug("eval: precision raised to %d by literal %s", config_.precision,
                      node->value.to_string().c_str());
        }
    }
    *out = Term::numeric(node->value);
    return true;
}

bool Evaluator::eval_variable(const AstNode* node, Term* out) {
    if (context_->lookup_binding(node->name, out)) return true;
    *out = Term::symbolic(node->name);
    return true;
}

bool Evaluator::eval_unary(const AstNode* node, Term* out, CalcError* error) {
    Term value;
    if (!evaluate(node->body.get(), &value, error)) return false;
    *out = node->sign == UnarySign::NEGATIVE ? value.negated() : value;
    return true;
}

// ============================================================================
// Binary
// ============================================================================

bool Evaluator::eval_binary(const AstNode* node, Term* out, CalcError* error) {
    Term left, right;
    if (!evaluate(node->left.get(), &left, error)) return false;
    if (!evaluate(node->right.get(), &right, error)) return false;
    if (!combine_terms(left, node->op, right, out, error)) {
        if (error && error->column == 0) error->column = node->column;
        return false;
    }
    return true;
}

static bool leading_minus(const Term& t) {
    if (t.is_numeric()) return t.value().is_negative();
    return t.text().size() > 1 && t.text()[0] == '-';
}

// coefficient first, with -1/0/1 collapsed
bool Evaluator::symbolic_product(const Term& left, const Term& right, Term* out) {
    if (right.is_numeric() && left.is_symbolic()) return symbolic_product(right, left, out);
    if (left.is_numeric()) {
        Decimal coef = left.value();
        Term other = right;
        // -2 * -sin(x) reads better as 2sin(x)
        if (leading_minus(other)) {
            Term flipped = other.negated();
            if (flipped.to_string()[0] != '-') {
                other = flipped;
                coef = coef.negate();
            }
        }
        // 3 * 2x -> 6x
        Decimal inner;
        std::string rest;
        if (text_split_coefficient(other.to_string(), &inner, &rest) &&
            Decimal::mul(coef, inner, config_.working_precision(), &coef) == DecimalStatus::OK) {
            other = Term::symbolic(rest);
        }
        if (coef.is_zero()) {
            *out = Term::zero();
        } else if (coef == Decimal::from_int(1)) {
            *out = other;
        } else if (coef == Decimal::from_int(-1)) {
            *out = other.negated();
        } else {
            *out = Term::symbolic(text_product(coef.to_string(), other.to_string()));
        }
        return true;
    }
    *out = Term::symbolic(text_product(left.to_string(), right.to_string()));
    return true;
}

bool Evaluator::combine_terms(const Term& left, Operator op, const Term& right, Term* out,
                              CalcError* error) {
    if (op == Operator::PEQUAL) op = Operator::PLUS;

    if (left.is_numeric() && right.is_numeric()) {
        return left.operation(right, op, config_, out, error);
    }

    switch (op) {
    case Operator::MULT:
        return symbolic_product(left, right, out);
    case Operator::DIV:
        if (right.is_exact_zero()) return err_set(error, ERR_DIVISION_BY_ZERO, 0, "division by zero");
        if (right.is_numeric_value(1)) {
            *out = left;
            return true;
        }
        if (left.is_exact_zero()) {
            *out = Term::zero();
            return true;
        }
        break;
    case Operator::PLUS:
        if (left.is_exact_zero()) {
            *out = right;
            return true;
        }
        if (right.is_exact_zero()) {
            *out = left;
            return true;
        }
        // x + -y reads as x - y
        if (leading_minus(right)) {
            return left.operation(right.negated(), Operator::MINUS, config_, out, error);
        }
        break;
    case Operator::MINUS:
        if (right.is_exact_zero()) {
            *out = left;
            return true;
        }
        if (left.is_exact_zero()) {
            *out = right.negated();
            return true;
        }
        if (leading_minus(right)) {
            return left.operation(right.negated(), Operator::PLUS, config_, out, error);
        }
        break;
    case Operator::EXP:
        if (right.is_numeric_value(1)) {
            *out = left;
            return true;
        }
        if (right.is_exact_zero()) {
            *out = Term::one();
            return true;
        }
        break;
    default:
        break;
    }
    return left.operation(right, op, config_, out, error);
}

// ============================================================================
// Calls
// ============================================================================

bool Evaluator::eval_call(const AstNode* node, Term* out, CalcError* error) {
    FunctionRef fn = context_->lookup_function(node->name);
    if (fn) return call_user(*fn, node, out, error);

    if (!Context::is_native(node->name)) {
        return err_setf(error, ERR_UNDEFINED_FUNCTION, node->column, "Function not found: %s",
                        node->name.c_str());
    }
    std::vector<Term> args;
    args.reserve(node->items.size());
    for (const AstPtr& item : node->items) {
        Term value;
        if (!evaluate(item.get(), &value, error)) return false;
        args.push_back(value);
    }
    if (!context_->call_native(node->name, args, config_, out, error)) {
        if (error && error->column == 0) error->column = node->column;
        return false;
    }
    return true;
}

bool Evaluator::call_user(const FunctionDefinition& fn, const AstNode* node, Term* out, CalcError* error) {
    if (node->items.size() != fn.params.size()) {
        return err_setf(error, ERR_ARGUMENT_COUNT_MISMATCH, node->column, "%s expects %zu argument%s, got %zu",
                        fn.name.c_str(), fn.params.size(), fn.params.size() == 1 ? "" : "s",
                        node->items.size());
    }
    if (call_depth_ >= SYMCALC_MAX_CALL_DEPTH) {
        return err_setf(error, ERR_OVERFLOW, node->column, "call depth limit %d reached in %s",
                        SYMCALC_MAX_CALL_DEPTH, fn.name.c_str());
    }

    // arguments are evaluated in the caller's scope
    Context scope(context_);
    for (size_t i = 0; i < fn.params.size(); i++) {
        Term value;
        if (!evaluate(node->items[i].get(), &value, error)) return false;
        scope.bind(fn.params[i], value);
    }

    Evaluator inner(&scope, config_, call_depth_ + 1);
    if (!inner.evaluate(fn.body.get(), out, error)) return false;
    if (inner.config_.precision > config_.precision) config_.precision = inner.config_.precision;
    return true;
}

void raise_precision_for_literals(const AstNode* node, EvalConfig* config) {
    if (!node) return;
    if (node->is_literal() && node->column > 0) {
        int digits = node->value.digits();
        if (digits > SYMCALC_MAX_PRECISION) digits = SYMCALC_MAX_PRECISION;
        if (digits > config->precision) config->precision = digits;
    }
    raise_precision_for_literals(node->left.get(), config);
    raise_precision_for_literals(node->right.get(), config);
    raise_precision_for_literals(node->body.get(), config);
    for (const AstPtr& item : node->items) raise_precision_for_literals(item.get(), config);
}

} // namespace symcalc
