// symcalc.cpp - Session facade

#include "symcalc.hpp"
#include "calculus.hpp"
#include "evaluator.hpp"
#include "parser.hpp"
#include "simplifier.hpp"
#include "../lib/log.h"
#include <algorithm>
#include <cctype>

namespace symcalc {

// digits a double-backed result can honestly show
#define DOUBLE_RESULT_DIGITS 15

bool text_is_blank(const std::string& text) {
    for (char c : text) {
        if (!isspace((unsigned char)c)) return false;
    }
    return true;
}

Session::Session() {}

Session::Session(const EvalConfig& config) : config_(config) {}

AstPtr Session::parse(const std::string& text, CalcError* error) const {
    return parse_expression(text.c_str(), error);
}

AstPtr Session::substitute_constants(const AstNode* node) const {
    std::vector<AstPtr> literals;
    AstBindings bindings;
    for (const auto& constant : context_.constants()) {
        literals.push_back(make_literal(constant.second.round(config_.working_precision())));
        bindings[constant.first] = literals.back().get();
    }
    return ast_substitute(node, bindings);
}

Term Session::normalize(const Term& term, int precision) const {
    if (term.is_numeric()) return Term::numeric(term.value().round(precision));
    return Term::from_text(text_round_numbers(term.strip_parentheses().text(), precision));
}

// ============================================================================
// Evaluation
// ============================================================================

bool Session::evaluate(const std::string& text, Term* out, CalcError* error) {
    if (text_is_blank(text)) {
        *out = Term::zero();
        return true;
    }
    AstPtr tree = parse(text, error);
    if (!tree) return false;
    if (tree->type == AstNodeType::FUNCTION_DEF) {
        std::string echo = ast_render(tree.get());
        AstPtr def = substitute_constants(tree.get());
        if (!context_.define_function(std::move(def), text, error)) return false;
        *out = Term::symbolic(echo);
        return true;
    }
    return evaluate(tree.get(), out, error);
}

bool Session::evaluate(const AstNode* node, Term* out, CalcError* error) {
    if (!node) return err_set(error, ERR_INTERNAL_ERROR, 0, "no expression to evaluate");
    if (node->type == AstNodeType::SPACE) {
        *out = Term::zero();
        return true;
    }
    if (node->type == AstNodeType::FUNCTION_DEF) {
        std::string echo = ast_render(node);
        if (!context_.define_function(substitute_constants(node), echo, error)) return false;
        *out = Term::symbolic(echo);
        return true;
    }

    EvalConfig request = config_;
    raise_precision_for_literals(node, &request);

    AstPtr prepared = substitute_constants(node);
    Simplifier simplifier(request);
    AstPtr factored = simplifier.factor(prepared.get());

    Evaluator evaluator(&context_, request);
    Term result;
    if (!evaluator.evaluate(factored.get(), &result, error)) return false;
    *out = normalize(result, evaluator.config().precision);
    log_debug("session: %s = %s", ast_render(node).c_str(), out->to_string().c_str());
    return true;
}

FunctionRef Session::define_function(const std::string& text, CalcError* error) {
    AstPtr def = parse_definition(text.c_str(), error);
    if (!def) return nullptr;
    return context_.define_function(substitute_constants(def.get()), text, error);
}

// ============================================================================
// Calculus
// ============================================================================

// parse an expression that must not be a definition
static AstPtr parse_operand(const Session& session, const std::string& text, const char* what,
                            CalcError* error) {
    if (text_is_blank(text)) {
        err_setf(error, ERR_MISSING_OPERAND, 0, "%s needs an expression", what);
        return nullptr;
    }
    AstPtr tree = session.parse(text, error);
    if (!tree) return nullptr;
    if (tree->type == AstNodeType::FUNCTION_DEF) {
        err_setf(error, ERR_INVALID_OPERATION, tree->column, "%s of a definition", what);
        return nullptr;
    }
    return tree;
}

bool Session::differentiate(const std::string& text, const std::string& var, Term* out, CalcError* error) {
    AstPtr tree = parse_operand(*this, text, "derivative", error);
    if (!tree) return false;
    std::string wrt = var.empty() ? first_variable(tree.get()) : var;
    if (wrt.empty()) {
        *out = Term::zero();
        return true;
    }
    Calculus calculus(&context_, config_);
    Term result;
    if (!calculus.derivative(tree.get(), wrt, &result, error)) return false;
    *out = normalize(result, config_.precision);
    return true;
}

bool Session::integrate(const std::string& text, const std::string& var, Term* out, CalcError* error) {
    AstPtr tree = parse_operand(*this, text, "integral", error);
    if (!tree) return false;
    std::string wrt = var.empty() ? first_variable(tree.get()) : var;
    if (wrt.empty()) wrt = "x";
    Calculus calculus(&context_, config_);
    Term result;
    if (!calculus.integrate(tree.get(), wrt, &result, error)) return false;
    *out = normalize(result, config_.precision);
    return true;
}

bool Session::simplify(const std::string& text, Term* out, CalcError* error) {
    AstPtr tree = parse_operand(*this, text, "simplify", error);
    if (!tree) return false;
    EvalConfig request = config_;
    raise_precision_for_literals(tree.get(), &request);
    Simplifier simplifier(request);
    AstPtr folded = simplifier.fold(tree.get());
    AstPtr factored = simplifier.factor(folded.get());
    *out = Term::from_text(ast_render(factored.get()));
    return true;
}

bool Session::find_roots(const std::string& text, const std::vector<std::string>& vars,
                         std::vector<Decimal>* roots, CalcError* error) {
    AstPtr tree = parse_operand(*this, text, "root search", error);
    if (!tree) return false;
    AstPtr prepared = substitute_constants(tree.get());
    Simplifier simplifier(config_);
    AstPtr factored = simplifier.factor(prepared.get());
    Calculus calculus(&context_, config_);
    return calculus.find_roots(factored.get(), vars, roots, error);
}

// ============================================================================
// Configuration
// ============================================================================

bool Session::set_precision(int digits, CalcError* error) {
    if (digits < SYMCALC_MIN_PRECISION || digits > SYMCALC_MAX_PRECISION) {
        return err_setf(error, ERR_INVALID_CONFIG, 0, "precision must be %d..%d, got %d",
                        SYMCALC_MIN_PRECISION, SYMCALC_MAX_PRECISION, digits);
    }
    config_.precision = digits;
    return true;
}

void Session::set_angle_mode(AngleMode mode) {
    config_.angle_mode = mode;
}

bool Session::configure(const std::string& text, CalcError* error) {
    return config_parse_string(text.c_str(), &config_, error);
}

// ============================================================================
// Matrices
// ============================================================================

bool Session::parse_matrix(const std::string& text, Matrix* out, CalcError* error) {
    // constants are visible to matrix entries through a private scope
    Context scope(&context_);
    for (const auto& constant : context_.constants()) {
        scope.bind(constant.first, Term::numeric(constant.second.round(config_.working_precision())));
    }
    return matrix_parse(text, &scope, config_, out, error);
}

Matrix Session::row_reduce(const Matrix& m) const {
    return matrix_rref(m, config_.matrix_epsilon);
}

Matrix Session::echelon(const Matrix& m) const {
    return matrix_echelon(m, config_.matrix_epsilon);
}

bool Session::determinant(const Matrix& m, Term* out, CalcError* error) const {
    double det;
    if (!matrix_determinant(m, config_.matrix_epsilon, &det, error)) return false;
    int digits = std::min(config_.precision, DOUBLE_RESULT_DIGITS);
    *out = Term::numeric(Decimal::from_double(det).round(digits));
    return true;
}

bool Session::inverse(const Matrix& m, Matrix* out, CalcError* error) const {
    return matrix_inverse(m, config_.matrix_epsilon, out, error);
}

bool Session::multiply(const Matrix& a, const Matrix& b, Matrix* out, CalcError* error) const {
    return matrix_multiply(a, b, out, error);
}

Matrix Session::transpose(const Matrix& m) const {
    return matrix_transpose(m);
}

bool Session::characteristic_polynomial(const Matrix& m, Term* out, CalcError* error) const {
    std::vector<double> coeffs;
    if (!matrix_characteristic_polynomial(m, &coeffs, error)) return false;
    *out = Term::from_text(polynomial_to_string(coeffs, "x", config_.display_places));
    return true;
}

} // namespace symcalc
