// calculus.cpp - Symbolic derivative, integral, root finding and series

#include "calculus.hpp"
#include "parser.hpp"
#include "../lib/log.h"
#include <algorithm>
#include <cmath>

namespace symcalc {

// relative step below which Newton iteration counts as converged
#define ROOT_STEP_EPSILON 1e-12
// Newton restarts are only tried from probes inside this range
#define ROOT_RESTART_RANGE 1024.0
// significant digits reported for a root found in double precision
#define ROOT_DIGITS 12

Calculus::Calculus(Context* context, const EvalConfig& config)
    : context_(context), config_(config), evaluator_(context, config) {}

bool Calculus::depends(const AstNode* node) const {
    return ast_contains_variable(node, wrt_);
}

bool Calculus::value_of(const AstNode* node, Term* out, CalcError* error) {
    return evaluator_.evaluate(node, out, error);
}

bool Calculus::combine(const Term& left, Operator op, const Term& right, Term* out, CalcError* error) {
    return evaluator_.combine_terms(left, op, right, out, error);
}

AstPtr Calculus::inline_call(const FunctionDefinition& fn, const AstNode* call, CalcError* error) {
    if (call->items.size() != fn.params.size()) {
        err_setf(error, ERR_ARGUMENT_COUNT_MISMATCH, call->column, "%s expects %zu arguments, got %zu",
                 fn.name.c_str(), fn.params.size(), call->items.size());
        return nullptr;
    }
    AstBindings bindings;
    for (size_t i = 0; i < fn.params.size(); i++) bindings[fn.params[i]] = call->items[i].get();
    return ast_substitute(fn.body.get(), bindings);
}

// ============================================================================
// Derivative
// ============================================================================

bool Calculus::derivative(const AstNode* node, const std::string& wrt, Term* out, CalcError* error) {
    wrt_ = wrt;
    Term result;
    if (!diff(node, &result, error)) return false;
    *out = result.strip_parentheses();
    log_debug("calculus: d/d%s %s = %s", wrt.c_str(), ast_render(node).c_str(), out->to_string().c_str());
    return true;
}

bool Calculus::diff(const AstNode* node, Term* out, CalcError* error) {
    switch (node->type) {
    case AstNodeType::LITERAL:
    case AstNodeType::SPACE:
        *out = Term::zero();
        return true;
    case AstNodeType::VARIABLE:
        *out = node->name == wrt_ ? Term::one() : Term::zero();
        return true;
    case AstNodeType::UNARY: {
        Term inner;
        if (!diff(node->body.get(), &inner, error)) return false;
        *out = node->sign == UnarySign::NEGATIVE ? inner.negated() : inner;
        return true;
    }
    case AstNodeType::BINARY:
        switch (node->op) {
        case Operator::PLUS:
        case Operator::MINUS: {
            Term dl, dr;
            if (!diff(node->left.get(), &dl, error)) return false;
            if (!diff(node->right.get(), &dr, error)) return false;
            return combine(dl, node->op, dr, out, error);
        }
        case Operator::MULT:
            return diff_product(node, out, error);
        case Operator::DIV:
            return diff_quotient(node, out, error);
        case Operator::EXP:
            return diff_power(node, out, error);
        default:
            return err_setf(error, ERR_INVALID_OPERATION, node->column, "cannot differentiate '%s'",
                            operator_symbol(node->op));
        }
    case AstNodeType::CALL:
        return diff_call(node, out, error);
    case AstNodeType::FUNCTION_DEF:
    case AstNodeType::MATRIX:
    case AstNodeType::VECTOR:
        break;
    }
    return err_setf(error, ERR_TYPE_MISMATCH, node->column, "cannot differentiate a %s",
                    ast_node_type_name(node->type));
}

bool Calculus::diff_product(const AstNode* node, Term* out, CalcError* error) {
    bool left_var = depends(node->left.get());
    bool right_var = depends(node->right.get());
    if (!left_var && !right_var) {
        *out = Term::zero();
        return true;
    }

    Term vl, vr, dl, dr;
    if (!left_var) {
        if (!value_of(node->left.get(), &vl, error)) return false;
        if (!diff(node->right.get(), &dr, error)) return false;
        return combine(vl, Operator::MULT, dr, out, error);
    }
    if (!right_var) {
        if (!diff(node->left.get(), &dl, error)) return false;
        if (!value_of(node->right.get(), &vr, error)) return false;
        return combine(dl, Operator::MULT, vr, out, error);
    }

    if (!value_of(node->left.get(), &vl, error)) return false;
    if (!value_of(node->right.get(), &vr, error)) return false;
    if (!diff(node->left.get(), &dl, error)) return false;
    if (!diff(node->right.get(), &dr, error)) return false;
    Term a, b;
    if (!combine(dl, Operator::MULT, vr, &a, error)) return false;
    if (!combine(vl, Operator::MULT, dr, &b, error)) return false;
    return combine(a, Operator::PLUS, b, out, error);
}

// (f'g - fg') / g^2
bool Calculus::diff_quotient(const AstNode* node, Term* out, CalcError* error) {
    bool left_var = depends(node->left.get());
    bool right_var = depends(node->right.get());
    if (!left_var && !right_var) {
        *out = Term::zero();
        return true;
    }

    Term vl, vr, dl, dr;
    if (!value_of(node->right.get(), &vr, error)) return false;
    if (!diff(node->left.get(), &dl, error)) return false;
    if (!right_var) return combine(dl, Operator::DIV, vr, out, error);

    if (!value_of(node->left.get(), &vl, error)) return false;
    if (!diff(node->right.get(), &dr, error)) return false;
    Term a, b, num, den;
    if (!combine(dl, Operator::MULT, vr, &a, error)) return false;
    if (!combine(vl, Operator::MULT, dr, &b, error)) return false;
    if (!combine(a, Operator::MINUS, b, &num, error)) return false;
    if (!combine(vr, Operator::EXP, Term::numeric(Decimal::from_int(2)), &den, error)) return false;
    return combine(num, Operator::DIV, den, out, error);
}

bool Calculus::diff_power(const AstNode* node, Term* out, CalcError* error) {
    const AstNode* base = node->left.get();
    const AstNode* exponent = node->right.get();
    bool base_var = depends(base);
    bool exp_var = depends(exponent);
    if (!base_var && !exp_var) {
        *out = Term::zero();
        return true;
    }

    if (base_var && !exp_var) {
        // n * u^(n-1) * u'
        Term n, reduced, vb, powered, db, scaled;
        if (!value_of(exponent, &n, error)) return false;
        if (!combine(n, Operator::MINUS, Term::one(), &reduced, error)) return false;
        if (!value_of(base, &vb, error)) return false;
        if (!combine(vb, Operator::EXP, reduced, &powered, error)) return false;
        if (!diff(base, &db, error)) return false;
        if (!combine(n, Operator::MULT, powered, &scaled, error)) return false;
        return combine(scaled, Operator::MULT, db, out, error);
    }

    if (!base_var && exp_var) {
        // a^u * ln(a) * u'
        Term value, ln_base, du, scaled;
        if (!value_of(node, &value, error)) return false;
        if (base->is_variable() && (base->name == "e" || base->name == "E")) {
            ln_base = Term::one();
        } else {
            std::vector<AstPtr> args;
            args.push_back(ast_clone(base));
            AstPtr ln_call = make_call("ln", std::move(args));
            if (!value_of(ln_call.get(), &ln_base, error)) return false;
        }
        if (!diff(exponent, &du, error)) return false;
        if (!combine(value, Operator::MULT, ln_base, &scaled, error)) return false;
        return combine(scaled, Operator::MULT, du, out, error);
    }

    return err_setf(error, ERR_NOT_IMPLEMENTED, node->column,
                    "no rule for a power with %s in both base and exponent", wrt_.c_str());
}

bool Calculus::diff_call(const AstNode* node, Term* out, CalcError* error) {
    FunctionRef fn = context_->lookup_function(node->name);
    if (fn) {
        AstPtr inlined = inline_call(*fn, node, error);
        if (!inlined) return false;
        return diff(inlined.get(), out, error);
    }

    const NativeFunction* native = native_lookup(node->name);
    if (!native) {
        return err_setf(error, ERR_UNDEFINED_FUNCTION, node->column, "Function not found: %s",
                        node->name.c_str());
    }
    if (!depends(node)) {
        *out = Term::zero();
        return true;
    }
    if (!native->derivative) {
        return err_setf(error, ERR_NOT_IMPLEMENTED, node->column, "no derivative rule for %s",
                        node->name.c_str());
    }
    if (node->items.size() != 1) {
        return err_setf(error, ERR_ARGUMENT_COUNT_MISMATCH, node->column, "%s expects 1 argument, got %zu",
                        node->name.c_str(), node->items.size());
    }

    // rule for name(x) with x replaced by the argument, times the inner derivative
    AstPtr rule = parse_expression(native->derivative, error);
    if (!rule) return false;
    AstBindings bindings;
    bindings["x"] = node->items[0].get();
    AstPtr applied = ast_substitute(rule.get(), bindings);

    Term outer, inner;
    if (!value_of(applied.get(), &outer, error)) return false;
    if (!diff(node->items[0].get(), &inner, error)) return false;
    if (config_.angle_mode == AngleMode::DEGREES &&
        (native->kind == NativeKind::TRIG || native->kind == NativeKind::INVERSE_TRIG)) {
        // derivative rules assume radians
        Decimal pi, factor;
        if (!context_->lookup_constant("pi", &pi)) {
            return err_set(error, ERR_INTERNAL_ERROR, node->column, "pi is not defined");
        }
        Decimal half_turn = Decimal::from_int(180);
        DecimalStatus st = native->kind == NativeKind::TRIG
            ? Decimal::div(pi, half_turn, config_.working_precision(), &factor)
            : Decimal::div(half_turn, pi, config_.working_precision(), &factor);
        if (st != DecimalStatus::OK) {
            return err_set(error, ERR_DECIMAL_FAILURE, node->column, "angle conversion failed");
        }
        Term scaled;
        if (!combine(Term::numeric(factor), Operator::MULT, inner, &scaled, error)) return false;
        inner = scaled;
    }
    return combine(outer, Operator::MULT, inner, out, error);
}

// ============================================================================
// Integral
// ============================================================================

bool Calculus::integrate(const AstNode* node, const std::string& wrt, Term* out, CalcError* error) {
    wrt_ = wrt;
    Term result;
    if (!integ(node, &result, error)) return false;
    *out = result.strip_parentheses();
    log_debug("calculus: integral of %s d%s = %s", ast_render(node).c_str(), wrt.c_str(),
              out->to_string().c_str());
    return true;
}

bool Calculus::integ(const AstNode* node, Term* out, CalcError* error) {
    Term var = Term::symbolic(wrt_);

    // c -> c*x
    if (!depends(node)) {
        Term value;
        if (!value_of(node, &value, error)) return false;
        return combine(value, Operator::MULT, var, out, error);
    }

    switch (node->type) {
    case AstNodeType::VARIABLE: {
        Term squared;
        Term two = Term::numeric(Decimal::from_int(2));
        if (!combine(var, Operator::EXP, two, &squared, error)) return false;
        return combine(squared, Operator::DIV, two, out, error);
    }
    case AstNodeType::UNARY: {
        Term inner;
        if (!integ(node->body.get(), &inner, error)) return false;
        *out = node->sign == UnarySign::NEGATIVE ? inner.negated() : inner;
        return true;
    }
    case AstNodeType::CALL: {
        FunctionRef fn = context_->lookup_function(node->name);
        if (!fn) break;
        AstPtr inlined = inline_call(*fn, node, error);
        if (!inlined) return false;
        return integ(inlined.get(), out, error);
    }
    case AstNodeType::BINARY:
        break;
    default:
        return err_setf(error, ERR_TYPE_MISMATCH, node->column, "cannot integrate a %s",
                        ast_node_type_name(node->type));
    }

    if (!node->is_binary()) {
        return err_setf(error, ERR_NOT_IMPLEMENTED, node->column, "no integration rule for %s",
                        node->name.c_str());
    }

    const AstNode* left = node->left.get();
    const AstNode* right = node->right.get();
    Term il, ir, vl, vr;
    switch (node->op) {
    case Operator::PLUS:
    case Operator::MINUS:
        if (!integ(left, &il, error)) return false;
        if (!integ(right, &ir, error)) return false;
        return combine(il, node->op, ir, out, error);

    case Operator::MULT:
        if (!depends(left)) {
            if (!value_of(left, &vl, error)) return false;
            if (!integ(right, &ir, error)) return false;
            return combine(vl, Operator::MULT, ir, out, error);
        }
        if (!depends(right)) {
            if (!integ(left, &il, error)) return false;
            if (!value_of(right, &vr, error)) return false;
            return combine(il, Operator::MULT, vr, out, error);
        }
        // both factors vary: integrated term by term, not by parts
        if (!integ(left, &il, error)) return false;
        if (!integ(right, &ir, error)) return false;
        return combine(il, Operator::MULT, ir, out, error);

    case Operator::DIV:
        if (!depends(right)) {
            if (!integ(left, &il, error)) return false;
            if (!value_of(right, &vr, error)) return false;
            return combine(il, Operator::DIV, vr, out, error);
        }
        if (!depends(left) && right->is_variable()) {
            if (!value_of(left, &vl, error)) return false;
            return combine(vl, Operator::MULT, Term::symbolic("ln(abs(" + wrt_ + "))"), out, error);
        }
        break;

    case Operator::EXP:
        if (left->is_variable() && !depends(right)) {
            Term n, raised, powered;
            if (!value_of(right, &n, error)) return false;
            if (n.is_numeric_value(-1)) {
                *out = Term::symbolic("ln(abs(" + wrt_ + "))");
                return true;
            }
            if (!combine(n, Operator::PLUS, Term::one(), &raised, error)) return false;
            if (!combine(var, Operator::EXP, raised, &powered, error)) return false;
            return combine(powered, Operator::DIV, raised, out, error);
        }
        break;

    default:
        break;
    }
    return err_setf(error, ERR_NOT_IMPLEMENTED, node->column, "no integration rule for %s",
                    ast_render(node).c_str());
}

// ============================================================================
// Roots
// ============================================================================

bool Calculus::sample(const RootSearch& search, const std::string& function, double x, double* out,
                      CalcError* error) {
    std::vector<AstPtr> args;
    args.push_back(make_literal(Decimal::from_double(x)));
    AstPtr call = make_call(function, std::move(args));
    Term value;
    if (!search.evaluator->evaluate(call.get(), &value, error)) return false;
    if (value.is_symbolic()) {
        return err_setf(error, ERR_UNDEFINED_VARIABLE, 0, "expression has free variables besides the unknown: %s",
                        value.to_string().c_str());
    }
    *out = value.value().to_double();
    if (!std::isfinite(*out)) return err_set(error, ERR_OVERFLOW, 0, "function value out of range");
    return true;
}

// Newton steps kept inside [lo, hi], bisecting when a step leaves it
bool Calculus::refine(const RootSearch& search, double lo, double hi, double flo, double* root,
                      CalcError* error) {
    double x = 0.5 * (lo + hi);
    for (int iter = 0; iter < config_.newton_max_iterations; iter++) {
        double fx;
        if (!sample(search, search.function, x, &fx, error)) return false;
        if (fx == 0.0) {
            *root = x;
            return true;
        }
        if ((fx < 0) == (flo < 0)) {
            lo = x;
            flo = fx;
        } else {
            hi = x;
        }

        double next = 0.5 * (lo + hi);
        double slope;
        CalcError slope_error;
        if (!search.slope_function.empty() &&
            sample(search, search.slope_function, x, &slope, &slope_error) && slope != 0.0) {
            double newton = x - fx / slope;
            if (newton > lo && newton < hi) next = newton;
        }
        double scale = std::max(1.0, std::fabs(x));
        bool settled = std::fabs(next - x) <= ROOT_STEP_EPSILON * scale || hi - lo <= ROOT_STEP_EPSILON * scale;
        if (std::fabs(fx) < config_.newton_tolerance && settled) {
            *root = next;
            return true;
        }
        x = next;
    }
    return err_setf(error, ERR_NOT_CONVERGED, 0, "no convergence in [%g, %g] after %d iterations", lo, hi,
                    config_.newton_max_iterations);
}

bool Calculus::newton_from(const RootSearch& search, double start, double* root, CalcError* error) {
    double x = start;
    for (int iter = 0; iter < config_.newton_max_iterations; iter++) {
        double fx, slope;
        if (!sample(search, search.function, x, &fx, error)) return false;
        if (!sample(search, search.slope_function, x, &slope, error)) return false;
        if (slope == 0.0) {
            if (std::fabs(fx) < config_.newton_tolerance) {
                *root = x;
                return true;
            }
            return err_set(error, ERR_NOT_CONVERGED, 0, "flat slope");
        }
        double step = fx / slope;
        if (std::fabs(fx) < config_.newton_tolerance &&
            std::fabs(step) <= ROOT_STEP_EPSILON * std::max(1.0, std::fabs(x))) {
            *root = x - step;
            return true;
        }
        x -= step;
        if (!std::isfinite(x)) return err_set(error, ERR_NOT_CONVERGED, 0, "Newton step diverged");
    }
    return err_setf(error, ERR_NOT_CONVERGED, 0, "no convergence from %g", start);
}

static bool add_root(std::vector<double>* roots, double root) {
    for (double r : *roots) {
        if (std::fabs(r - root) < 1e-6 * std::max(1.0, std::fabs(root))) return false;
    }
    roots->push_back(root);
    return true;
}

bool Calculus::find_roots(const AstNode* node, const std::vector<std::string>& vars,
                          std::vector<Decimal>* result, CalcError* error) {
    if (vars.size() > 1) {
        return err_setf(error, ERR_INVALID_OPERATION, 0, "root finding takes one variable, got %zu",
                        vars.size());
    }
    std::string var = vars.empty() ? first_variable(node) : vars[0];
    if (var.empty()) return err_set(error, ERR_UNDEFINED_VARIABLE, node->column, "expression has no variable");

    // f and f' as helper functions in a private scope
    Context scope(context_);
    RootSearch search;
    search.function = scope.synthesize_name();
    std::vector<std::string> params(1, var);
    if (!scope.define_function(make_function_def(search.function, params, ast_clone(node)),
                               ast_render(node), error)) {
        return false;
    }
    Term slope;
    CalcError slope_error;
    if (derivative(node, var, &slope, &slope_error)) {
        AstPtr slope_tree = parse_expression(slope.to_string().c_str(), &slope_error);
        if (slope_tree) {
            search.slope_function = scope.synthesize_name();
            if (!scope.define_function(make_function_def(search.slope_function, params, std::move(slope_tree)),
                                       slope.to_string(), error)) {
                return false;
            }
        }
    }
    if (search.slope_function.empty()) {
        log_info("calculus: no derivative for root search (%s), bisecting only", slope_error.message.c_str());
    }
    Evaluator evaluator(&scope, config_);
    search.evaluator = &evaluator;

    int degree = polynomial_degree(node);

    // probes at 0, +-1, +-2, +-4, ...
    std::vector<double> probes;
    probes.push_back(0.0);
    double p = 1.0;
    for (int k = 0; k <= config_.bracket_max_doublings; k++) {
        probes.push_back(p);
        probes.push_back(-p);
        p *= 2.0;
    }
    std::sort(probes.begin(), probes.end());

    std::vector<double> values(probes.size());
    std::vector<bool> valid(probes.size(), false);
    for (size_t i = 0; i < probes.size(); i++) {
        CalcError probe_error;
        if (sample(search, search.function, probes[i], &values[i], &probe_error)) {
            valid[i] = true;
        } else if (probe_error.code == ERR_UNDEFINED_VARIABLE) {
            if (error) *error = probe_error;
            return false;
        }
    }

    std::vector<double> roots;
    for (size_t i = 0; i < probes.size() && (int)roots.size() < degree; i++) {
        if (valid[i] && values[i] == 0.0) add_root(&roots, probes[i]);
    }
    for (size_t i = 0; i + 1 < probes.size() && (int)roots.size() < degree; i++) {
        if (!valid[i] || !valid[i + 1]) continue;
        if ((values[i] < 0) == (values[i + 1] < 0) || values[i] == 0.0 || values[i + 1] == 0.0) continue;
        double root;
        CalcError refine_error;
        if (refine(search, probes[i], probes[i + 1], values[i], &root, &refine_error)) {
            add_root(&roots, root);
        } else {
            log_debug("calculus: bracket [%g, %g] skipped: %s", probes[i], probes[i + 1],
                      refine_error.message.c_str());
        }
    }

    // roots without a sign change (double roots, pairs inside one bracket)
    if ((int)roots.size() < degree && !search.slope_function.empty()) {
        for (size_t i = 0; i < probes.size() && (int)roots.size() < degree; i++) {
            if (std::fabs(probes[i]) > ROOT_RESTART_RANGE) continue;
            double root;
            CalcError newton_error;
            if (newton_from(search, probes[i] + 0.5, &root, &newton_error)) add_root(&roots, root);
        }
    }

    if (roots.empty()) {
        return err_setf(error, ERR_NOT_CONVERGED, node->column, "no real root of %s found",
                        ast_render(node).c_str());
    }
    std::sort(roots.begin(), roots.end());
    int digits = std::min(config_.precision, ROOT_DIGITS);
    result->clear();
    for (double r : roots) result->push_back(Decimal::from_double(r).round(digits));
    log_debug("calculus: %zu root(s) of %s (degree %d)", roots.size(), ast_render(node).c_str(), degree);
    return true;
}

// ============================================================================
// Series
// ============================================================================

bool Calculus::series_sum(const Term& expr, Term* out, CalcError* error) {
    if (expr.is_numeric()) {
        if (expr.is_exact_zero()) {
            *out = Term::zero();
            return true;
        }
        return err_setf(error, ERR_NOT_CONVERGED, 0, "series of constant %s diverges",
                        expr.to_string().c_str());
    }

    AstPtr tree = parse_expression(expr.to_string().c_str(), error);
    if (!tree) return false;
    std::string var = first_variable(tree.get());
    if (var.empty()) {
        return err_setf(error, ERR_UNDEFINED_VARIABLE, 0, "series %s has no index variable",
                        expr.to_string().c_str());
    }

    Context scope(context_);
    std::string name = scope.synthesize_name();
    std::vector<std::string> params(1, var);
    if (!scope.define_function(make_function_def(name, params, std::move(tree)), expr.to_string(), error)) {
        return false;
    }
    Evaluator evaluator(&scope, config_);
    int prec = config_.working_precision();
    Decimal epsilon = Decimal::from_double(config_.term_epsilon);
    Decimal total;

    for (int k = 0; k < config_.series_max_terms; k++) {
        std::vector<AstPtr> args;
        args.push_back(make_literal_int(k));
        AstPtr call = make_call(name, std::move(args));
        Term term;
        if (!evaluator.evaluate(call.get(), &term, error)) return false;
        if (term.is_symbolic()) {
            return err_setf(error, ERR_UNDEFINED_VARIABLE, 0, "series term %s has more than one variable",
                            term.to_string().c_str());
        }
        DecimalStatus st = Decimal::add(total, term.value(), prec, &total);
        if (st != DecimalStatus::OK) return err_set(error, ERR_OVERFLOW, 0, "series sum overflows");
        if (k >= 1 && term.value().abs().compare(epsilon) < 0) {
            log_debug("calculus: series %s converged after %d terms", expr.to_string().c_str(), k + 1);
            *out = Term::numeric(total);
            return true;
        }
    }
    return err_setf(error, ERR_NOT_CONVERGED, 0, "series %s did not converge in %d terms",
                    expr.to_string().c_str(), config_.series_max_terms);
}

// ============================================================================
// Tree queries
// ============================================================================

static void max_exponent(const AstNode* node, int* degree) {
    if (!node) return;
    if (node->is_binary(Operator::EXP) && !node->left->is_literal() && node->right->is_literal() &&
        node->right->value.is_integer()) {
        int64_t n;
        if (node->right->value.to_int64(&n) && n > *degree && n < 1000000) *degree = (int)n;
    }
    max_exponent(node->left.get(), degree);
    max_exponent(node->right.get(), degree);
    max_exponent(node->body.get(), degree);
    for (const AstPtr& item : node->items) max_exponent(item.get(), degree);
}

int polynomial_degree(const AstNode* node) {
    int degree = 1;
    max_exponent(node, &degree);
    return degree;
}

std::string first_variable(const AstNode* node) {
    if (!node) return "";
    if (node->is_variable()) return node->name;
    std::string name = first_variable(node->left.get());
    if (name.empty()) name = first_variable(node->right.get());
    if (name.empty()) name = first_variable(node->body.get());
    for (size_t i = 0; name.empty() && i < node->items.size(); i++) name = first_variable(node->items[i].get());
    return name;
}

} // namespace symcalc
