// simplifier.cpp - Additive folding and multiplicative factoring

#include "simplifier.hpp"
#include "../lib/log.h"

namespace symcalc {

Simplifier::Simplifier(const EvalConfig& config) : precision(config.working_precision()) {}

static bool is_additive(const AstNode* node) {
    return node->is_binary(Operator::PLUS) || node->is_binary(Operator::MINUS) || node->is_unary();
}

// coefficients stay far below the decimal range, so a failure only leaves
// the accumulator as it was
static void accumulate(Decimal* acc, const Decimal& value, bool subtract, int prec) {
    DecimalStatus st = subtract ? Decimal::sub(*acc, value, prec, acc) : Decimal::add(*acc, value, prec, acc);
    if (st != DecimalStatus::OK) log_warn("simplify: coefficient arithmetic failed (%d)", (int)st);
}

// True when evaluating node cannot report an error. Literals, variables and a
// variable raised to a literal qualify, and so do sums and products of them.
// Any other subtree is kept even when its coefficient becomes zero.
static bool cannot_fail(const AstNode* node) {
    switch (node->type) {
    case AstNodeType::LITERAL:
    case AstNodeType::VARIABLE:
        return true;
    case AstNodeType::UNARY:
        return cannot_fail(node->body.get());
    case AstNodeType::BINARY:
        if (node->op == Operator::PLUS || node->op == Operator::MINUS || node->op == Operator::MULT) {
            return cannot_fail(node->left.get()) && cannot_fail(node->right.get());
        }
        if (node->op == Operator::EXP) return node->left->is_variable() && node->right->is_literal();
        return false;
    default:
        return false;
    }
}

// 0 * node, kept as a product when node still has to be evaluated
static AstPtr zero_times(const AstNode* node) {
    if (cannot_fail(node)) return make_literal_int(0);
    return make_binary(Operator::MULT, make_literal_int(0), ast_clone(node), true);
}

static AstPtr negate_node(AstPtr node) {
    if (node->is_literal()) return make_literal(node->value.negate());
    return make_unary(UnarySign::NEGATIVE, std::move(node));
}

void Simplifier::collect_terms(const AstNode* node, bool negative, std::vector<SignedTerm>* terms) {
    if (node->is_binary(Operator::PLUS)) {
        collect_terms(node->left.get(), negative, terms);
        collect_terms(node->right.get(), negative, terms);
    } else if (node->is_binary(Operator::MINUS)) {
        collect_terms(node->left.get(), negative, terms);
        collect_terms(node->right.get(), !negative, terms);
    } else if (node->is_unary()) {
        collect_terms(node->body.get(), node->sign == UnarySign::NEGATIVE ? !negative : negative, terms);
    } else {
        terms->push_back({negative, node});
    }
}

AstPtr Simplifier::rewrite_children(const AstNode* node, Rewrite rewrite) {
    switch (node->type) {
    case AstNodeType::BINARY: {
        AstPtr copy = make_binary(node->op, (this->*rewrite)(node->left.get()),
                                  (this->*rewrite)(node->right.get()), node->attached);
        copy->column = node->column;
        return copy;
    }
    case AstNodeType::UNARY: {
        AstPtr copy = make_unary(node->sign, (this->*rewrite)(node->body.get()));
        copy->column = node->column;
        return copy;
    }
    case AstNodeType::CALL:
    case AstNodeType::VECTOR:
    case AstNodeType::MATRIX: {
        AstPtr copy = ast_clone(node);
        for (size_t i = 0; i < copy->items.size(); i++) {
            copy->items[i] = (this->*rewrite)(node->items[i].get());
        }
        return copy;
    }
    case AstNodeType::FUNCTION_DEF: {
        AstPtr copy = make_function_def(node->name, node->params, (this->*rewrite)(node->body.get()));
        copy->column = node->column;
        return copy;
    }
    default:
        return ast_clone(node);
    }
}

AstPtr Simplifier::build_sum(std::vector<std::pair<bool, AstPtr>> terms) {
    AstPtr result;
    for (auto& term : terms) {
        if (!result) {
            result = term.first ? negate_node(std::move(term.second)) : std::move(term.second);
        } else {
            result = make_binary(term.first ? Operator::MINUS : Operator::PLUS, std::move(result),
                                 std::move(term.second));
        }
    }
    if (!result) return make_literal_int(0);
    return result;
}

// ============================================================================
// Additive folding
// ============================================================================

AstPtr Simplifier::fold(const AstNode* node) {
    if (!node) return nullptr;
    if (!is_additive(node)) return rewrite_children(node, &Simplifier::fold);

    std::vector<SignedTerm> terms;
    collect_terms(node, false, &terms);

    struct Group {
        Decimal coef;
        AstPtr rest;
    };
    Decimal constant;
    std::vector<Group> groups;
    for (const SignedTerm& term : terms) {
        AstPtr leaf = rewrite_children(term.node, &Simplifier::fold);
        if (leaf->is_literal()) {
            accumulate(&constant, leaf->value, term.negative, precision);
            continue;
        }
        Decimal coef = Decimal::from_int(1);
        AstPtr rest;
        if (leaf->is_binary(Operator::MULT) && leaf->left->is_literal()) {
            coef = leaf->left->value;
            rest = std::move(leaf->right);
        } else {
            rest = std::move(leaf);
        }
        if (term.negative) coef = coef.negate();

        bool merged = false;
        for (Group& group : groups) {
            if (ast_equals(group.rest.get(), rest.get())) {
                accumulate(&group.coef, coef, false, precision);
                merged = true;
                break;
            }
        }
        if (!merged) groups.push_back({coef, std::move(rest)});
    }

    std::vector<std::pair<bool, AstPtr>> parts;
    for (Group& group : groups) {
        if (group.coef.is_zero()) {
            // a cancelled term that can fail still has to be evaluated
            if (!cannot_fail(group.rest.get())) {
                parts.emplace_back(false, zero_times(group.rest.get()));
            }
            continue;
        }
        bool negative = group.coef.is_negative();
        Decimal magnitude = group.coef.abs();
        if (magnitude == Decimal::from_int(1)) {
            parts.emplace_back(negative, std::move(group.rest));
        } else {
            parts.emplace_back(negative, make_binary(Operator::MULT, make_literal(magnitude),
                                                     std::move(group.rest), true));
        }
    }
    if (!constant.is_zero()) {
        parts.emplace_back(constant.is_negative(), make_literal(constant.abs()));
    }
    return build_sum(std::move(parts));
}

// ============================================================================
// Multiplicative factoring
// ============================================================================

AstPtr Simplifier::factor(const AstNode* node) {
    if (!node) return nullptr;
    if (node->is_binary(Operator::MULT)) return factor_product(node);
    AstPtr rewritten = rewrite_children(node, &Simplifier::factor);
    if (is_additive(node)) return fold(rewritten.get());
    return rewritten;
}

AstPtr Simplifier::factor_product(const AstNode* node) {
    AstPtr left = factor(node->left.get());
    AstPtr right = factor(node->right.get());

    std::vector<SignedTerm> left_terms, right_terms;
    collect_terms(left.get(), false, &left_terms);
    collect_terms(right.get(), false, &right_terms);

    std::vector<std::pair<bool, AstPtr>> products;
    for (const SignedTerm& a : left_terms) {
        for (const SignedTerm& b : right_terms) {
            products.emplace_back(a.negative != b.negative, multiply_pair(a.node, b.node));
        }
    }
    log_debug("simplify: expanded %zu x %zu terms", left_terms.size(), right_terms.size());
    AstPtr sum = build_sum(std::move(products));
    return fold(sum.get());
}

bool Simplifier::as_monomial(const AstNode* node, Monomial* out) {
    out->coef = Decimal::from_int(1);
    out->base = nullptr;
    out->exponent = nullptr;
    if (node->is_literal()) {
        out->coef = node->value;
        return true;
    }
    if (node->is_binary(Operator::MULT) && node->left->is_literal()) {
        out->coef = node->left->value;
        node = node->right.get();
    }
    if (node->is_variable()) {
        out->base = node;
        return true;
    }
    if (node->is_binary(Operator::EXP) && node->left->is_variable()) {
        out->base = node->left.get();
        out->exponent = node->right.get();
        return true;
    }
    return false;
}

static AstPtr power_of(const AstNode* base, const AstNode* exponent) {
    if (!exponent) return ast_clone(base);
    return make_binary(Operator::EXP, ast_clone(base), ast_clone(exponent));
}

AstPtr Simplifier::build_monomial(const Decimal& coef, AstPtr power) {
    if (coef.is_zero()) return make_literal_int(0);
    if (coef == Decimal::from_int(1)) return power;
    if (coef == Decimal::from_int(-1)) return make_unary(UnarySign::NEGATIVE, std::move(power));
    return make_binary(Operator::MULT, make_literal(coef), std::move(power), true);
}

AstPtr Simplifier::multiply_pair(const AstNode* a, const AstNode* b) {
    Monomial ma, mb;
    bool a_mono = as_monomial(a, &ma);
    bool b_mono = as_monomial(b, &mb);

    if (a_mono && b_mono) {
        Decimal coef;
        if (Decimal::mul(ma.coef, mb.coef, precision, &coef) != DecimalStatus::OK) {
            return make_binary(Operator::MULT, ast_clone(a), ast_clone(b));
        }
        if (coef.is_zero() && !(cannot_fail(a) && cannot_fail(b))) {
            return make_binary(Operator::MULT, ast_clone(a), ast_clone(b));
        }
        if (!ma.base && !mb.base) return make_literal(coef);
        if (!ma.base) return build_monomial(coef, power_of(mb.base, mb.exponent));
        if (!mb.base) return build_monomial(coef, power_of(ma.base, ma.exponent));
        if (ma.base->name == mb.base->name) {
            AstPtr sum = make_binary(Operator::PLUS,
                                     ma.exponent ? ast_clone(ma.exponent) : make_literal_int(1),
                                     mb.exponent ? ast_clone(mb.exponent) : make_literal_int(1));
            AstPtr exponent = fold(sum.get());
            if (exponent->is_literal() && exponent->value.is_zero()) return make_literal(coef);
            if (exponent->is_literal() && exponent->value == Decimal::from_int(1)) {
                return build_monomial(coef, ast_clone(ma.base));
            }
            return build_monomial(coef, make_binary(Operator::EXP, ast_clone(ma.base), std::move(exponent)));
        }
        return build_monomial(coef, make_binary(Operator::MULT, power_of(ma.base, ma.exponent),
                                                power_of(mb.base, mb.exponent)));
    }

    // a plain number on one side is a coefficient of the other
    if (a_mono && !ma.base) {
        if (ma.coef.is_zero()) return zero_times(b);
        if (ma.coef == Decimal::from_int(1)) return ast_clone(b);
        return make_binary(Operator::MULT, make_literal(ma.coef), ast_clone(b), true);
    }
    if (b_mono && !mb.base) {
        if (mb.coef.is_zero()) return zero_times(a);
        if (mb.coef == Decimal::from_int(1)) return ast_clone(a);
        return make_binary(Operator::MULT, make_literal(mb.coef), ast_clone(a), true);
    }
    return make_binary(Operator::MULT, ast_clone(a), ast_clone(b));
}

} // namespace symcalc
