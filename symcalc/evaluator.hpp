// evaluator.hpp - Dual-mode expression evaluator
//
// Walks an AST and produces a Term: an exact decimal when every operand is
// numeric, otherwise symbolic text. The evaluator holds its own copy of the
// configuration; a literal with more digits than the configured precision
// raises the precision of that copy only.

#ifndef SYMCALC_EVALUATOR_HPP
#define SYMCALC_EVALUATOR_HPP

#include "ast.hpp"
#include "calc_error.hpp"
#include "config.hpp"
#include "context.hpp"
#include "term.hpp"

namespace symcalc {

#define SYMCALC_MAX_CALL_DEPTH 256

class Evaluator {
public:
    Evaluator(Context* context, const EvalConfig& config);

    bool evaluate(const AstNode* node, Term* out, CalcError* error);

    // Combine two evaluated operands. Numeric coefficients of a symbolic
    // product are written first, and identities (x*1, x+0, x^1) are dropped.
    bool combine_terms(const Term& left, Operator op, const Term& right, Term* out, CalcError* error);

    Context* context() const { return context_; }
    const EvalConfig& config() const { return config_; }

private:
    Context* context_;
    EvalConfig config_;
    int call_depth_;

    Evaluator(Context* context, const EvalConfig& config, int call_depth);

    bool eval_literal(const AstNode* node, Term* out);
    bool eval_variable(const AstNode* node, Term* out);
    bool eval_unary(const AstNode* node, Term* out, CalcError* error);
    bool eval_binary(const AstNode* node, Term* out, CalcError* error);
    bool eval_call(const AstNode* node, Term* out, CalcError* error);
    bool call_user(const FunctionDefinition& fn, const AstNode* node, Term* out, CalcError* error);
    bool symbolic_product(const Term& left, const Term& right, Term* out);
};

// Raise config precision to the digit count of the longest literal in the
// tree, as evaluating each literal would. Lets rewrites that run before the
// evaluator (folding, factoring) use the same precision.
void raise_precision_for_literals(const AstNode* node, EvalConfig* config);

} // namespace symcalc

#endif // SYMCALC_EVALUATOR_HPP
