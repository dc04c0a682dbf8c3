// calculus.hpp - Symbolic derivative, integral, root finding and series
//
// derivative   structural rules over the AST (sum, product, quotient,
//              power, exponential, chain rule through the native table;
//              user functions are inlined first)
// integrate    power rule over sums, constant multiples and x^-1; products
//              of two variable factors are integrated term by term
// find_roots   bracket search over 0, +-1, +-2, +-4, ... then Newton steps
//              with a bisection fallback
// series_sum   sum of f(0), f(1), ... until a term drops below term_epsilon
//
// Every loop is bounded by the limits in EvalConfig; running out reports
// ERR_NOT_CONVERGED.

#ifndef SYMCALC_CALCULUS_HPP
#define SYMCALC_CALCULUS_HPP

#include "ast.hpp"
#include "calc_error.hpp"
#include "config.hpp"
#include "context.hpp"
#include "evaluator.hpp"
#include "term.hpp"
#include <string>
#include <vector>

namespace symcalc {

class Calculus {
public:
    Calculus(Context* context, const EvalConfig& config);

    bool derivative(const AstNode* node, const std::string& wrt, Term* out, CalcError* error);
    bool integrate(const AstNode* node, const std::string& wrt, Term* out, CalcError* error);

    // Real roots in ascending order. vars names the unknown; when empty the
    // first variable of the expression is used. At most one variable.
    bool find_roots(const AstNode* node, const std::vector<std::string>& vars,
                    std::vector<Decimal>* roots, CalcError* error);

    // Value of sum(expr) over the single free variable of expr
    bool series_sum(const Term& expr, Term* out, CalcError* error);

private:
    // helper functions synthesized for one root search
    struct RootSearch {
        Evaluator* evaluator;
        std::string function;
        std::string slope_function;     // empty without a derivative
    };

    Context* context_;
    EvalConfig config_;
    Evaluator evaluator_;
    std::string wrt_;

    bool depends(const AstNode* node) const;
    bool value_of(const AstNode* node, Term* out, CalcError* error);
    bool combine(const Term& left, Operator op, const Term& right, Term* out, CalcError* error);
    AstPtr inline_call(const FunctionDefinition& fn, const AstNode* call, CalcError* error);

    bool diff(const AstNode* node, Term* out, CalcError* error);
    bool diff_product(const AstNode* node, Term* out, CalcError* error);
    bool diff_quotient(const AstNode* node, Term* out, CalcError* error);
    bool diff_power(const AstNode* node, Term* out, CalcError* error);
    bool diff_call(const AstNode* node, Term* out, CalcError* error);

    bool integ(const AstNode* node, Term* out, CalcError* error);

    bool sample(const RootSearch& search, const std::string& function, double x, double* out,
                CalcError* error);
    bool refine(const RootSearch& search, double lo, double hi, double flo, double* root,
                CalcError* error);
    bool newton_from(const RootSearch& search, double start, double* root, CalcError* error);
};

// Highest integer literal exponent on a non-literal base, at least 1
int polynomial_degree(const AstNode* node);

// First variable name in left-to-right order, empty when there is none
std::string first_variable(const AstNode* node);

} // namespace symcalc

#endif // SYMCALC_CALCULUS_HPP
