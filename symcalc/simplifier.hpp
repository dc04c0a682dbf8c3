// simplifier.hpp - Tree rewrites that keep the value of an expression
//
// fold    flattens +/- chains, sums the numeric leaves into one literal and
//         merges terms that differ only in their numeric coefficient
// factor  expands products of sums pairwise and combines powers of the
//         same base (x^a * x^b -> x^(a+b))
//
// Both return a new tree and leave shapes they do not handle unchanged.

#ifndef SYMCALC_SIMPLIFIER_HPP
#define SYMCALC_SIMPLIFIER_HPP

#include "ast.hpp"
#include "config.hpp"
#include <utility>
#include <vector>

namespace symcalc {

class Simplifier {
public:
    explicit Simplifier(const EvalConfig& config);

    AstPtr fold(const AstNode* node);
    AstPtr factor(const AstNode* node);

private:
    struct SignedTerm {
        bool negative;
        const AstNode* node;
    };

    // coefficient * rest; rest is null for a plain number
    struct Monomial {
        Decimal coef;
        const AstNode* base;
        const AstNode* exponent;    // null means 1
    };

    int precision;

    typedef AstPtr (Simplifier::*Rewrite)(const AstNode*);

    void collect_terms(const AstNode* node, bool negative, std::vector<SignedTerm>* terms);
    // Copy of node with rewrite applied to each child
    AstPtr rewrite_children(const AstNode* node, Rewrite rewrite);
    AstPtr factor_product(const AstNode* node);
    AstPtr multiply_pair(const AstNode* a, const AstNode* b);
    bool as_monomial(const AstNode* node, Monomial* out);
    AstPtr build_monomial(const Decimal& coef, AstPtr power);
    AstPtr build_sum(std::vector<std::pair<bool, AstPtr>> terms);
};

} // namespace symcalc

#endif // SYMCALC_SIMPLIFIER_HPP
