// symcalc.hpp - Session: the public entry point of the engine
//
// A Session owns the root Context (user functions) and the default
// EvalConfig. Every request copies the config, so a long literal in one
// expression never changes the precision of the next.
//
//   Session s;
//   Term t;
//   CalcError err;
//   s.evaluate("f(x,y)=x^2+y", &t, &err);   // stored, echoed back
//   s.evaluate("f(2,3)", &t, &err);         // 7
//   s.differentiate("x^2", "x", &t, &err);  // 2x

#ifndef SYMCALC_SYMCALC_HPP
#define SYMCALC_SYMCALC_HPP

#include "ast.hpp"
#include "calc_error.hpp"
#include "config.hpp"
#include "context.hpp"
#include "matrix.hpp"
#include "term.hpp"
#include <string>
#include <vector>

namespace symcalc {

class Session {
public:
    Session();
    explicit Session(const EvalConfig& config);

    const EvalConfig& config() const { return config_; }
    Context* context() { return &context_; }

    AstPtr parse(const std::string& text, CalcError* error) const;

    // Empty input gives 0. A definition is stored and its normalized text
    // returned as a symbolic term.
    bool evaluate(const std::string& text, Term* out, CalcError* error);
    bool evaluate(const AstNode* node, Term* out, CalcError* error);

    FunctionRef define_function(const std::string& text, CalcError* error);

    bool differentiate(const std::string& text, const std::string& var, Term* out, CalcError* error);
    bool integrate(const std::string& text, const std::string& var, Term* out, CalcError* error);
    // fold + factor, rendered
    bool simplify(const std::string& text, Term* out, CalcError* error);
    bool find_roots(const std::string& text, const std::vector<std::string>& vars,
                    std::vector<Decimal>* roots, CalcError* error);

    // ─── Configuration ───
    bool set_precision(int digits, CalcError* error);
    void set_angle_mode(AngleMode mode);
    bool configure(const std::string& text, CalcError* error);

    // ─── Matrices ───
    bool parse_matrix(const std::string& text, Matrix* out, CalcError* error);
    Matrix row_reduce(const Matrix& m) const;
    Matrix echelon(const Matrix& m) const;
    bool determinant(const Matrix& m, Term* out, CalcError* error) const;
    bool inverse(const Matrix& m, Matrix* out, CalcError* error) const;
    bool multiply(const Matrix& a, const Matrix& b, Matrix* out, CalcError* error) const;
    Matrix transpose(const Matrix& m) const;
    bool characteristic_polynomial(const Matrix& m, Term* out, CalcError* error) const;

private:
    Context context_;
    EvalConfig config_;

    // e, pi, E, PI replaced by literals (parameters of a definition shadow them)
    AstPtr substitute_constants(const AstNode* node) const;
    Term normalize(const Term& term, int precision) const;
};

// Trim and check for whitespace-only input
bool text_is_blank(const std::string& text);

} // namespace symcalc

#endif // SYMCALC_SYMCALC_HPP
