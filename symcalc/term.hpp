// term.hpp - Evaluation result: exact number or symbolic text
//
// A Term is either Numeric (an exact Decimal) or Symbolic (expression text
// that still contains free variables). Exactly one representation is
// authoritative; the kind tag says which.
//
// The text helpers below work on rendered expression text and are shared by
// the evaluator and the calculus engine when they build symbolic results.

#ifndef SYMCALC_TERM_HPP
#define SYMCALC_TERM_HPP

#include "calc_error.hpp"
#include "config.hpp"
#include "decimal.hpp"
#include "operator.hpp"
#include <cstdint>
#include <string>

namespace symcalc {

// ============================================================================
// Term
// ============================================================================

class Term {
public:
    enum class Kind : uint8_t {
        NUMERIC,
        SYMBOLIC,
    };

    Term();     // numeric zero

    static Term numeric(const Decimal& value);
    static Term symbolic(const std::string& text);
    // Numeric when text (minus redundant parentheses) is a plain number
    static Term from_text(const std::string& text);
    static Term zero() { return Term(); }
    static Term one();

    Kind kind() const { return kind_; }
    bool is_numeric() const { return kind_ == Kind::NUMERIC; }
    bool is_symbolic() const { return kind_ == Kind::SYMBOLIC; }
    const Decimal& value() const { return value_; }
    const std::string& text() const { return text_; }

    // Symbolic text, or the decimal in plain notation
    std::string to_string() const;
    // Like to_string, numbers rounded to precision significant digits
    std::string render_normalized(int precision) const;

    bool is_exact_zero() const { return is_numeric() && value_.is_zero(); }
    bool is_numeric_value(int64_t v) const;

    // NEGATIVE when a '-' appears in the rendered text before the first digit
    UnarySign sign() const;
    // First character that is not a digit, '.', operator or parenthesis;
    // empty when there is none
    std::string find_variable() const;
    bool has_variable() const { return !find_variable().empty(); }
    // Operand following the first '^' ("x^3" -> "3", "x^(n+1)" -> "(n+1)"),
    // "1" when the text has no '^'
    std::string find_exponent() const;

    // Wrap in one pair of parentheses unless already wrapped
    Term parenthesized() const;
    // Always add a pair
    Term force_parenthesized() const;
    // Remove redundant enclosing pairs
    Term strip_parentheses() const;
    Term negated() const;

    // Combine with rhs. Both numeric: exact decimal arithmetic at the
    // working precision; comparisons give 1 or 0. Otherwise the operator
    // is written between the two texts, parenthesizing operands as needed.
    bool operation(const Term& rhs, Operator op, const EvalConfig& config, Term* out,
                   CalcError* error) const;

private:
    Kind kind_;
    Decimal value_;
    std::string text_;
};

// ============================================================================
// Text helpers
// ============================================================================

// True when the whole text is enclosed by one matching pair: "(x+1)" but not "(x)+(y)"
bool text_is_wrapped(const std::string& text);
std::string text_strip_parens(const std::string& text);
std::string text_wrap(const std::string& text);

// Lowest operator precedence at parenthesis depth 0. Implicit products
// count as multiplication, a leading sign as unary. 6 when there is none.
int text_precedence(const std::string& text);

// left op right with operands parenthesized where precedence requires
std::string text_combine(const std::string& left, Operator op, const std::string& right);
// Product written as implicit multiplication where it reparses (2x, 3(x+1))
std::string text_product(const std::string& left, const std::string& right);
// "-" prefixed, parenthesizing when needed
std::string text_negate(const std::string& text);

// Split a product with a leading number: "2x^2" -> 2, "x^2"; "3*sin(x)" ->
// 3, "sin(x)". False when the text is not such a product.
bool text_split_coefficient(const std::string& text, Decimal* coef, std::string* rest);

// Plain number such as "12", "-0.5"
bool text_is_number(const std::string& text, Decimal* out);

// Round every numeric literal in text to precision significant digits;
// digits inside names ("_f12") are left alone
std::string text_round_numbers(const std::string& text, int precision);

} // namespace symcalc

#endif // SYMCALC_TERM_HPP
