// term.cpp - Evaluation result: exact number or symbolic text

#include "term.hpp"
#include <cctype>
#include <cstdlib>

namespace symcalc {

// repeated multiplication is used up to this exponent, decimal power beyond
#define SYMCALC_MAX_REPEATED_POWER 4096

#define TEXT_PREC_NONE 6

// ============================================================================
// Text helpers
// ============================================================================

// index of the bracket matching the one at open, or npos
static size_t match_bracket(const std::string& s, size_t open) {
    char o = s[open];
    char c = o == '(' ? ')' : ']';
    int depth = 0;
    for (size_t i = open; i < s.size(); i++) {
        if (s[i] == o) depth++;
        else if (s[i] == c) {
            depth--;
            if (depth == 0) return i;
        }
    }
    return std::string::npos;
}

bool text_is_wrapped(const std::string& text) {
    if (text.size() < 2 || text.front() != '(' || text.back() != ')') return false;
    return match_bracket(text, 0) == text.size() - 1;
}

std::string text_strip_parens(const std::string& text) {
    std::string s = text;
    while (text_is_wrapped(s)) s = s.substr(1, s.size() - 2);
    return s;
}

std::string text_wrap(const std::string& text) {
    return "(" + text + ")";
}

enum class TextItem : uint8_t { NONE, OPERATOR, NUMBER, NAME, CLOSE };

int text_precedence(const std::string& s) {
    int lowest = TEXT_PREC_NONE;
    TextItem prev = TextItem::NONE;
    size_t i = 0;
    while (i < s.size()) {
        char c = s[i];
        if (isspace((unsigned char)c)) {
            i++;
        } else if (c == '(' || c == '[') {
            if (prev == TextItem::NUMBER || prev == TextItem::CLOSE) {
                if (lowest > SYMCALC_PREC_MULTIPLY) lowest = SYMCALC_PREC_MULTIPLY;
            }
            size_t close = match_bracket(s, i);
            if (close == std::string::npos) return 0;
            i = close + 1;
            prev = TextItem::CLOSE;
        } else if (isalpha((unsigned char)c) || c == '_') {
            if (prev == TextItem::NUMBER || prev == TextItem::CLOSE) {
                if (lowest > SYMCALC_PREC_MULTIPLY) lowest = SYMCALC_PREC_MULTIPLY;
            }
            while (i < s.size() && (isalnum((unsigned char)s[i]) || s[i] == '_')) i++;
            prev = TextItem::NAME;
        } else if (isdigit((unsigned char)c) || c == '.') {
            if (prev == TextItem::CLOSE) {
                if (lowest > SYMCALC_PREC_MULTIPLY) lowest = SYMCALC_PREC_MULTIPLY;
            }
            while (i < s.size() && (isdigit((unsigned char)s[i]) || s[i] == '.')) i++;
            prev = TextItem::NUMBER;
        } else if (c == ',' || (c == '=' && !(i + 1 < s.size() && s[i + 1] == '='))) {
            lowest = 0;
            i++;
            prev = TextItem::OPERATOR;
        } else {
            Operator op;
            size_t used = operator_from_text(s.c_str() + i, s.size() - i, &op);
            if (used == 0) {
                i++;
                continue;
            }
            int p = operator_precedence(op);
            bool is_sign = (op == Operator::PLUS || op == Operator::MINUS) &&
                           (prev == TextItem::NONE || prev == TextItem::OPERATOR);
            if (is_sign) p = SYMCALC_PREC_UNARY;
            if (p < lowest) lowest = p;
            i += used;
            prev = TextItem::OPERATOR;
        }
    }
    return lowest;
}

// `*` can be dropped when the left side ends in a digit or `)` and the
// right side starts with a letter or `(`
static bool can_omit_star(const std::string& left, const std::string& right) {
    if (left.empty() || right.empty()) return false;
    char l = left.back(), r = right.front();
    return (isdigit((unsigned char)l) || l == ')') &&
           (isalpha((unsigned char)r) || r == '_' || r == '(');
}

std::string text_combine(const std::string& left, Operator op, const std::string& right) {
    int prec = operator_precedence(op);
    bool right_assoc = operator_is_right_assoc(op);
    int lp = text_precedence(left);
    int rp = text_precedence(right);
    std::string l = (lp < prec || (lp == prec && right_assoc)) ? text_wrap(left) : left;
    std::string r = (rp < prec || (rp == prec && !right_assoc)) ? text_wrap(right) : right;
    return l + operator_symbol(op) + r;
}

std::string text_product(const std::string& left, const std::string& right) {
    std::string l = text_precedence(left) < SYMCALC_PREC_MULTIPLY ? text_wrap(left) : left;
    std::string r = text_precedence(right) <= SYMCALC_PREC_MULTIPLY ? text_wrap(right) : right;
    if (can_omit_star(l, r)) return l + r;
    return l + "*" + r;
}

std::string text_negate(const std::string& text) {
    if (text.size() > 1 && text[0] == '-' && text_precedence(text.substr(1)) > SYMCALC_PREC_UNARY) {
        return text.substr(1);
    }
    if (text_precedence(text) <= SYMCALC_PREC_UNARY) return "-" + text_wrap(text);
    return "-" + text;
}

bool text_split_coefficient(const std::string& text, Decimal* coef, std::string* rest) {
    if (text_precedence(text) < SYMCALC_PREC_MULTIPLY) return false;
    size_t i = 0;
    while (i < text.size() && (isdigit((unsigned char)text[i]) || text[i] == '.')) i++;
    if (i == 0 || i >= text.size()) return false;
    size_t start = i;
    if (text[i] == '*') start++;
    else if (!isalpha((unsigned char)text[i]) && text[i] != '_' && text[i] != '(') return false;
    if (start >= text.size()) return false;
    std::string tail = text.substr(start);
    // "2^x" and "2/x" are not coefficient products
    if (text_precedence(tail) < SYMCALC_PREC_MULTIPLY) return false;
    if (!Decimal::parse(text.substr(0, i).c_str(), coef)) return false;
    *rest = tail;
    return true;
}

bool text_is_number(const std::string& text, Decimal* out) {
    std::string s = text_strip_parens(text);
    if (s.empty()) return false;
    size_t i = 0;
    if (s[0] == '-' || s[0] == '+') i = 1;
    if (i >= s.size()) return false;
    bool digit = false, point = false;
    for (; i < s.size(); i++) {
        if (isdigit((unsigned char)s[i])) digit = true;
        else if (s[i] == '.' && !point) point = true;
        else return false;
    }
    if (!digit) return false;
    Decimal value;
    if (!Decimal::parse(s.c_str(), &value)) return false;
    if (out) *out = value;
    return true;
}

std::string text_round_numbers(const std::string& text, int precision) {
    std::string out;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        bool in_name = i > 0 && (isalnum((unsigned char)text[i - 1]) || text[i - 1] == '_');
        if (!isdigit((unsigned char)c) || in_name) {
            out += c;
            i++;
            continue;
        }
        size_t end = i;
        while (end < text.size() && (isdigit((unsigned char)text[end]) || text[end] == '.')) end++;
        std::string literal = text.substr(i, end - i);
        Decimal value;
        if (Decimal::parse(literal.c_str(), &value) && value.digits() > precision) {
            out += value.round(precision).to_string();
        } else {
            out += literal;
        }
        i = end;
    }
    return out;
}

// ============================================================================
// Term
// ============================================================================

Term::Term() : kind_(Kind::NUMERIC) {}

Term Term::numeric(const Decimal& value) {
    Term t;
    t.kind_ = Kind::NUMERIC;
    t.value_ = value;
    return t;
}

Term Term::symbolic(const std::string& text) {
    Term t;
    t.kind_ = Kind::SYMBOLIC;
    t.text_ = text;
    return t;
}

Term Term::from_text(const std::string& text) {
    Decimal value;
    if (text_is_number(text, &value)) return numeric(value);
    std::string stripped = text_strip_parens(text);
    if (stripped.empty()) return Term();
    return symbolic(stripped);
}

Term Term::one() {
    return numeric(Decimal::from_int(1));
}

bool Term::is_numeric_value(int64_t v) const {
    return is_numeric() && value_ == Decimal::from_int(v);
}

std::string Term::to_string() const {
    switch (kind_) {
    case Kind::NUMERIC: return value_.to_string();
    case Kind::SYMBOLIC: return text_.empty() ? "0" : text_;
    }
    return "0";
}

std::string Term::render_normalized(int precision) const {
    if (kind_ == Kind::NUMERIC) return value_.round(precision).to_string();
    return text_round_numbers(text_, precision);
}

UnarySign Term::sign() const {
    std::string s = to_string();
    for (char c : s) {
        if (c == '-') return UnarySign::NEGATIVE;
        if (isdigit((unsigned char)c)) break;
    }
    return UnarySign::POSITIVE;
}

std::string Term::find_variable() const {
    if (kind_ == Kind::NUMERIC) return "";
    for (char c : text_) {
        if (isdigit((unsigned char)c) || c == '.' || c == '(' || c == ')' || c == '[' || c == ']' ||
            c == ',' || isspace((unsigned char)c) || is_operator_char(c)) {
            continue;
        }
        return std::string(1, c);
    }
    return "";
}

std::string Term::find_exponent() const {
    std::string s = to_string();
    size_t caret = s.find('^');
    if (caret == std::string::npos) return "1";
    size_t i = caret + 1;
    while (i < s.size() && isspace((unsigned char)s[i])) i++;
    if (i >= s.size()) return "1";
    size_t start = i;
    if (s[i] == '-' || s[i] == '+') i++;
    if (i < s.size() && s[i] == '(') {
        size_t close = match_bracket(s, i);
        if (close == std::string::npos) return "1";
        return s.substr(start, close + 1 - start);
    }
    if (i < s.size() && (isdigit((unsigned char)s[i]) || s[i] == '.')) {
        while (i < s.size() && (isdigit((unsigned char)s[i]) || s[i] == '.')) i++;
    } else {
        while (i < s.size() && (isalnum((unsigned char)s[i]) || s[i] == '_')) i++;
    }
    if (i == start) return "1";
    return s.substr(start, i - start);
}

Term Term::parenthesized() const {
    if (kind_ == Kind::NUMERIC) return *this;
    if (text_is_wrapped(text_)) return *this;
    return symbolic(text_wrap(text_));
}

Term Term::force_parenthesized() const {
    return symbolic(text_wrap(to_string()));
}

Term Term::strip_parentheses() const {
    if (kind_ == Kind::NUMERIC) return *this;
    return from_text(text_);
}

Term Term::negated() const {
    if (kind_ == Kind::NUMERIC) return numeric(value_.negate());
    return symbolic(text_negate(text_));
}

// ============================================================================
// Arithmetic
// ============================================================================

static bool check_status(DecimalStatus status, const char* what, CalcError* error) {
    switch (status) {
    case DecimalStatus::OK:
        return true;
    case DecimalStatus::DIVISION_BY_ZERO:
        return err_setf(error, ERR_DIVISION_BY_ZERO, 0, "division by zero in %s", what);
    case DecimalStatus::INVALID:
        return err_setf(error, ERR_DOMAIN_ERROR, 0, "%s has no real result", what);
    case DecimalStatus::OVERFLOW:
        return err_setf(error, ERR_OVERFLOW, 0, "%s overflows", what);
    }
    return err_set(error, ERR_DECIMAL_FAILURE, 0, what);
}

static bool numeric_power(const Decimal& base, const Decimal& exponent, int prec, Decimal* out,
                          CalcError* error) {
    int64_t n = 0;
    if (exponent.is_integer() && exponent.to_int64(&n) &&
        n <= SYMCALC_MAX_REPEATED_POWER && n >= -SYMCALC_MAX_REPEATED_POWER) {
        Decimal result = Decimal::from_int(1);
        int64_t count = n < 0 ? -n : n;
        for (int64_t i = 0; i < count; i++) {
            if (!check_status(Decimal::mul(result, base, prec, &result), "power", error)) return false;
        }
        if (n < 0) {
            if (!check_status(Decimal::div(Decimal::from_int(1), result, prec, &result), "power", error)) {
                return false;
            }
        }
        *out = result;
        return true;
    }
    return check_status(Decimal::pow(base, exponent, prec, out), "power", error);
}

bool Term::operation(const Term& rhs, Operator op, const EvalConfig& config, Term* out,
                     CalcError* error) const {
    if (is_symbolic() || rhs.is_symbolic()) {
        *out = symbolic(text_combine(to_string(), op, rhs.to_string()));
        return true;
    }

    int prec = config.working_precision();
    const Decimal& a = value_;
    const Decimal& b = rhs.value_;
    Decimal result;
    switch (op) {
    case Operator::PLUS:
    case Operator::PEQUAL:
        if (!check_status(Decimal::add(a, b, prec, &result), "addition", error)) return false;
        break;
    case Operator::MINUS:
        if (!check_status(Decimal::sub(a, b, prec, &result), "subtraction", error)) return false;
        break;
    case Operator::MULT:
        if (!check_status(Decimal::mul(a, b, prec, &result), "multiplication", error)) return false;
        break;
    case Operator::DIV:
        if (!check_status(Decimal::div(a, b, prec, &result), "division", error)) return false;
        break;
    case Operator::EXP:
        if (!numeric_power(a, b, prec, &result, error)) return false;
        break;
    case Operator::GT: result = Decimal::from_int(a.compare(b) > 0 ? 1 : 0); break;
    case Operator::LT: result = Decimal::from_int(a.compare(b) < 0 ? 1 : 0); break;
    case Operator::GTE: result = Decimal::from_int(a.compare(b) >= 0 ? 1 : 0); break;
    case Operator::LTE: result = Decimal::from_int(a.compare(b) <= 0 ? 1 : 0); break;
    case Operator::NEQ: result = Decimal::from_int(a.compare(b) != 0 ? 1 : 0); break;
    case Operator::EQUAL: result = Decimal::from_int(a.compare(b) == 0 ? 1 : 0); break;
    }
    *out = numeric(result);
    return true;
}

} // namespace symcalc
