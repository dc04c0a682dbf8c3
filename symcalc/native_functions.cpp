// native_functions.cpp - Built-in functions
//
// Trigonometric natives work in double precision and honor the angle mode:
// forward functions scale their input, inverse functions scale their result.
// Algebraic natives use exact decimal arithmetic where the decimal library
// provides the operation.

#include "context.hpp"
#include "calculus.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>

namespace symcalc {

#define NATIVE_PI 3.14159265358979323846
// trig results below this are treated as exact zero (sin(pi) and friends)
#define TRIG_SNAP_EPSILON 1e-14
// ... unless the input itself is that small
#define TRIG_SNAP_MIN_INPUT 1e-7
// digits kept from a double result
#define DOUBLE_DIGITS 15
#define MAX_FACTORIAL 10000

// ============================================================================
// Helpers
// ============================================================================

static bool decimal_result(DecimalStatus status, const char* name, const Decimal& value, Term* out,
                           CalcError* error) {
    switch (status) {
    case DecimalStatus::OK:
        *out = Term::numeric(value);
        return true;
    case DecimalStatus::DIVISION_BY_ZERO:
        return err_setf(error, ERR_DIVISION_BY_ZERO, 0, "division by zero in %s", name);
    case DecimalStatus::INVALID:
        return err_setf(error, ERR_DOMAIN_ERROR, 0, "argument outside the domain of %s", name);
    case DecimalStatus::OVERFLOW:
        return err_setf(error, ERR_OVERFLOW, 0, "%s overflows", name);
    }
    return err_set(error, ERR_DECIMAL_FAILURE, 0, name);
}

static bool double_result(double value, const char* name, Term* out, CalcError* error) {
    if (std::isnan(value)) {
        return err_setf(error, ERR_DOMAIN_ERROR, 0, "argument outside the domain of %s", name);
    }
    if (std::isinf(value)) {
        return err_setf(error, ERR_OVERFLOW, 0, "%s overflows", name);
    }
    *out = Term::numeric(Decimal::from_double(value).round(DOUBLE_DIGITS));
    return true;
}

static double to_radians(double x, const EvalConfig& config) {
    return config.angle_mode == AngleMode::DEGREES ? x * NATIVE_PI / 180.0 : x;
}

static double from_radians(double x, const EvalConfig& config) {
    return config.angle_mode == AngleMode::DEGREES ? x * 180.0 / NATIVE_PI : x;
}

static double snap(double result, double input) {
    if (std::fabs(result) < TRIG_SNAP_EPSILON && std::fabs(input) >= TRIG_SNAP_MIN_INPUT) return 0.0;
    return result;
}

static bool require_integer(const Term& t, const char* name, int64_t* out, CalcError* error) {
    if (!t.value().is_integer() || !t.value().to_int64(out)) {
        return err_setf(error, ERR_DOMAIN_ERROR, 0, "%s needs integer arguments, got %s", name,
                        t.to_string().c_str());
    }
    return true;
}

// ============================================================================
// Trigonometric
// ============================================================================

// forward trig shares one shape: scale, apply, snap
typedef double (*trig_fn)(double);

static bool forward_trig(const char* name, trig_fn fn, const std::vector<Term>& args,
                         const EvalConfig& config, Term* out, CalcError* error) {
    double x = to_radians(args[0].value().to_double(), config);
    return double_result(snap(fn(x), x), name, out, error);
}

static bool reciprocal_trig(const char* name, trig_fn fn, const std::vector<Term>& args,
                            const EvalConfig& config, Term* out, CalcError* error) {
    double x = to_radians(args[0].value().to_double(), config);
    double d = snap(fn(x), x);
    if (d == 0.0) return err_setf(error, ERR_DIVISION_BY_ZERO, 0, "%s is undefined here", name);
    return double_result(1.0 / d, name, out, error);
}

static bool native_sin(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    return forward_trig("sin", std::sin, args, config, out, error);
}

static bool native_cos(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    return forward_trig("cos", std::cos, args, config, out, error);
}

static bool native_tan(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    double x = to_radians(args[0].value().to_double(), config);
    double c = snap(std::cos(x), x);
    if (c == 0.0) return err_set(error, ERR_DOMAIN_ERROR, 0, "tan is undefined here");
    return double_result(snap(std::sin(x), x) / c, "tan", out, error);
}

static bool native_cot(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    double x = to_radians(args[0].value().to_double(), config);
    double s = snap(std::sin(x), x);
    if (s == 0.0) return err_set(error, ERR_DIVISION_BY_ZERO, 0, "cot is undefined here");
    return double_result(snap(std::cos(x), x) / s, "cot", out, error);
}

static bool native_sec(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    return reciprocal_trig("sec", std::cos, args, config, out, error);
}

static bool native_csc(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    return reciprocal_trig("csc", std::sin, args, config, out, error);
}

// hyperbolic functions take plain numbers, no angle scaling
static bool native_sinh(Context*, const std::vector<Term>& args, const EvalConfig&, Term* out,
                        CalcError* error) {
    return double_result(std::sinh(args[0].value().to_double()), "sinh", out, error);
}

static bool native_cosh(Context*, const std::vector<Term>& args, const EvalConfig&, Term* out,
                        CalcError* error) {
    return double_result(std::cosh(args[0].value().to_double()), "cosh", out, error);
}

static bool native_tanh(Context*, const std::vector<Term>& args, const EvalConfig&, Term* out,
                        CalcError* error) {
    return double_result(std::tanh(args[0].value().to_double()), "tanh", out, error);
}

static bool native_arcsin(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                          CalcError* error) {
    double x = args[0].value().to_double();
    if (x < -1.0 || x > 1.0) return err_set(error, ERR_DOMAIN_ERROR, 0, "arcsin needs -1 <= x <= 1");
    return double_result(from_radians(std::asin(x), config), "arcsin", out, error);
}

static bool native_arccos(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                          CalcError* error) {
    double x = args[0].value().to_double();
    if (x < -1.0 || x > 1.0) return err_set(error, ERR_DOMAIN_ERROR, 0, "arccos needs -1 <= x <= 1");
    return double_result(from_radians(std::acos(x), config), "arccos", out, error);
}

static bool native_arctan(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                          CalcError* error) {
    return double_result(from_radians(std::atan(args[0].value().to_double()), config), "arctan", out, error);
}

static bool native_arccot(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                          CalcError* error) {
    double x = args[0].value().to_double();
    return double_result(from_radians(NATIVE_PI / 2 - std::atan(x), config), "arccot", out, error);
}

static bool native_arcsec(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                          CalcError* error) {
    double x = args[0].value().to_double();
    if (x > -1.0 && x < 1.0) return err_set(error, ERR_DOMAIN_ERROR, 0, "arcsec needs |x| >= 1");
    return double_result(from_radians(std::acos(1.0 / x), config), "arcsec", out, error);
}

static bool native_arccsc(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                          CalcError* error) {
    double x = args[0].value().to_double();
    if (x > -1.0 && x < 1.0) return err_set(error, ERR_DOMAIN_ERROR, 0, "arccsc needs |x| >= 1");
    return double_result(from_radians(std::asin(1.0 / x), config), "arccsc", out, error);
}

// ============================================================================
// Algebraic
// ============================================================================

static bool native_cbrt(Context*, const std::vector<Term>& args, const EvalConfig&, Term* out,
                        CalcError* error) {
    return double_result(std::cbrt(args[0].value().to_double()), "cbrt", out, error);
}

static bool native_sqrt(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                        CalcError* error) {
    Decimal r;
    DecimalStatus st = Decimal::sqrt(args[0].value(), config.working_precision(), &r);
    return decimal_result(st, "sqrt", r, out, error);
}

static bool native_abs(Context*, const std::vector<Term>& args, const EvalConfig&, Term* out,
                       CalcError*) {
    *out = Term::numeric(args[0].value().abs());
    return true;
}

static bool native_ln(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                      CalcError* error) {
    Decimal r;
    DecimalStatus st = Decimal::ln(args[0].value(), config.working_precision(), &r);
    return decimal_result(st, "ln", r, out, error);
}

static bool native_log(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    int prec = config.working_precision();
    Decimal r;
    if (args.size() == 1) {
        return decimal_result(Decimal::log10(args[0].value(), prec, &r), "log", r, out, error);
    }
    Decimal base = args[1].value();
    if (base == Decimal::from_int(1)) {
        return err_set(error, ERR_DIVISION_BY_ZERO, 0, "log base 1 is undefined");
    }
    // extra digits so the quotient keeps the working precision
    Decimal num, den;
    DecimalStatus st = Decimal::ln(args[0].value(), prec + 5, &num);
    if (st != DecimalStatus::OK) return decimal_result(st, "log", r, out, error);
    st = Decimal::ln(base, prec + 5, &den);
    if (st != DecimalStatus::OK) return decimal_result(st, "log", r, out, error);
    st = Decimal::div(num, den, prec, &r);
    return decimal_result(st, "log", r, out, error);
}

static bool native_exp(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    Decimal r;
    DecimalStatus st = Decimal::exp(args[0].value(), config.working_precision(), &r);
    return decimal_result(st, "exp", r, out, error);
}

static bool factorial(int64_t n, int prec, Decimal* out, CalcError* error) {
    if (n < 0) return err_setf(error, ERR_DOMAIN_ERROR, 0, "factorial of negative number %lld", (long long)n);
    if (n > MAX_FACTORIAL) return err_setf(error, ERR_OVERFLOW, 0, "factorial of %lld is too large", (long long)n);
    Decimal r = Decimal::from_int(1);
    for (int64_t i = 2; i <= n; i++) {
        if (Decimal::mul(r, Decimal::from_int(i), prec, &r) != DecimalStatus::OK) {
            return err_setf(error, ERR_OVERFLOW, 0, "factorial of %lld is too large", (long long)n);
        }
    }
    *out = r;
    return true;
}

static bool native_fac(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    int64_t n;
    if (!require_integer(args[0], "fac", &n, error)) return false;
    Decimal r;
    if (!factorial(n, config.working_precision(), &r, error)) return false;
    *out = Term::numeric(r);
    return true;
}

// n! / (n-k)!
static bool native_perm(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                        CalcError* error) {
    int64_t n, k;
    if (!require_integer(args[0], "perm", &n, error)) return false;
    if (!require_integer(args[1], "perm", &k, error)) return false;
    if (k < 0 || k > n) return err_set(error, ERR_DOMAIN_ERROR, 0, "perm needs 0 <= k <= n");
    int prec = config.working_precision();
    Decimal num, den, r;
    if (!factorial(n, prec, &num, error)) return false;
    if (!factorial(n - k, prec, &den, error)) return false;
    return decimal_result(Decimal::div(num, den, prec, &r), "perm", r, out, error);
}

// n! / (k! (n-k)!)
static bool native_comb(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                        CalcError* error) {
    int64_t n, k;
    if (!require_integer(args[0], "comb", &n, error)) return false;
    if (!require_integer(args[1], "comb", &k, error)) return false;
    if (k < 0 || k > n) return err_set(error, ERR_DOMAIN_ERROR, 0, "comb needs 0 <= k <= n");
    int prec = config.working_precision();
    Decimal num, kf, rest, den, r;
    if (!factorial(n, prec, &num, error)) return false;
    if (!factorial(k, prec, &kf, error)) return false;
    if (!factorial(n - k, prec, &rest, error)) return false;
    if (Decimal::mul(kf, rest, prec, &den) != DecimalStatus::OK) {
        return err_set(error, ERR_OVERFLOW, 0, "comb overflows");
    }
    return decimal_result(Decimal::div(num, den, prec, &r), "comb", r, out, error);
}

static bool native_mod(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    Decimal r;
    DecimalStatus st = Decimal::rem(args[0].value(), args[1].value(), config.working_precision(), &r);
    return decimal_result(st, "mod", r, out, error);
}

static bool native_div(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    int prec = config.working_precision();
    Decimal rem, diff, r;
    DecimalStatus st = Decimal::rem(args[0].value(), args[1].value(), prec, &rem);
    if (st != DecimalStatus::OK) return decimal_result(st, "div", r, out, error);
    st = Decimal::sub(args[0].value(), rem, prec, &diff);
    if (st != DecimalStatus::OK) return decimal_result(st, "div", r, out, error);
    st = Decimal::div(diff, args[1].value(), prec, &r);
    return decimal_result(st, "div", r.trunc(), out, error);
}

// Euclid on the decimal values, so any integer magnitude works
static bool native_gcf(Context*, const std::vector<Term>& args, const EvalConfig& config, Term* out,
                       CalcError* error) {
    for (const Term& arg : args) {
        if (!arg.value().is_integer()) {
            return err_setf(error, ERR_DOMAIN_ERROR, 0, "gcf needs integer arguments, got %s",
                            arg.to_string().c_str());
        }
    }
    Decimal a = args[0].value().abs();
    Decimal b = args[1].value().abs();
    if (a.is_zero() && b.is_zero()) return err_set(error, ERR_DIVISION_BY_ZERO, 0, "gcf(0,0) is undefined");
    int prec = std::max(config.working_precision(), std::max(a.digits(), b.digits()) + 1);
    while (!b.is_zero()) {
        Decimal r;
        DecimalStatus st = Decimal::rem(a, b, prec, &r);
        if (st != DecimalStatus::OK) return decimal_result(st, "gcf", r, out, error);
        a = std::move(b);
        b = std::move(r);
    }
    *out = Term::numeric(a);
    return true;
}

static bool native_sum(Context* context, const std::vector<Term>& args, const EvalConfig& config,
                       Term* out, CalcError* error) {
    Calculus calculus(context, config);
    return calculus.series_sum(args[0], out, error);
}

// ============================================================================
// Registry
// ============================================================================

static const NativeFunction native_table[] = {
    // name     min max kind                       derivative of name(x)              impl
    {"sin",     1,  1,  NativeKind::TRIG,          "cos(x)",                          native_sin},
    {"cos",     1,  1,  NativeKind::TRIG,          "-sin(x)",                         native_cos},
    {"tan",     1,  1,  NativeKind::TRIG,          "sec(x)^2",                        native_tan},
    {"cot",     1,  1,  NativeKind::TRIG,          "-csc(x)^2",                       native_cot},
    {"sec",     1,  1,  NativeKind::TRIG,          "sec(x)*tan(x)",                   native_sec},
    {"csc",     1,  1,  NativeKind::TRIG,          "-csc(x)*cot(x)",                  native_csc},
    {"sinh",    1,  1,  NativeKind::HYPERBOLIC,    "cosh(x)",                         native_sinh},
    {"cosh",    1,  1,  NativeKind::HYPERBOLIC,    "sinh(x)",                         native_cosh},
    {"tanh",    1,  1,  NativeKind::HYPERBOLIC,    "1/cosh(x)^2",                     native_tanh},
    {"arcsin",  1,  1,  NativeKind::INVERSE_TRIG,  "1/sqrt(1-x^2)",                   native_arcsin},
    {"arccos",  1,  1,  NativeKind::INVERSE_TRIG,  "-1/sqrt(1-x^2)",                  native_arccos},
    {"arctan",  1,  1,  NativeKind::INVERSE_TRIG,  "1/(x^2+1)",                       native_arctan},
    {"arccot",  1,  1,  NativeKind::INVERSE_TRIG,  "-1/(x^2+1)",                      native_arccot},
    {"arcsec",  1,  1,  NativeKind::INVERSE_TRIG,  "1/(abs(x)*sqrt(x^2-1))",          native_arcsec},
    {"arccsc",  1,  1,  NativeKind::INVERSE_TRIG,  "-1/(abs(x)*sqrt(x^2-1))",         native_arccsc},
    {"asin",    1,  1,  NativeKind::INVERSE_TRIG,  "1/sqrt(1-x^2)",                   native_arcsin},
    {"acos",    1,  1,  NativeKind::INVERSE_TRIG,  "-1/sqrt(1-x^2)",                  native_arccos},
    {"atan",    1,  1,  NativeKind::INVERSE_TRIG,  "1/(x^2+1)",                       native_arctan},
    {"acot",    1,  1,  NativeKind::INVERSE_TRIG,  "-1/(x^2+1)",                      native_arccot},
    {"asec",    1,  1,  NativeKind::INVERSE_TRIG,  "1/(abs(x)*sqrt(x^2-1))",          native_arcsec},
    {"acsc",    1,  1,  NativeKind::INVERSE_TRIG,  "-1/(abs(x)*sqrt(x^2-1))",         native_arccsc},
    {"cbrt",    1,  1,  NativeKind::ALGEBRAIC,     NULL,                              native_cbrt},
    {"sqrt",    1,  1,  NativeKind::ALGEBRAIC,     NULL,                              native_sqrt},
    {"abs",     1,  1,  NativeKind::ALGEBRAIC,     NULL,                              native_abs},
    {"ln",      1,  1,  NativeKind::ALGEBRAIC,     NULL,                              native_ln},
    {"log",     1,  2,  NativeKind::ALGEBRAIC,     NULL,                              native_log},
    {"exp",     1,  1,  NativeKind::ALGEBRAIC,     NULL,                              native_exp},
    {"fac",     1,  1,  NativeKind::ALGEBRAIC,     NULL,                              native_fac},
    {"perm",    2,  2,  NativeKind::ALGEBRAIC,     NULL,                              native_perm},
    {"comb",    2,  2,  NativeKind::ALGEBRAIC,     NULL,                              native_comb},
    {"mod",     2,  2,  NativeKind::ALGEBRAIC,     NULL,                              native_mod},
    {"div",     2,  2,  NativeKind::ALGEBRAIC,     NULL,                              native_div},
    {"gcf",     2,  2,  NativeKind::ALGEBRAIC,     NULL,                              native_gcf},
    {"sum",     1,  1,  NativeKind::ALGEBRAIC,     NULL,                              native_sum},
};

#define NATIVE_COUNT (sizeof(native_table) / sizeof(native_table[0]))

const NativeFunction* native_lookup(const std::string& name) {
    for (size_t i = 0; i < NATIVE_COUNT; i++) {
        if (strcmp(native_table[i].name, name.c_str()) == 0) return &native_table[i];
    }
    return nullptr;
}

size_t native_count() {
    return NATIVE_COUNT;
}

const NativeFunction* native_at(size_t index) {
    return index < NATIVE_COUNT ? &native_table[index] : nullptr;
}

} // namespace symcalc
