// symcalc/decimal.cpp - Exact decimal values for symcalc
// =====================================================================
// This is the ONLY file that should include <mpdecimal.h>
// All other files should use the API declared in decimal.hpp

#include "decimal.hpp"
#include "../lib/log.h"
#include <mpdecimal.h>  // only included here
#include <cstdio>
#include <cstdlib>
#include <new>

namespace symcalc {

// ─────────────────────────────────────────────────────────────────────
// Contexts
// ─────────────────────────────────────────────────────────────────────

// Exact context for parsing, negation and trailing-zero removal
static const mpd_context_t* exact_context() {
    static mpd_context_t ctx;
    static bool initialized = false;
    if (!initialized) {
        mpd_maxcontext(&ctx);
        ctx.traps = 0;
        initialized = true;
    }
    return &ctx;
}

// Rounding context for one arithmetic step
static void make_context(mpd_context_t* ctx, int prec) {
    mpd_defaultcontext(ctx);
    if (prec < 1) prec = 1;
    if (prec > SYMCALC_DECIMAL_MAX_PRECISION) prec = SYMCALC_DECIMAL_MAX_PRECISION;
    mpd_qsetprec(ctx, prec);
    mpd_qsetround(ctx, MPD_ROUND_HALF_UP);
    mpd_qsettraps(ctx, 0);
}

static mpd_t* alloc_dec() {
    mpd_t* dec = mpd_qnew();
    if (!dec) {
        log_error("decimal: allocation failed");
        throw std::bad_alloc();
    }
    return dec;
}

static DecimalStatus status_of(uint32_t status, const mpd_t* result) {
    if (status & MPD_Malloc_error) {
        log_error("decimal: allocation failed during arithmetic");
        throw std::bad_alloc();
    }
    if (status & MPD_Division_by_zero) return DecimalStatus::DIVISION_BY_ZERO;
    if (status & (MPD_Invalid_operation | MPD_Division_undefined)) return DecimalStatus::INVALID;
    if (status & MPD_Overflow) return DecimalStatus::OVERFLOW;
    if (mpd_isnan(result)) return DecimalStatus::INVALID;
    if (mpd_isinfinite(result)) return DecimalStatus::OVERFLOW;
    return DecimalStatus::OK;
}

// ─────────────────────────────────────────────────────────────────────
// Lifetime
// ─────────────────────────────────────────────────────────────────────

Decimal::Decimal() : dec_val(alloc_dec()) {
    uint32_t status = 0;
    mpd_qset_ssize(dec_val, 0, exact_context(), &status);
}

Decimal::Decimal(const Decimal& other) : dec_val(alloc_dec()) {
    uint32_t status = 0;
    if (other.dec_val) mpd_qcopy(dec_val, other.dec_val, &status);
    else mpd_qset_ssize(dec_val, 0, exact_context(), &status);
}

Decimal::Decimal(Decimal&& other) noexcept : dec_val(other.dec_val) {
    other.dec_val = nullptr;
}

Decimal& Decimal::operator=(const Decimal& other) {
    if (this == &other) return *this;
    if (!dec_val) dec_val = alloc_dec();
    uint32_t status = 0;
    if (other.dec_val) mpd_qcopy(dec_val, other.dec_val, &status);
    else mpd_qset_ssize(dec_val, 0, exact_context(), &status);
    return *this;
}

Decimal& Decimal::operator=(Decimal&& other) noexcept {
    if (this == &other) return *this;
    if (dec_val) mpd_del(dec_val);
    dec_val = other.dec_val;
    other.dec_val = nullptr;
    return *this;
}

Decimal::~Decimal() {
    if (dec_val) mpd_del(dec_val);
}

// ─────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────

bool Decimal::parse(const char* str, Decimal* out) {
    if (!str || !*str || !out) return false;
    mpd_t* dec = alloc_dec();
    uint32_t status = 0;
    mpd_qset_string(dec, str, exact_context(), &status);
    if ((status & MPD_Conversion_syntax) || mpd_isspecial(dec)) {
        log_debug("decimal: cannot parse '%s'", str);
        mpd_del(dec);
        return false;
    }
    *out = Decimal(dec);
    return true;
}

Decimal Decimal::from_int(int64_t value) {
    mpd_t* dec = alloc_dec();
    uint32_t status = 0;
    mpd_qset_ssize(dec, (mpd_ssize_t)value, exact_context(), &status);
    return Decimal(dec);
}

Decimal Decimal::from_double(double value) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.17g", value);
    mpd_t* dec = alloc_dec();
    uint32_t status = 0;
    mpd_qset_string(dec, buf, exact_context(), &status);
    if ((status & MPD_Conversion_syntax) || mpd_isspecial(dec)) {
        // inf and nan have no decimal counterpart here
        log_warn("decimal: non-finite double %s mapped to 0", buf);
        mpd_qset_ssize(dec, 0, exact_context(), &status);
    }
    return Decimal(dec);
}

// ─────────────────────────────────────────────────────────────────────
// Inspection
// ─────────────────────────────────────────────────────────────────────

bool Decimal::is_zero() const { return mpd_iszero(dec_val); }
bool Decimal::is_negative() const { return !mpd_iszero(dec_val) && mpd_isnegative(dec_val); }
bool Decimal::is_integer() const { return mpd_isinteger(dec_val); }

int Decimal::compare(const Decimal& other) const {
    uint32_t status = 0;
    int c = mpd_qcmp(dec_val, other.dec_val, &status);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

int Decimal::digits() const { return (int)dec_val->digits; }
int64_t Decimal::exponent() const { return (int64_t)dec_val->exp; }

double Decimal::to_double() const {
    char* str = mpd_to_sci(dec_val, 1);
    if (!str) return 0.0;
    double value = strtod(str, nullptr);
    mpd_free(str);
    return value;
}

bool Decimal::to_int64(int64_t* out) const {
    Decimal whole = trunc();
    uint32_t status = 0;
    mpd_ssize_t value = mpd_qget_ssize(whole.dec_val, &status);
    if (status & MPD_Invalid_operation) return false;
    if (out) *out = (int64_t)value;
    return true;
}

std::string Decimal::to_string() const {
    if (mpd_iszero(dec_val)) return "0";
    mpd_t* reduced = alloc_dec();
    uint32_t status = 0;
    mpd_qreduce(reduced, dec_val, exact_context(), &status);
    mpd_context_t ctx;
    mpd_maxcontext(&ctx);
    ctx.traps = 0;
    char* str = mpd_format(reduced, "f", &ctx);
    mpd_del(reduced);
    if (!str) {
        log_error("decimal: formatting failed");
        return "0";
    }
    std::string out(str);
    mpd_free(str);
    return out;
}

// ─────────────────────────────────────────────────────────────────────
// Unary operations
// ─────────────────────────────────────────────────────────────────────

Decimal Decimal::negate() const {
    mpd_t* dec = alloc_dec();
    uint32_t status = 0;
    mpd_qminus(dec, dec_val, exact_context(), &status);
    return Decimal(dec);
}

Decimal Decimal::abs() const {
    mpd_t* dec = alloc_dec();
    uint32_t status = 0;
    mpd_qabs(dec, dec_val, exact_context(), &status);
    return Decimal(dec);
}

Decimal Decimal::round(int prec) const {
    mpd_context_t ctx;
    make_context(&ctx, prec);
    mpd_t* rounded = alloc_dec();
    uint32_t status = 0;
    mpd_qplus(rounded, dec_val, &ctx, &status);
    mpd_t* dec = alloc_dec();
    mpd_qreduce(dec, rounded, exact_context(), &status);
    mpd_del(rounded);
    return Decimal(dec);
}

Decimal Decimal::trunc() const {
    mpd_t* dec = alloc_dec();
    uint32_t status = 0;
    mpd_qtrunc(dec, dec_val, exact_context(), &status);
    return Decimal(dec);
}

// ─────────────────────────────────────────────────────────────────────
// Arithmetic
// ─────────────────────────────────────────────────────────────────────

typedef void (*mpd_binary_fn)(mpd_t*, const mpd_t*, const mpd_t*, const mpd_context_t*, uint32_t*);

static DecimalStatus apply_binary(mpd_binary_fn fn, const mpd_t* a, const mpd_t* b, int prec,
                                  mpd_t** result) {
    mpd_context_t ctx;
    make_context(&ctx, prec);
    mpd_t* dec = alloc_dec();
    uint32_t status = 0;
    fn(dec, a, b, &ctx, &status);
    DecimalStatus st = status_of(status, dec);
    if (st != DecimalStatus::OK) {
        mpd_del(dec);
        return st;
    }
    *result = dec;
    return st;
}

DecimalStatus Decimal::add(const Decimal& a, const Decimal& b, int prec, Decimal* out) {
    mpd_t* dec = nullptr;
    DecimalStatus st = apply_binary(mpd_qadd, a.dec_val, b.dec_val, prec, &dec);
    if (st == DecimalStatus::OK) *out = Decimal(dec);
    return st;
}

DecimalStatus Decimal::sub(const Decimal& a, const Decimal& b, int prec, Decimal* out) {
    mpd_t* dec = nullptr;
    DecimalStatus st = apply_binary(mpd_qsub, a.dec_val, b.dec_val, prec, &dec);
    if (st == DecimalStatus::OK) *out = Decimal(dec);
    return st;
}

DecimalStatus Decimal::mul(const Decimal& a, const Decimal& b, int prec, Decimal* out) {
    mpd_t* dec = nullptr;
    DecimalStatus st = apply_binary(mpd_qmul, a.dec_val, b.dec_val, prec, &dec);
    if (st == DecimalStatus::OK) *out = Decimal(dec);
    return st;
}

DecimalStatus Decimal::div(const Decimal& a, const Decimal& b, int prec, Decimal* out) {
    if (b.is_zero()) {
        log_debug("decimal: division by zero");
        return DecimalStatus::DIVISION_BY_ZERO;
    }
    mpd_t* dec = nullptr;
    DecimalStatus st = apply_binary(mpd_qdiv, a.dec_val, b.dec_val, prec, &dec);
    if (st == DecimalStatus::OK) *out = Decimal(dec);
    return st;
}

DecimalStatus Decimal::rem(const Decimal& a, const Decimal& b, int prec, Decimal* out) {
    if (b.is_zero()) return DecimalStatus::DIVISION_BY_ZERO;
    mpd_t* dec = nullptr;
    DecimalStatus st = apply_binary(mpd_qrem, a.dec_val, b.dec_val, prec, &dec);
    if (st == DecimalStatus::OK) *out = Decimal(dec);
    return st;
}

DecimalStatus Decimal::pow(const Decimal& base, const Decimal& exp, int prec, Decimal* out) {
    if (base.is_zero() && exp.is_negative()) return DecimalStatus::DIVISION_BY_ZERO;
    mpd_t* dec = nullptr;
    DecimalStatus st = apply_binary(mpd_qpow, base.dec_val, exp.dec_val, prec, &dec);
    if (st == DecimalStatus::OK) *out = Decimal(dec);
    return st;
}

// ─────────────────────────────────────────────────────────────────────
// Transcendental
// ─────────────────────────────────────────────────────────────────────

typedef void (*mpd_unary_fn)(mpd_t*, const mpd_t*, const mpd_context_t*, uint32_t*);

static DecimalStatus apply_unary(mpd_unary_fn fn, const mpd_t* a, int prec, mpd_t** result) {
    mpd_context_t ctx;
    make_context(&ctx, prec);
    mpd_t* dec = alloc_dec();
    uint32_t status = 0;
    fn(dec, a, &ctx, &status);
    DecimalStatus st = status_of(status, dec);
    if (st != DecimalStatus::OK) {
        mpd_del(dec);
        return st;
    }
    *result = dec;
    return st;
}

DecimalStatus Decimal::sqrt(const Decimal& a, int prec, Decimal* out) {
    if (a.is_negative()) return DecimalStatus::INVALID;
    mpd_t* dec = nullptr;
    DecimalStatus st = apply_unary(mpd_qsqrt, a.dec_val, prec, &dec);
    if (st == DecimalStatus::OK) *out = Decimal(dec);
    return st;
}

DecimalStatus Decimal::ln(const Decimal& a, int prec, Decimal* out) {
    if (a.is_zero() || a.is_negative()) return DecimalStatus::INVALID;
    mpd_t* dec = nullptr;
    DecimalStatus st = apply_unary(mpd_qln, a.dec_val, prec, &dec);
    if (st == DecimalStatus::OK) *out = Decimal(dec);
    return st;
}

DecimalStatus Decimal::log10(const Decimal& a, int prec, Decimal* out) {
    if (a.is_zero() || a.is_negative()) return DecimalStatus::INVALID;
    mpd_t* dec = nullptr;
    DecimalStatus st = apply_unary(mpd_qlog10, a.dec_val, prec, &dec);
    if (st == DecimalStatus::OK) *out = Decimal(dec);
    return st;
}

DecimalStatus Decimal::exp(const Decimal& a, int prec, Decimal* out) {
    mpd_t* dec = nullptr;
    DecimalStatus st = apply_unary(mpd_qexp, a.dec_val, prec, &dec);
    if (st == DecimalStatus::OK) *out = Decimal(dec);
    return st;
}

} // namespace symcalc
