// symcalc/decimal.hpp - Exact decimal values for symcalc
// =====================================================================
// Decimal is a value type owning one mpdecimal number. Arithmetic takes
// the number of significant digits to keep and rounds HALF_UP, so callers
// decide the precision per request instead of sharing a global context.
#ifndef SYMCALC_DECIMAL_HPP
#define SYMCALC_DECIMAL_HPP

// Forward declaration for the mpdecimal type - mpdecimal.h is only included in decimal.cpp
typedef struct mpd_t mpd_t;

#include <cstdint>
#include <string>

namespace symcalc {

// ─────────────────────────────────────────────────────────────────────
// Constants
// ─────────────────────────────────────────────────────────────────────

#define SYMCALC_DECIMAL_MAX_PRECISION 1000

// Status of an arithmetic step
enum class DecimalStatus : uint8_t {
    OK,
    DIVISION_BY_ZERO,
    INVALID,        // NaN result, e.g. 0/0 or a non-real power
    OVERFLOW,
};

// ─────────────────────────────────────────────────────────────────────
// Decimal
// ─────────────────────────────────────────────────────────────────────

class Decimal {
public:
    Decimal();                          // exact zero
    Decimal(const Decimal& other);
    Decimal(Decimal&& other) noexcept;
    Decimal& operator=(const Decimal& other);
    Decimal& operator=(Decimal&& other) noexcept;
    ~Decimal();

    // Parse a decimal literal ("12", "-0.5", "1e3"). Returns false on malformed text.
    static bool parse(const char* str, Decimal* out);
    static Decimal from_int(int64_t value);
    // Goes through "%.17g" text, so binary noise may show up past 15 digits
    static Decimal from_double(double value);

    bool is_zero() const;
    bool is_negative() const;
    bool is_integer() const;
    // -1, 0, 1
    int compare(const Decimal& other) const;
    bool operator==(const Decimal& other) const { return compare(other) == 0; }
    bool operator!=(const Decimal& other) const { return compare(other) != 0; }

    // Number of significant digits in the coefficient, and the power of ten
    // of its last digit. For 12.340 these are 5 and -3.
    int digits() const;
    int64_t exponent() const;

    double to_double() const;
    // Truncates toward zero; false if the value does not fit
    bool to_int64(int64_t* out) const;

    // Plain notation (never exponent form), trailing zeros stripped, "-0" shown as "0"
    std::string to_string() const;

    Decimal negate() const;
    Decimal abs() const;
    // Round to prec significant digits (HALF_UP) and strip trailing zeros
    Decimal round(int prec) const;
    // Drop the fractional part
    Decimal trunc() const;

    // ─── Arithmetic ───
    static DecimalStatus add(const Decimal& a, const Decimal& b, int prec, Decimal* out);
    static DecimalStatus sub(const Decimal& a, const Decimal& b, int prec, Decimal* out);
    static DecimalStatus mul(const Decimal& a, const Decimal& b, int prec, Decimal* out);
    static DecimalStatus div(const Decimal& a, const Decimal& b, int prec, Decimal* out);
    // Remainder with the sign of the dividend
    static DecimalStatus rem(const Decimal& a, const Decimal& b, int prec, Decimal* out);
    // General power, used for non-integer exponents
    static DecimalStatus pow(const Decimal& base, const Decimal& exp, int prec, Decimal* out);

    // ─── Transcendental ───
    static DecimalStatus sqrt(const Decimal& a, int prec, Decimal* out);
    static DecimalStatus ln(const Decimal& a, int prec, Decimal* out);
    static DecimalStatus log10(const Decimal& a, int prec, Decimal* out);
    static DecimalStatus exp(const Decimal& a, int prec, Decimal* out);

private:
    explicit Decimal(mpd_t* value) : dec_val(value) {}
    mpd_t* dec_val;
};

} // namespace symcalc

#endif // SYMCALC_DECIMAL_HPP
