// config.hpp - Evaluation settings
//
// EvalConfig is a plain value copied into every request. Nothing in the
// engine reads settings from globals; a request that needs more digits
// (a long literal) raises the precision of its own copy only.

#ifndef SYMCALC_CONFIG_HPP
#define SYMCALC_CONFIG_HPP

#include "calc_error.hpp"
#include <cstdint>
#include <string>

namespace symcalc {

enum class AngleMode : uint8_t {
    RADIANS,
    DEGREES,
};

const char* angle_mode_name(AngleMode mode);

struct EvalConfig {
    int precision = 10;                 // significant digits of rendered results
    int guard_digits = 5;               // extra digits carried by intermediate results
    AngleMode angle_mode = AngleMode::RADIANS;
    double term_epsilon = 1e-7;         // scalar zero test
    double matrix_epsilon = 1e-5;       // pivot zero test
    int newton_max_iterations = 100;
    double newton_tolerance = 1e-6;
    int bracket_max_doublings = 64;
    int series_max_terms = 100000;
    int display_places = 5;             // decimal places when printing matrices

    // digits used for intermediate decimal arithmetic
    int working_precision() const { return precision + guard_digits; }
};

#define SYMCALC_MIN_PRECISION 1
#define SYMCALC_MAX_PRECISION 1000

// Apply "key=value;key=value" settings on top of config. Keys:
// precision, guard_digits, angle (radians|degrees), term_epsilon,
// matrix_epsilon, newton_max_iterations, newton_tolerance,
// bracket_max_doublings, series_max_terms, display_places.
// On failure config is left unchanged.
bool config_parse_string(const char* text, EvalConfig* config, CalcError* error);

std::string config_to_string(const EvalConfig& config);

} // namespace symcalc

#endif // SYMCALC_CONFIG_HPP
