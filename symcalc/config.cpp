// config.cpp - Evaluation settings

#include "config.hpp"
#include "../lib/log.h"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace symcalc {

const char* angle_mode_name(AngleMode mode) {
    switch (mode) {
    case AngleMode::RADIANS: return "radians";
    case AngleMode::DEGREES: return "degrees";
    }
    return "radians";
}

static std::string trim(const std::string& s) {
    size_t start = 0, end = s.size();
    while (start < end && isspace((unsigned char)s[start])) start++;
    while (end > start && isspace((unsigned char)s[end - 1])) end--;
    return s.substr(start, end - start);
}

static bool parse_int(const std::string& value, int min, int max, int* out) {
    if (value.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = strtol(value.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < min || v > max) return false;
    *out = (int)v;
    return true;
}

static bool parse_epsilon(const std::string& value, double* out) {
    if (value.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double v = strtod(value.c_str(), &end);
    if (errno != 0 || *end != '\0' || !(v > 0.0) || v >= 1.0) return false;
    *out = v;
    return true;
}

static bool apply_setting(const std::string& key, const std::string& value, EvalConfig* cfg) {
    if (key == "precision") return parse_int(value, SYMCALC_MIN_PRECISION, SYMCALC_MAX_PRECISION, &cfg->precision);
    if (key == "guard_digits") return parse_int(value, 0, 100, &cfg->guard_digits);
    if (key == "angle" || key == "angle_mode") {
        if (value == "radians" || value == "rad") { cfg->angle_mode = AngleMode::RADIANS; return true; }
        if (value == "degrees" || value == "deg") { cfg->angle_mode = AngleMode::DEGREES; return true; }
        return false;
    }
    if (key == "term_epsilon") return parse_epsilon(value, &cfg->term_epsilon);
    if (key == "matrix_epsilon") return parse_epsilon(value, &cfg->matrix_epsilon);
    if (key == "newton_tolerance") return parse_epsilon(value, &cfg->newton_tolerance);
    if (key == "newton_max_iterations") return parse_int(value, 1, 100000, &cfg->newton_max_iterations);
    if (key == "bracket_max_doublings") return parse_int(value, 1, 1000, &cfg->bracket_max_doublings);
    if (key == "series_max_terms") return parse_int(value, 1, 100000000, &cfg->series_max_terms);
    if (key == "display_places") return parse_int(value, 0, 15, &cfg->display_places);
    return false;
}

bool config_parse_string(const char* text, EvalConfig* config, CalcError* error) {
    if (!config) return err_set(error, ERR_INTERNAL_ERROR, 0, "no configuration to update");
    if (!text) return true;

    EvalConfig updated = *config;
    std::string input(text);
    size_t pos = 0;
    while (pos <= input.size()) {
        size_t end = input.find(';', pos);
        if (end == std::string::npos) end = input.size();
        std::string item = trim(input.substr(pos, end - pos));
        if (!item.empty()) {
            size_t eq = item.find('=');
            if (eq == std::string::npos) {
                return err_setf(error, ERR_INVALID_CONFIG, (uint32_t)pos + 1,
                                "expected key=value, got '%s'", item.c_str());
            }
            std::string key = trim(item.substr(0, eq));
            std::string value = trim(item.substr(eq + 1));
            if (!apply_setting(key, value, &updated)) {
                return err_setf(error, ERR_INVALID_CONFIG, (uint32_t)pos + 1,
                                "invalid setting %s=%s", key.c_str(), value.c_str());
            }
        }
        pos = end + 1;
    }
    *config = updated;
    log_debug("config: precision=%d angle=%s", config->precision, angle_mode_name(config->angle_mode));
    return true;
}

std::string config_to_string(const EvalConfig& config) {
    char buf[512];
    snprintf(buf, sizeof(buf),
             "precision=%d;guard_digits=%d;angle=%s;term_epsilon=%g;matrix_epsilon=%g;"
             "newton_max_iterations=%d;newton_tolerance=%g;bracket_max_doublings=%d;"
             "series_max_terms=%d;display_places=%d",
             config.precision, config.guard_digits, angle_mode_name(config.angle_mode),
             config.term_epsilon, config.matrix_epsilon, config.newton_max_iterations,
             config.newton_tolerance, config.bracket_max_doublings, config.series_max_terms,
             config.display_places);
    return buf;
}

} // namespace symcalc
