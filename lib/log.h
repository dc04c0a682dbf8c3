/* log.h - leveled console logging for symcalc (zlog-style API, log_ prefix)
 *
 * Messages go to the default category unless a named category is given.
 * Categories are created on first lookup and inherit the default level.
 * Everything below WARN is dropped until log_init/log_parse_config_string
 * lowers the threshold, e.g. "level=debug;timestamps=1;parser.level=info".
 */
#ifndef LOG_H
#define LOG_H

#include <stdio.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

#define LOG_VERSION_MAJOR 1
#define LOG_VERSION_MINOR 1

#define LOG_MAX_CATEGORIES 16

/* status codes returned by the log_* calls */
#define LOG_OK                  0
#define LOG_WRONG_FORMAT       -3
#define LOG_WRITE_FAIL         -4
#define LOG_CATEGORY_NOT_FOUND -6

typedef enum {
    LOG_LEVEL_DEBUG  = 20,
    LOG_LEVEL_INFO   = 40,
    LOG_LEVEL_NOTICE = 60,
    LOG_LEVEL_WARN   = 80,
    LOG_LEVEL_ERROR  = 100,
    LOG_LEVEL_FATAL  = 120
} log_level;

typedef struct log_category_s {
    char name[64];
    int level;
    FILE *output;       /* NULL writes to stderr */
    int enabled;
} log_category_t;

extern log_category_t *log_default_category;

/* ========================================================================== */
/* Lifecycle and configuration                                                */
/* ========================================================================== */

int log_init(const char *config);
void log_fini(void);
int log_parse_config_string(const char *config);

log_category_t* log_get_category(const char *cname);
int log_level_enabled(log_category_t *category, const int level);
void log_set_level(log_category_t *category, int level);
void log_set_output(log_category_t *category, FILE *output);
void log_enable_timestamps(int enable);
void log_enable_colors(int enable);

const char* log_level_to_string(int level);
int log_level_from_string(const char *name);   /* -1 for an unknown name */

/* ========================================================================== */
/* Logging                                                                    */
/* ========================================================================== */

int log_fatal(const char *format, ...);
int log_error(const char *format, ...);
int log_warn(const char *format, ...);
int log_notice(const char *format, ...);
int log_info(const char *format, ...);
int log_debug(const char *format, ...);

int clog_fatal(log_category_t *category, const char *format, ...);
int clog_error(log_category_t *category, const char *format, ...);
int clog_warn(log_category_t *category, const char *format, ...);
int clog_notice(log_category_t *category, const char *format, ...);
int clog_info(log_category_t *category, const char *format, ...);
int clog_debug(log_category_t *category, const char *format, ...);

#ifdef __cplusplus
}
#endif

#endif /* LOG_H */
