/*
 * xra_debug.h -- logging functions for xrealmauthz
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef _XRA_DEBUG_H_
#define _XRA_DEBUG_H_ 1

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Pre-defined log levels akin to what is used in \b syslog. */
typedef enum {
  XRA_LOG_EMERG=0,
  XRA_LOG_ALERT,
  XRA_LOG_CRIT,
  XRA_LOG_ERR,
  XRA_LOG_WARNING,
  XRA_LOG_NOTICE,
  XRA_LOG_INFO,
  XRA_LOG_DEBUG
} xra_log_t;

/** Returns the current log level. */
xra_log_t xra_get_log_level(void);

/** Sets the log level to the specified value. */
void xra_set_log_level(xra_log_t level);

typedef void (*xra_log_handler_t) (xra_log_t level, const char *message);

/** Add a custom log callback, use NULL to reset default handler */
void xra_set_log_handler(xra_log_handler_t handler);

#if (defined(__GNUC__))
void xra_log(xra_log_t level,
             const char *format, ...) __attribute__ ((format(printf, 2, 3)));
#else
void xra_log(xra_log_t level, const char *format, ...);
#endif

#ifdef __cplusplus
}
#endif

#endif /* _XRA_DEBUG_H_ */
