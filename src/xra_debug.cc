/*
 * xra_debug.cc -- logging functions for xrealmauthz
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>

#include "xrealmauthz/xrealmauthz.h"

static std::atomic<int> maxlog{XRA_LOG_NOTICE};
static std::atomic<xra_log_handler_t> log_handler{nullptr};

/* Messages longer than this are truncated. */
#define XRA_LOG_BUFSIZE 512

static const char *loglevels[] = {
  "EMRG", "ALRT", "CRIT", "ERR ", "WARN", "NOTE", "INFO", "DEBG"
};

xra_log_t
xra_get_log_level(void) {
  return static_cast<xra_log_t>(maxlog.load());
}

void
xra_set_log_level(xra_log_t level) {
  maxlog = level;
}

void
xra_set_log_handler(xra_log_handler_t handler) {
  log_handler = handler;
}

static size_t
print_timestamp(char *s, size_t len) {
  time_t now = time(nullptr);
  struct tm tmp;

  if (!localtime_r(&now, &tmp))
    return 0;
  return strftime(s, len, "%b %d %H:%M:%S", &tmp);
}

void
xra_log(xra_log_t level, const char *format, ...) {
  char message[XRA_LOG_BUFSIZE];
  va_list ap;

  if (static_cast<int>(level) > maxlog.load())
    return;

  va_start(ap, format);
  vsnprintf(message, sizeof(message), format, ap);
  va_end(ap);

  xra_log_handler_t handler = log_handler.load();
  if (handler) {
    handler(level, message);
  } else {
    char timebuf[32];
    FILE *log_fd = level <= XRA_LOG_CRIT ? stderr : stdout;

    if (print_timestamp(timebuf, sizeof(timebuf)) == 0)
      timebuf[0] = '\0';

    fprintf(log_fd, "%s %s %s", timebuf,
            (level >= XRA_LOG_EMERG && level <= XRA_LOG_DEBUG)
            ? loglevels[level] : "????",
            message);
    fflush(log_fd);
  }
}

const char *
xra_strerror(xra_result_t result) {
  switch (result) {
  case XRA_OK: return "Success";
  case XRA_ERROR_OUT_OF_MEMORY: return "Out of memory";
  case XRA_ERROR_INTERNAL_ERROR: return "Internal error";
  case XRA_ERROR_BAD_CONFIG: return "Invalid configuration";
  case XRA_ERROR_NO_SUCH_PRINCIPAL: return "Principal does not exist";
  case XRA_ERROR_NO_SUCH_ATTRIBUTE: return "String attribute does not exist";
  case XRA_ERROR_STORAGE_UNAVAILABLE: return "Principal database unavailable";
  case XRA_ERROR_POLICY: return "KDC policy rejects request";
  }
  return "Unknown error";
}
