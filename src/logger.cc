// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger.hpp"

#include "version.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <string>
#include <unistd.h>

#ifndef LOG_MSG_CAP
#  define LOG_MSG_CAP 4096
#endif

namespace debugid {

namespace {

struct LoggerContext {
  int fd{-1};
  int mode{LOG_DISABLE};
  int level{LL_ERROR};
  std::string name;
};

LoggerContext log_ctx;

constexpr const char *k_level_names[LL_LENGTH] = {
    "EMERGENCY", "ALERT",  "CRITICAL",      "ERROR",
    "WARNING",   "NOTICE", "INFORMATIONAL", "DEBUG",
};
} // namespace

void LOG_setlevel(int lvl) {
  if (lvl >= LL_EMERGENCY && lvl <= LL_DEBUG) {
    log_ctx.level = lvl;
  }
}

int LOG_getlevel() { return log_ctx.level; }

void LOG_setname(const char *name) { log_ctx.name = name ? name : ""; }

void LOG_close() {
  if (LOG_FILE == log_ctx.mode && log_ctx.fd >= 0) {
    close(log_ctx.fd);
  }
  log_ctx.fd = -1;
}

bool LOG_open(int mode, const char *opts) {
  if (log_ctx.fd >= 0) {
    LOG_close();
  }

  switch (mode) {
  case LOG_DISABLE:
    log_ctx.fd = -1;
    break;
  default:
  case LOG_STDOUT:
    log_ctx.fd = STDOUT_FILENO;
    break;
  case LOG_STDERR:
    log_ctx.fd = STDERR_FILENO;
    break;
  case LOG_FILE: {
    if (!opts) {
      return false;
    }
    int const fd = open(opts, O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (-1 == fd) {
      return false;
    }
    log_ctx.fd = fd;
    break;
  }
  }

  log_ctx.mode = mode;
  return true;
}

// The message buffer is a stack region of LOG_MSG_CAP bytes. The header
// `<LEVEL>MMM DD hh:mm:ss.uuuuuu name[pid]: ` is written first, the body is
// truncated to what remains. Every line fits in LOG_MSG_CAP - 1 bytes.
void vlprintfln(int lvl, const char *format, va_list args) {
  if (log_ctx.fd < 0 || !format) {
    return;
  }
  if (lvl < LL_EMERGENCY || lvl >= LL_LENGTH) {
    lvl = log_ctx.level;
  }
  const char *name = !log_ctx.name.empty() ? log_ctx.name.c_str() : MYNAME;

  char tm_str[sizeof("mmm dd HH:MM:SS0")];
  auto d = std::chrono::system_clock::now().time_since_epoch();
  auto d_s = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto d_us = std::chrono::duration_cast<std::chrono::microseconds>(d - d_s);

  time_t const t = d_s.count();
  struct tm lt;
  localtime_r(&t, &lt);
  (void)strftime(tm_str, sizeof(tm_str), "%b %d %H:%M:%S", &lt);

  char buf[LOG_MSG_CAP];
  int sz_h =
      snprintf(buf, LOG_MSG_CAP, "<%s>%s.%06ld %s[%d]: ", k_level_names[lvl],
               tm_str, static_cast<long>(d_us.count()), name, getpid());
  if (sz_h < 0) {
    return;
  }
  // A long name truncates the header
  if (sz_h > LOG_MSG_CAP - 3) {
    sz_h = LOG_MSG_CAP - 3;
  }

  // Room for newline and \0
  ssize_t const cap = LOG_MSG_CAP - sz_h - 2;
  ssize_t sz = vsnprintf(&buf[sz_h], cap, format, args);
  if (sz < 0) {
    return;
  }
  if (sz >= cap) {
    sz = cap - 1;
  }
  sz += sz_h;
  buf[sz] = '\n';
  buf[sz + 1] = '\0';
  ++sz;

  ssize_t rc = 0;
  do {
    rc = write(log_ctx.fd, buf, sz);
  } while (rc < 0 && errno == EINTR);
}

// NOLINTNEXTLINE(cert-dcl50-cpp)
void olprintfln(int lvl, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlprintfln(lvl, fmt, args);
  va_end(args);
}

bool LOG_is_logging_enabled_for_level(int level) {
  return log_ctx.fd >= 0 && level <= log_ctx.level;
}

} // namespace debugid
