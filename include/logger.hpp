// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "compiler_hints.hpp"

#include <cstdarg>

namespace debugid {

enum LOG_OPTS {
  LOG_DISABLE = 0,
  LOG_STDOUT = 1,
  LOG_STDERR = 2,
  LOG_FILE = 3,
};

enum LOG_LVL {
  LL_EMERGENCY = 0,
  LL_ALERT = 1,
  LL_CRITICAL = 2,
  LL_ERROR = 3,
  LL_WARNING = 4,
  LL_NOTICE = 5,
  LL_INFORMATIONAL = 6,
  LL_DEBUG = 7,
  LL_LENGTH,
};

// Manage the logging backend. Logging stays closed (nothing is written)
// until LOG_open is called.
void LOG_close();
bool LOG_open(int mode, const char *opts);

// Formatted print to the logging facility, one line per call.
// Callers go through the LG_* macros which check the level first.
DEBUGID_PRINTFLIKE(2, 3)
void olprintfln(int lvl, const char *fmt, ...);

// Same as the first, but with a single variadic arg instead of ...
void vlprintfln(int lvl, const char *format, va_list args);

// Setters for global logger context
void LOG_setname(const char *name);
void LOG_setlevel(int lvl);
int LOG_getlevel();

bool LOG_is_logging_enabled_for_level(int level);

/******************************* Logging Macros *******************************/
// Avoid calling arguments (which can have CPU costs unless level is OK)
#define LG_IF_LVL_OK(level, ...)                                               \
  do {                                                                         \
    if (DEBUGID_UNLIKELY(debugid::LOG_is_logging_enabled_for_level(level))) {  \
      debugid::olprintfln(level, __VA_ARGS__);                                 \
    }                                                                          \
  } while (false)

#define LG_ERR(...) LG_IF_LVL_OK(debugid::LL_ERROR, __VA_ARGS__)
#define LG_WRN(...) LG_IF_LVL_OK(debugid::LL_WARNING, __VA_ARGS__)
#define LG_NTC(...) LG_IF_LVL_OK(debugid::LL_NOTICE, __VA_ARGS__)
#define LG_NFO(...) LG_IF_LVL_OK(debugid::LL_INFORMATIONAL, __VA_ARGS__)
#define LG_DBG(...) LG_IF_LVL_OK(debugid::LL_DEBUG, __VA_ARGS__)

} // namespace debugid
