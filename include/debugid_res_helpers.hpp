// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "debugid_res_def.hpp"
#include "debugid_res_list.hpp"
#include "logger.hpp"

namespace debugid {

/// Standardized way of formatting error log
#define LOG_ERROR_DETAILS(log_func, what)                                      \
  log_func("%s at %s:%u", dires_error_message(what), __FILE__, __LINE__);

/// Returns an error dires while using the LG_ERR API
#define DIRES_RETURN_ERROR_LOG(what, ...)                                      \
  do {                                                                         \
    LG_ERR(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_ERR, what);                                           \
    return dires_error(what);                                                  \
  } while (0)

// Implem notes :
// do while idiom is used to expand in a compound statement (if you have an
// if (A)
//   macro()
// you want to have the full content of the macro in the if statement

/// Check boolean and log
#define DIRES_CHECK_BOOL(eval, what, ...)                                      \
  do {                                                                         \
    if (DEBUGID_UNLIKELY(!(eval))) {                                           \
      DIRES_RETURN_ERROR_LOG(what, __VA_ARGS__);                               \
    }                                                                          \
  } while (0)

/// Forward result if Fatal
#define DIRES_CHECK_FWD(dires)                                                 \
  do {                                                                         \
    DIRes ldires = dires; /* single eval */                                    \
    if (IsDIResNotOK(ldires)) {                                                \
      if (IsDIResFatal(ldires)) {                                              \
        LG_ERR("Forward error at %s:%u - %s", __FILE__, __LINE__,              \
               dires_error_message(ldires._what));                             \
        return ldires;                                                         \
      }                                                                        \
      if (ldires._sev == DI_SEV_WARN) {                                        \
        LG_WRN("Recover from sev=%d at %s:%u - %s", ldires._sev, __FILE__,     \
               __LINE__, dires_error_message(ldires._what));                   \
      } else {                                                                 \
        LG_NTC("Recover from sev=%d at %s:%u - %s", ldires._sev, __FILE__,     \
               __LINE__, dires_error_message(ldires._what));                   \
      }                                                                        \
    }                                                                          \
  } while (0)

} // namespace debugid
