// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <exception>
#include <new>

#include "debugid_res_def.hpp"
#include "debugid_res_helpers.hpp"
#include "debugid_res_list.hpp"

namespace debugid {

/// Standard exception containing a DIRes
class DIException : public std::exception {
public:
  explicit DIException(DIRes dires) : _dires(dires) {}
  DIException(int16_t sev, int16_t what) : _dires(dires_create(sev, what)) {}
  [[nodiscard]] DIRes get_DIRes() const { return _dires; }
  [[nodiscard]] const char *what() const noexcept override {
    return dires_error_message(_dires._what);
  }

private:
  DIRes _dires;
};
} // namespace debugid

#define DIRES_CHECK_THROW_EXCEPTION(dires)                                     \
  do {                                                                         \
    DIRes ldires = dires; /* single eval */                                    \
    if (IsDIResNotOK(ldires)) {                                                \
      if (IsDIResFatal(ldires)) {                                              \
        LG_ERR("Forward error at %s:%u - %s", __FILE__, __LINE__,              \
               dires_error_message(ldires._what));                             \
        throw debugid::DIException(ldires);                                    \
      } else if (ldires._sev == DI_SEV_WARN) {                                 \
        LG_WRN("Recover from sev=%d at %s:%u - %s", ldires._sev, __FILE__,     \
               __LINE__, dires_error_message(ldires._what));                   \
      } else {                                                                 \
        LG_NTC("Recover from sev=%d at %s:%u - %s", ldires._sev, __FILE__,     \
               __LINE__, dires_error_message(ldires._what));                   \
      }                                                                        \
    }                                                                          \
  } while (0)

/// Catch exceptions and give info when possible
#define CatchExcept2DIRes()                                                    \
  catch (const debugid::DIException &e) {                                      \
    DIRES_CHECK_FWD(e.get_DIRes());                                            \
  }                                                                            \
  catch (const std::bad_alloc &) {                                             \
    LOG_ERROR_DETAILS(LG_ERR, DI_WHAT_BADALLOC);                               \
    return dires_error(DI_WHAT_BADALLOC);                                      \
  }                                                                            \
  catch (const std::exception &e) {                                            \
    LG_ERR("%s", e.what());                                                    \
    LOG_ERROR_DETAILS(LG_ERR, DI_WHAT_STDEXCEPT);                              \
    return dires_error(DI_WHAT_STDEXCEPT);                                     \
  }                                                                            \
  catch (...) {                                                                \
    LOG_ERROR_DETAILS(LG_ERR, DI_WHAT_UKNWEXCEPT);                             \
    return dires_error(DI_WHAT_UKNWEXCEPT);                                    \
  }
