// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "compiler_hints.hpp"

#include <cstdint>

// although we keep it in a int16, we only need a uint8 for the enum
enum DI_RES_SEV : uint8_t {
  DI_SEV_OK = 0,
  DI_SEV_NOTICE = 1,
  DI_SEV_WARN = 2,
  DI_SEV_ERROR = 3,
};

/// Result structure containing a what / severity
struct DIRes {
  union {
    struct {
      int16_t _what; // Type of result (see debugid_res_list.hpp)
      int16_t _sev;  // error, warn, OK...
    };
    int32_t _val;
  };
};

/******** STANDARD APIs TO USE BELLOW **********/

/// sev, what
inline DIRes dires_create(int16_t sev, int16_t what) {
  DIRes dires;
  dires._sev = sev;
  dires._what = what;
  return dires;
}

/// Creates a DIRes taking an error code (what)
inline DIRes dires_error(int16_t what) {
  return dires_create(DI_SEV_ERROR, what);
}

/// Creates a DIRes with a warning taking an error code (what)
inline DIRes dires_warn(int16_t what) {
  return dires_create(DI_SEV_WARN, what);
}

/// Create an OK DIRes
inline DIRes dires_init() {
  DIRes dires = {};
  return dires;
}

/// returns a bool : true if they are equal
inline bool dires_equal(DIRes lhs, DIRes rhs) { return lhs._val == rhs._val; }

/// true if dires is not OK (unlikely)
#define IsDIResNotOK(res) DEBUGID_UNLIKELY((res)._sev != DI_SEV_OK)

/// true if dires is OK (likely)
#define IsDIResOK(res) DEBUGID_LIKELY((res)._sev == DI_SEV_OK)

/// true if dires is an error (unlikely)
#define IsDIResFatal(res) DEBUGID_UNLIKELY((res)._sev == DI_SEV_ERROR)

inline bool operator==(DIRes lhs, DIRes rhs) { return dires_equal(lhs, rhs); }
