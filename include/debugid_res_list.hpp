// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <climits>
#include <cstdint>

enum : uint16_t { DI_COMMON_START_RANGE = 1000, DI_CODEC_START_RANGE = 2000 };

#define EXPAND_ENUM(a, b) DI_WHAT_##a,
#define EXPAND_ERROR_MESSAGE(a, b) #a ": " b,

#define COMMON_ERROR_TABLE(X)                                                  \
  X(UKNW, "undocumented error")                                                \
  X(BADALLOC, "allocation error")                                              \
  X(STDEXCEPT, "standard exception caught")                                    \
  X(UKNWEXCEPT, "unknown exception caught")                                    \
  X(UNITTEST, "unit test error")

// Parse taxonomy: every textual or structured decoding failure maps to one of
// these. Binary conversions of fixed size arrays never fail.
#define CODEC_ERROR_TABLE(X)                                                   \
  X(INVALID_LENGTH, "identifier body does not have the expected width")        \
  X(INVALID_CHARACTER, "unexpected character in identifier body")              \
  X(INVALID_APPENDIX, "appendix is not a 32 bit hexadecimal value")            \
  X(INVALID_JSON, "unexpected structured representation")

enum DIRes_What : uint16_t {
  DI_WHAT_MIN_ERRNO = DI_COMMON_START_RANGE,
  // common errors
  COMMON_ERROR_TABLE(EXPAND_ENUM) COMMON_ERROR_SIZE,
  DI_WHAT_MIN_CODEC = DI_CODEC_START_RANGE,
  CODEC_ERROR_TABLE(EXPAND_ENUM) CODEC_ERROR_SIZE,
  // max
  DI_WHAT_MAX = SHRT_MAX,
};

/// Retrieve an explicit error message matching the error ID (from table above)
const char *dires_error_message(int16_t what);
