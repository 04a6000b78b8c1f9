// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

// Branch prediction hints. Error paths are assumed to be cold.
#if defined(__has_builtin)
#  if __has_builtin(__builtin_expect)
#    define DEBUGID_LIKELY(x) __builtin_expect(!!(x), 1)
#    define DEBUGID_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  endif
#endif
#ifndef DEBUGID_LIKELY
#  define DEBUGID_LIKELY(x) (x)
#  define DEBUGID_UNLIKELY(x) (x)
#endif

// Allow for compile-time argument type checking for printf-like functions
#if defined(__GNUC__) || defined(__clang__)
#  define DEBUGID_PRINTFLIKE(x, y) __attribute__((format(printf, x, y)))
#else
#  define DEBUGID_PRINTFLIKE(x, y)
#endif
