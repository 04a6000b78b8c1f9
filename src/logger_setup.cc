// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger_setup.hpp"

#include "logger.hpp"

#include <absl/strings/match.h>

#include <array>
#include <string_view>

namespace debugid {

namespace {
// index of the matching pattern, -1 if none
template <std::size_t N>
int arg_which(std::string_view str,
              const std::array<std::string_view, N> &patterns) {
  for (std::size_t i = 0; i < N; ++i) {
    if (absl::EqualsIgnoreCase(absl::string_view(str.data(), str.size()),
                               absl::string_view(patterns[i].data(), patterns[i].size()))) {
      return static_cast<int>(i);
    }
  }
  return -1;
}
} // namespace

bool setup_logger(const char *log_mode, const char *log_level,
                  const char *name) {
  if (name) {
    LOG_setname(name);
  }

  // Process logging mode
  constexpr std::array<std::string_view, 3> logpattern = {"stdout", "stderr",
                                                          "disabled"};
  bool opened = true;
  switch (log_mode ? arg_which(log_mode, logpattern) : 1) {
  case 0:
    opened = LOG_open(LOG_STDOUT, nullptr);
    break;
  case 1:
    opened = LOG_open(LOG_STDERR, nullptr);
    break;
  case 2:
    opened = LOG_open(LOG_DISABLE, nullptr);
    break;
  default:
    opened = LOG_open(LOG_FILE, log_mode);
    break;
  }

  // Process logging level
  constexpr std::array<std::string_view, 5> loglpattern = {
      "debug", "informational", "notice", "warn", "error"};
  switch (log_level ? arg_which(log_level, loglpattern) : -1) {
  case 0:
    LOG_setlevel(LL_DEBUG);
    break;
  case 1:
    LOG_setlevel(LL_INFORMATIONAL);
    break;
  case 2:
    LOG_setlevel(LL_NOTICE);
    break;
  case 4:
    LOG_setlevel(LL_ERROR);
    break;
  case -1: // default
  case 3:
  default:
    LOG_setlevel(LL_WARNING);
    break;
  }
  return opened;
}

} // namespace debugid
