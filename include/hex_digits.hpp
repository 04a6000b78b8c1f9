// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <string_view>

namespace debugid {

inline constexpr unsigned char k_hex_digit_bits = 4;
inline constexpr unsigned char k_hex_digit_mask = (1 << k_hex_digit_bits) - 1;

// convert integer to hex digit
inline char int_to_hex_digit(int c, bool upper = false) {
  constexpr int k_a_hex_value = 0xa;
  char const a_digit = upper ? 'A' : 'a';
  return c < k_a_hex_value ? '0' + c : a_digit + (c - k_a_hex_value);
}

// returns -1 when c is not a hex digit (either case)
inline int hex_digit_to_int(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 0xa;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 0xa;
  }
  return -1;
}

inline bool is_hex_string(std::string_view str) {
  for (char const c : str) {
    if (hex_digit_to_int(c) < 0) {
      return false;
    }
  }
  return true;
}

} // namespace debugid
