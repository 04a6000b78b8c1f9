// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>

namespace debugid {

template <class T>
inline constexpr void hash_combine(std::size_t &seed, const T &v) {
  // NOLINTNEXTLINE(readability-magic-numbers)
  seed ^= std::hash<T>{}(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

// Mix a byte buffer 8 bytes at a time, the tail is zero padded
inline void hash_combine_bytes(std::size_t &seed, const uint8_t *data,
                               std::size_t size) {
  std::size_t pos = 0;
  for (; pos < size; pos += sizeof(uint64_t)) {
    uint64_t word = 0;
    std::size_t const len =
        size - pos < sizeof(uint64_t) ? size - pos : sizeof(uint64_t);
    std::memcpy(&word, data + pos, len);
    hash_combine(seed, word);
  }
}

} // namespace debugid
