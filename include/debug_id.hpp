// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "hash_helper.hpp"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

namespace debugid {

inline constexpr std::size_t k_debug_id_size = 16;
using DebugIdBytes = std::array<uint8_t, k_debug_id_size>;

/// Identifier of a debug information file.
/// A 128 bit unique value (PDB GUID, Mach-O UUID, ELF build-id prefix) and an
/// appendix (the PDB age, zero on other platforms). The unique value is kept
/// in big-endian order (RFC 4122 layout) whatever the source convention.
class DebugId {
public:
  // nil identifier, used as "absent / unknown"
  DebugId() = default;
  explicit DebugId(const DebugIdBytes &uuid, uint32_t appendix = 0)
      : _uuid(uuid), _appendix(appendix) {}

  static DebugId nil() { return {}; }

  // Accepts the same grammars as parse_debug_id.
  // Throws a DIException on malformed input.
  static DebugId parse(std::string_view str);

  [[nodiscard]] const DebugIdBytes &uuid() const { return _uuid; }
  // On Windows, incrementing counter identifying the build (PDB age).
  [[nodiscard]] uint32_t appendix() const { return _appendix; }

  [[nodiscard]] bool is_nil() const;

  // Hyphenated lower case form, appendix only when not zero
  [[nodiscard]] std::string to_string() const;
  // DebugId { uuid: "...", appendix: 10 }
  [[nodiscard]] std::string to_debug_string() const;

  friend bool operator==(const DebugId &, const DebugId &) = default;
  friend auto operator<=>(const DebugId &, const DebugId &) = default;

  template <typename H> friend H AbslHashValue(H h, const DebugId &id) {
    return H::combine(std::move(h), id._uuid, id._appendix);
  }

private:
  DebugIdBytes _uuid{};
  uint32_t _appendix{};
};

std::ostream &operator<<(std::ostream &os, const DebugId &id);

} // namespace debugid

namespace std {
template <> struct hash<debugid::DebugId> {
  std::size_t operator()(const debugid::DebugId &id) const {
    std::size_t seed = 0;
    debugid::hash_combine_bytes(seed, id.uuid().data(), id.uuid().size());
    debugid::hash_combine(seed, id.appendix());
    return seed;
  }
};
} // namespace std
