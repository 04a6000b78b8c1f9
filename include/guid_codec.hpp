// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "debug_id.hpp"
#include "debugid_res_def.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace debugid {

// Leading fields of a GUID stored in native (little-endian) order by
// Microsoft toolchains: Data1 (4 bytes), Data2 (2 bytes), Data3 (2 bytes).
// Data4 (bytes 8 to 15) is a plain byte sequence.
struct GuidField {
  std::size_t offset;
  std::size_t width;
};
inline constexpr std::array<GuidField, 3> k_guid_swapped_fields = {
    {{0, 4}, {4, 2}, {6, 2}}};

// Reverses the leading fields. The swap is its own inverse.
DebugIdBytes swap_guid_fields(const DebugIdBytes &bytes);

/// Microsoft mixed-endian GUID (as found in a PDB or a CodeView record)
DebugId from_guid_bytes(const DebugIdBytes &guid, uint32_t age = 0);

/// Bytes already in canonical order (Mach-O LC_UUID, RFC 4122 uuids)
DebugId from_raw_bytes(const DebugIdBytes &bytes, uint32_t appendix = 0);

DebugIdBytes to_guid_bytes(const DebugId &id);

DebugIdBytes to_raw_bytes(const DebugId &id);

/// Same as from_guid_bytes for a buffer of unchecked size.
/// DI_WHAT_INVALID_LENGTH unless the buffer holds exactly 16 bytes.
DIRes debug_id_from_guid_span(std::span<const uint8_t> guid, uint32_t age,
                              DebugId &id);

} // namespace debugid
