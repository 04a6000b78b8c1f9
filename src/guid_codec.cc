// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "guid_codec.hpp"

#include "debugid_res.hpp"

#include <algorithm>

namespace debugid {

DebugIdBytes swap_guid_fields(const DebugIdBytes &bytes) {
  DebugIdBytes swapped = bytes;
  for (const GuidField &field : k_guid_swapped_fields) {
    auto first = swapped.begin() + field.offset;
    std::reverse(first, first + field.width);
  }
  return swapped;
}

DebugId from_guid_bytes(const DebugIdBytes &guid, uint32_t age) {
  return DebugId(swap_guid_fields(guid), age);
}

DebugId from_raw_bytes(const DebugIdBytes &bytes, uint32_t appendix) {
  return DebugId(bytes, appendix);
}

DebugIdBytes to_guid_bytes(const DebugId &id) {
  return swap_guid_fields(id.uuid());
}

DebugIdBytes to_raw_bytes(const DebugId &id) { return id.uuid(); }

DIRes debug_id_from_guid_span(std::span<const uint8_t> guid, uint32_t age,
                              DebugId &id) {
  DIRES_CHECK_BOOL(guid.size() == k_debug_id_size, DI_WHAT_INVALID_LENGTH,
                   "GUID buffer holds %zu bytes instead of %zu", guid.size(),
                   k_debug_id_size);
  DebugIdBytes bytes;
  std::copy(guid.begin(), guid.end(), bytes.begin());
  id = from_guid_bytes(bytes, age);
  return dires_init();
}

} // namespace debugid
