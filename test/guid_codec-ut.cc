// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "debug_id_format.hpp"
#include "debugid_res.hpp"
#include "guid_codec.hpp"
#include "loghandle.hpp"

#include <vector>

namespace debugid {

namespace {
// GUID {DFB8E43A-F242-3D73-A453-AEB6A777EF75} as stored in a PDB
constexpr DebugIdBytes k_pdb_guid = {0x3a, 0xe4, 0xb8, 0xdf, 0x42, 0xf2,
                                     0x73, 0x3d, 0xa4, 0x53, 0xae, 0xb6,
                                     0xa7, 0x77, 0xef, 0x75};
constexpr DebugIdBytes k_uuid = {0xdf, 0xb8, 0xe4, 0x3a, 0xf2, 0x42,
                                 0x3d, 0x73, 0xa4, 0x53, 0xae, 0xb6,
                                 0xa7, 0x77, 0xef, 0x75};
} // namespace

TEST(GuidCodec, swapped_fields) {
  std::size_t covered = 0;
  for (const GuidField &field : k_guid_swapped_fields) {
    EXPECT_EQ(field.offset, covered);
    covered += field.width;
  }
  EXPECT_EQ(covered, 8);
}

TEST(GuidCodec, from_guid_bytes) {
  DebugId const id = from_guid_bytes(k_pdb_guid, 2);
  EXPECT_EQ(id.uuid(), k_uuid);
  EXPECT_EQ(id.appendix(), 2);
  EXPECT_EQ(id.to_string(), "dfb8e43a-f242-3d73-a453-aeb6a777ef75-2");
  EXPECT_EQ(from_guid_bytes(k_pdb_guid).appendix(), 0);
}

TEST(GuidCodec, to_guid_bytes) {
  DebugId const id(k_uuid, 2);
  EXPECT_EQ(to_guid_bytes(id), k_pdb_guid);
  EXPECT_EQ(from_guid_bytes(to_guid_bytes(id), id.appendix()), id);
}

TEST(GuidCodec, swap_is_involution) {
  DebugIdBytes bytes;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<uint8_t>(i);
  }
  DebugIdBytes const swapped = swap_guid_fields(bytes);
  DebugIdBytes const expected = {3, 2, 1, 0, 5, 4, 7, 6,
                                 8, 9, 10, 11, 12, 13, 14, 15};
  EXPECT_EQ(swapped, expected);
  EXPECT_EQ(swap_guid_fields(swapped), bytes);
}

TEST(GuidCodec, raw_bytes) {
  DebugId const id = from_raw_bytes(k_uuid, 7);
  EXPECT_EQ(id, DebugId(k_uuid, 7));
  EXPECT_EQ(to_raw_bytes(id), k_uuid);
  EXPECT_EQ(from_raw_bytes(to_raw_bytes(id), 7), id);
  // same bytes, different conventions
  EXPECT_NE(from_raw_bytes(k_pdb_guid), from_guid_bytes(k_pdb_guid));
}

TEST(GuidCodec, from_guid_span) {
  LogHandle handle;
  std::vector<uint8_t> buffer(k_pdb_guid.begin(), k_pdb_guid.end());
  DebugId id;
  ASSERT_TRUE(IsDIResOK(debug_id_from_guid_span(buffer, 1, id)));
  EXPECT_EQ(id, DebugId(k_uuid, 1));

  buffer.push_back(0);
  EXPECT_EQ(debug_id_from_guid_span(buffer, 1, id),
            dires_error(DI_WHAT_INVALID_LENGTH));
  EXPECT_EQ(debug_id_from_guid_span({}, 1, id),
            dires_error(DI_WHAT_INVALID_LENGTH));
  EXPECT_EQ(id, DebugId(k_uuid, 1));
}

} // namespace debugid
