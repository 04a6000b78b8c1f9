// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "debug_id.hpp"
#include "debugid_res.hpp"
#include "guid_codec.hpp"
#include "loghandle.hpp"

#include <absl/container/flat_hash_map.h>
#include <absl/hash/hash.h>

#include <map>
#include <sstream>
#include <unordered_set>

namespace debugid {

namespace {
// dfb8e43a-f242-3d73-a453-aeb6a777ef75
constexpr DebugIdBytes k_uuid = {0xdf, 0xb8, 0xe4, 0x3a, 0xf2, 0x42,
                                 0x3d, 0x73, 0xa4, 0x53, 0xae, 0xb6,
                                 0xa7, 0x77, 0xef, 0x75};
} // namespace

TEST(DebugId, nil) {
  DebugId const nil = DebugId::nil();
  EXPECT_TRUE(nil.is_nil());
  EXPECT_EQ(nil, DebugId());
  EXPECT_EQ(nil.appendix(), 0);
  EXPECT_EQ(nil.to_string(), "00000000-0000-0000-0000-000000000000");

  // an appendix alone is enough to not be nil
  EXPECT_FALSE(DebugId(DebugIdBytes{}, 1).is_nil());
  EXPECT_FALSE(DebugId(k_uuid).is_nil());
}

TEST(DebugId, from_parts) {
  DebugId const id(k_uuid, 10);
  EXPECT_EQ(id.uuid(), k_uuid);
  EXPECT_EQ(id.appendix(), 10);
  EXPECT_EQ(DebugId(k_uuid).appendix(), 0);
}

TEST(DebugId, to_string) {
  EXPECT_EQ(DebugId(k_uuid, 0).to_string(),
            "dfb8e43a-f242-3d73-a453-aeb6a777ef75");
  EXPECT_EQ(DebugId(k_uuid, 10).to_string(),
            "dfb8e43a-f242-3d73-a453-aeb6a777ef75-a");
  EXPECT_EQ(DebugId(k_uuid, 4'277'009'102).to_string(),
            "dfb8e43a-f242-3d73-a453-aeb6a777ef75-feedface");

  std::ostringstream os;
  os << DebugId(k_uuid, 10);
  EXPECT_EQ(os.str(), "dfb8e43a-f242-3d73-a453-aeb6a777ef75-a");
}

TEST(DebugId, to_debug_string) {
  EXPECT_EQ(DebugId(k_uuid, 10).to_debug_string(),
            "DebugId { uuid: \"dfb8e43a-f242-3d73-a453-aeb6a777ef75\", "
            "appendix: 10 }");
}

TEST(DebugId, parse_throws) {
  LogHandle handle;
  EXPECT_EQ(DebugId::parse("DFB8E43A-F242-3D73-A453-AEB6A777EF75-A"),
            DebugId(k_uuid, 10));
  try {
    (void)DebugId::parse("dfb8e43a-f242-3d73-a453-aeb6a777ef7");
    FAIL() << "short id should not parse";
  } catch (const DIException &e) {
    EXPECT_EQ(e.get_DIRes(), dires_error(DI_WHAT_INVALID_LENGTH));
  }
}

TEST(DebugId, ordering) {
  DebugIdBytes bigger = k_uuid;
  bigger[15] = 0x76;
  EXPECT_LT(DebugId(k_uuid, 10), DebugId(k_uuid, 11));
  EXPECT_LT(DebugId(k_uuid, 0xffffffff), DebugId(bigger, 0));
  EXPECT_LT(DebugId::nil(), DebugId(k_uuid));

  std::map<DebugId, int> ids;
  ids[DebugId(bigger)] = 2;
  ids[DebugId(k_uuid, 3)] = 1;
  ids[DebugId::nil()] = 0;
  int expected = 0;
  for (const auto &[id, value] : ids) {
    EXPECT_EQ(value, expected++);
  }
}

// Same native identifier coming from a string and from PDB bytes
TEST(DebugId, hash_consistent_across_codecs) {
  LogHandle handle;
  DebugIdBytes const guid = {0x3a, 0xe4, 0xb8, 0xdf, 0x42, 0xf2, 0x73, 0x3d,
                             0xa4, 0x53, 0xae, 0xb6, 0xa7, 0x77, 0xef, 0x75};
  DebugId const from_bytes = from_guid_bytes(guid, 10);
  DebugId const from_str =
      DebugId::parse("DFB8E43AF2423D73A453AEB6A777EF75a");

  EXPECT_EQ(from_bytes, from_str);
  EXPECT_EQ(absl::Hash<DebugId>{}(from_bytes), absl::Hash<DebugId>{}(from_str));
  EXPECT_EQ(std::hash<DebugId>{}(from_bytes), std::hash<DebugId>{}(from_str));
  EXPECT_NE(std::hash<DebugId>{}(from_bytes),
            std::hash<DebugId>{}(DebugId(k_uuid, 11)));

  absl::flat_hash_map<DebugId, std::string> symbol_files;
  symbol_files[from_bytes] = "app.pdb";
  EXPECT_EQ(symbol_files.at(from_str), "app.pdb");

  std::unordered_set<DebugId> seen{from_bytes};
  EXPECT_TRUE(seen.contains(from_str));
  EXPECT_FALSE(seen.contains(DebugId(k_uuid)));
}

} // namespace debugid
