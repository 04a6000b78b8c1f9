// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "build_id.hpp"
#include "debug_id_format.hpp"
#include "loghandle.hpp"

namespace debugid {

// Example
// 9432ac939c015159ea375ec0a8750df908058a5a

TEST(build_id, format) {
  LogHandle handle;
  {
    const unsigned char build_id_tab[2] = {0x01, 0x01};
    BuildIdStr build_id_str(format_build_id(build_id_tab));
    EXPECT_EQ(build_id_str, std::string("0101"));
    LG_DBG("format = %s", build_id_str.c_str());
  }
  {
    const unsigned char build_id_tab[] = {
        0x94, 0x32, 0xac, 0x93, 0x9c, 0x01, 0x51, 0x59, 0xea, 0x37,
        0x5e, 0xc0, 0xa8, 0x75, 0x0d, 0xf9, 0x08, 0x05, 0x8a, 0x5a};
    BuildIdStr build_id_str(format_build_id(build_id_tab));
    LG_DBG("format = %s", build_id_str.c_str());
    EXPECT_EQ(build_id_str,
              std::string("9432ac939c015159ea375ec0a8750df908058a5a"));
  }
  EXPECT_EQ(format_build_id({}), "");
}

TEST(build_id, to_debug_id) {
  LogHandle handle;
  {
    const unsigned char build_id_tab[] = {
        0x94, 0x32, 0xac, 0x93, 0x9c, 0x01, 0x51, 0x59, 0xea, 0x37,
        0x5e, 0xc0, 0xa8, 0x75, 0x0d, 0xf9, 0x08, 0x05, 0x8a, 0x5a};
    DebugId const id = debug_id_from_build_id(build_id_tab);
    LG_DBG("debug id = %s", id.to_string().c_str());
    // bytes past 16 are dropped, leading fields are swapped
    EXPECT_EQ(format_debug_id(id, DebugIdFormat::kBreakpad),
              "93AC3294019C5951EA375EC0A8750DF90");
    EXPECT_EQ(id.appendix(), 0);
  }
  {
    // short build-ids are zero padded
    const unsigned char build_id_tab[] = {0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_EQ(debug_id_from_build_id(build_id_tab).to_string(),
              "04030201-0005-0000-0000-000000000000");
  }
  EXPECT_TRUE(debug_id_from_build_id({}).is_nil());
}

} // namespace debugid
