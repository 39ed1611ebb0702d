// Copyright 2025 Xiaochen Cui
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// =====================================================================
// c++ std
// =====================================================================

#include <cstdint>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

// gtest
#include "gtest/gtest.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/clock/clock.h"
#include "src/id/snowflake.h"
#include "test/environment.h"

using snof::id::MAX_SEQUENCE;
using snof::id::Snowflake;

TEST(SnowflakeTest, Layout) {
    auto id = Snowflake::pack(1000, 3);
    EXPECT_EQ(id.value(), (uint64_t{1000} << 22) | 3);
    EXPECT_EQ(id.timestamp(), 1000u);
    EXPECT_EQ(id.sequence(), 3u);

    // the largest valid identifier leaves the reserved bits clear
    auto max = Snowflake::pack(UINT32_MAX, MAX_SEQUENCE);
    EXPECT_EQ(max.value(), (uint64_t{1} << 54) - 1);
    EXPECT_EQ(max.timestamp(), UINT32_MAX);
    EXPECT_EQ(max.sequence(), MAX_SEQUENCE);
}

TEST(SnowflakeTest, PackMasksSequence) {
    auto id = Snowflake::pack(1, MAX_SEQUENCE + 1);
    EXPECT_EQ(id.timestamp(), 1u);
    EXPECT_EQ(id.sequence(), 0u);
}

TEST(SnowflakeTest, OrderFollowsTimestampThenSequence) {
    EXPECT_TRUE(Snowflake::pack(1000, 1) < Snowflake::pack(1000, 2));
    EXPECT_TRUE(Snowflake::pack(1000, MAX_SEQUENCE) <
                Snowflake::pack(1001, 0));
    EXPECT_TRUE(Snowflake::pack(7, 7) == Snowflake((uint64_t{7} << 22) | 7));
}

TEST(SnowflakeTest, UnixTimestamp) {
    EXPECT_EQ(Snowflake::pack(0, 5).unix_timestamp_ms(),
              snof::clock::EPOCH_MS);
    EXPECT_EQ(Snowflake::pack(86'400'000, 0).unix_timestamp_ms(),
              snof::clock::EPOCH_MS + 86'400'000);
}

TEST(SnowflakeTest, Parse) {
    auto id = Snowflake::parse("4194304003");
    ASSERT_TRUE(id.ok()) << id.status();
    EXPECT_EQ(id->timestamp(), 1000u);
    EXPECT_EQ(id->sequence(), 3u);

    auto zero = Snowflake::parse("0");
    ASSERT_TRUE(zero.ok());
    EXPECT_EQ(zero->value(), 0u);
}

TEST(SnowflakeTest, ParseRejectsInvalidText) {
    for (const char* text :
         {"", "abc", "12abc", "-1", "1.5", "18446744073709551616"}) {
        auto id = Snowflake::parse(text);
        EXPECT_FALSE(id.ok()) << text;
        EXPECT_EQ(id.status().code(), absl::StatusCode::kInvalidArgument)
            << text;
    }
}

TEST(SnowflakeTest, ParseRejectsReservedBits) {
    auto id = Snowflake::parse(std::to_string(uint64_t{1} << 54));
    ASSERT_FALSE(id.ok());
    EXPECT_EQ(id.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(SnowflakeTest, Format) {
    auto id = Snowflake::pack(1001, 0);
    EXPECT_EQ(id.to_string(), "4198498304");
    EXPECT_EQ(fmt::format("{}", id), "4198498304");
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    testing::AddGlobalTestEnvironment(new test::SnofEnvironment);

    return RUN_ALL_TESTS();
}
