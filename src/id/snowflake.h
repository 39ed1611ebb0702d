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

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// spdlog
#include "spdlog/spdlog.h"

namespace snof::id {

// Out of the 64 bits of an identifier, the last 22 are the sequence.
constexpr uint32_t SEQUENCE_BITS = 22;

constexpr uint64_t SEQUENCE_MASK = (uint64_t{1} << SEQUENCE_BITS) - 1;

// Largest sequence number within one millisecond.
constexpr uint32_t MAX_SEQUENCE = static_cast<uint32_t>(SEQUENCE_MASK);

// The timestamp field is 32 bits wide, everything above it is reserved.
constexpr uint32_t TIMESTAMP_BITS = 32;

constexpr uint64_t RESERVED_MASK =
    ~((uint64_t{1} << (SEQUENCE_BITS + TIMESTAMP_BITS)) - 1);

// A 64-bit identifier.
//
// Layout (from the most significant bit):
//   [10 reserved bits, always 0][32-bit timestamp][22-bit sequence]
//
// The timestamp is the number of milliseconds since snof::clock::EPOCH_MS.
// Identifiers compare as plain unsigned integers.
class Snowflake {
   public:
    constexpr Snowflake() = default;

    constexpr explicit Snowflake(uint64_t value) : value_(value) {}

    static constexpr Snowflake pack(uint32_t timestamp, uint32_t sequence) {
        return Snowflake((uint64_t{timestamp} << SEQUENCE_BITS) |
                         (sequence & SEQUENCE_MASK));
    }

    // Parse the decimal representation of an identifier.
    static absl::StatusOr<Snowflake> parse(std::string_view text);

    constexpr uint64_t value() const { return value_; }

    constexpr operator uint64_t() const { return value_; }

    // Milliseconds since snof::clock::EPOCH_MS.
    constexpr uint32_t timestamp() const {
        return static_cast<uint32_t>(value_ >> SEQUENCE_BITS);
    }

    constexpr uint32_t sequence() const {
        return static_cast<uint32_t>(value_ & SEQUENCE_MASK);
    }

    // Milliseconds since the Unix epoch, Jan 01 1970 00:00:00 GMT+0000.
    uint64_t unix_timestamp_ms() const;

    std::string to_string() const;

    constexpr auto operator<=>(const Snowflake&) const = default;

   private:
    uint64_t value_ = 0;
};

}  // namespace snof::id

namespace fmt {

template <>
struct formatter<snof::id::Snowflake> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename Context>
    constexpr auto format(const snof::id::Snowflake& id, Context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", id.value());
    }
};

}  // namespace fmt
