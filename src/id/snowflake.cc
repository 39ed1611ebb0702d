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
#include <string_view>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/clock/clock.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/snowflake.h"

namespace snof::id {

absl::StatusOr<Snowflake> Snowflake::parse(std::string_view text) {
    if (text.empty()) {
        return absl::InvalidArgumentError("empty identifier");
    }

    uint64_t value = 0;
    if (!absl::SimpleAtoi(absl::string_view(text.data(), text.size()), &value)) {
        return absl::InvalidArgumentError(
            absl::StrFormat("invalid identifier: \"%s\"", text));
    }

    if ((value & RESERVED_MASK) != 0) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "identifier %d has reserved bits set", value));
    }

    return Snowflake(value);
}

uint64_t Snowflake::unix_timestamp_ms() const {
    return uint64_t{timestamp()} + snof::clock::EPOCH_MS;
}

std::string Snowflake::to_string() const { return std::to_string(value_); }

}  // namespace snof::id
