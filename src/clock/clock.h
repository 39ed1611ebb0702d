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

#include <cstdint>

namespace snof::clock {

// Unix timestamp of Jan 01 2026 00:00:00 GMT+0000 in milliseconds.
constexpr uint64_t EPOCH_MS = 1'767'225'600'000;

// Millisecond time source of the generator.
//
// Values are milliseconds since EPOCH_MS, truncated to 32 bits. A truncated
// value wraps around after ~49.7 days and then looks like a step backwards.
class Clock {
   public:
    virtual ~Clock() = default;

    virtual uint32_t now_ms() = 0;
};

// Reads the wall clock (std::chrono::system_clock).
class SystemClock final : public Clock {
   public:
    uint32_t now_ms() override;
};

// Current Unix time in milliseconds.
uint64_t unix_timestamp_now_ms();

// Convert a Unix millisecond timestamp to the 32-bit epoch-relative value.
// Times before EPOCH_MS saturate to 0.
uint32_t to_epoch_ms(uint64_t unix_ms);

}  // namespace snof::clock
