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

#include <chrono>
#include <cstdint>

// =====================================================================
// self header
// =====================================================================

#include "src/clock/clock.h"

namespace snof::clock {

uint64_t unix_timestamp_now_ms() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch)
                  .count();
    if (ms < 0) {
        return 0;
    }
    return static_cast<uint64_t>(ms);
}

uint32_t to_epoch_ms(uint64_t unix_ms) {
    if (unix_ms < EPOCH_MS) {
        return 0;
    }
    // keep the low 32 bits, the generator detects the wraparound
    return static_cast<uint32_t>(unix_ms - EPOCH_MS);
}

uint32_t SystemClock::now_ms() { return to_epoch_ms(unix_timestamp_now_ms()); }

}  // namespace snof::clock
