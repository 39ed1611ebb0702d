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

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>

// =====================================================================
// third-party libraries
// =====================================================================

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/clock/clock.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/generator.h"

namespace snof::id {

Generator::Generator()
    : Generator(std::make_shared<snof::clock::SystemClock>()) {}

Generator::Generator(std::shared_ptr<snof::clock::Clock> clock)
    : clock_(std::move(clock)) {}

Snowflake Generator::generate() {
    bool stalled = false;

    while (true) {
        uint32_t now = clock_->now_ms();
        uint64_t current = last_state_.load(std::memory_order_acquire);
        Snowflake last(current);

        Snowflake next;
        if (now > last.timestamp()) {
            // new millisecond, the sequence starts over
            next = Snowflake::pack(now, 0);
        } else if (now == last.timestamp() && last.sequence() < MAX_SEQUENCE) {
            next = Snowflake::pack(now, last.sequence() + 1);
        } else {
            if (!stalled) {
                stalled = true;
                if (now == last.timestamp()) {
                    SPDLOG_DEBUG(
                        "sequence exhausted at {} ms, waiting for the next "
                        "millisecond",
                        now);
                } else {
                    SPDLOG_DEBUG(
                        "clock moved backwards: now {} ms, last {} ms, "
                        "waiting for the clock to catch up",
                        now, last.timestamp());
                }
            }
            continue;
        }

        // A failed swap means another thread got there first. Start over
        // with a fresh clock reading.
        if (last_state_.compare_exchange_weak(current, next.value(),
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
            return next;
        }
    }
}

Snowflake generate_id() {
    static Generator generator;
    return generator.generate();
}

}  // namespace snof::id
