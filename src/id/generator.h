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

#include <atomic>
#include <cstdint>
#include <memory>

// =====================================================================
// local libraries
// =====================================================================

#include "src/clock/clock.h"
#include "src/id/snowflake.h"

namespace snof::id {

// A thread-safe, lock-free Snowflake generator.
//
// The whole state is the last generated identifier, kept in one atomic word
// and advanced with compare-and-swap. Every installed word is strictly
// greater than the one it replaced, so no two calls return the same
// identifier.
//
// Identifiers are unique within one Generator only. Share a single instance
// between threads (by reference or std::shared_ptr) instead of constructing
// one per thread.
class Generator {
   public:
    // Reads the wall clock. The state starts at 0 (timestamp 0, sequence 0).
    Generator();

    explicit Generator(std::shared_ptr<snof::clock::Clock> clock);

    // copy blocker
    Generator(const Generator&) = delete;

    // assignment blocker
    void operator=(const Generator&) = delete;

    // Generate a Snowflake.
    //
    // Never fails. If the sequence of the current millisecond is exhausted,
    // or the clock is behind the last generated timestamp (this includes the
    // 32-bit timestamp wrapping around), the call spins until the clock
    // moves past it.
    Snowflake generate();

   private:
    std::shared_ptr<snof::clock::Clock> clock_;

    // last generated snowflake
    std::atomic<uint64_t> last_state_{0};
};

// Generate a Snowflake from the process-wide generator.
Snowflake generate_id();

}  // namespace snof::id
