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

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// json
#include "nlohmann/json.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/cli/options.h"
#include "src/id/generator.h"
#include "src/id/snowflake.h"

namespace snof::cli {

// Generate count identifiers from threads threads sharing generator.
//
// The result holds the identifiers of thread 0 first, then thread 1, and so
// on. Within one thread identifiers are in generation order.
std::vector<snof::id::Snowflake> generate(snof::id::Generator& generator,
                                          int count, int threads);

// Decode the textual identifier into a human readable line, or a JSON object
// when json is set.
absl::StatusOr<std::string> describe(std::string_view text, bool json);

// Run the snof command with the parsed options, output goes to out.
absl::Status run(const Options& options, std::ostream& out);

}  // namespace snof::cli

namespace snof::id {

void to_json(nlohmann::json& j, const Snowflake& id);

}  // namespace snof::id
