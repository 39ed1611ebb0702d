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

#include <string>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// CLI11
#include "CLI/CLI.hpp"

// json
#include "nlohmann/json.hpp"

// spdlog
#include "spdlog/spdlog.h"

namespace snof::cli {

// Command line options of the snof executable.
class Options {
   public:
    // Number of identifiers to generate, split across all threads.
    int count = 1;

    // Number of threads sharing one generator.
    int threads = 1;

    // Identifiers to decode. When not empty nothing is generated.
    std::vector<std::string> decode;

    // Print decoded identifiers as JSON.
    bool json = false;

    std::string log_level = "warn";
};

// Register all options on app, parsed values are written into options.
void add_options(CLI::App& app, Options& options);

absl::StatusOr<spdlog::level::level_enum> parse_log_level(
    const std::string& name);

void to_json(nlohmann::json& j, const Options& options);

void from_json(const nlohmann::json& j, Options& options);

}  // namespace snof::cli
