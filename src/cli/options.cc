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

#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/strings/str_format.h"

// =====================================================================
// self header
// =====================================================================

#include "src/cli/options.h"

namespace snof::cli {

void add_options(CLI::App& app, Options& options) {
    app.add_option("-n,--count", options.count,
                   "Number of identifiers to generate")
        ->check(CLI::Range(1, 10'000'000));

    app.add_option("-t,--threads", options.threads,
                   "Number of threads sharing one generator")
        ->check(CLI::Range(1, 256));

    app.add_option("-d,--decode", options.decode,
                   "Decode identifiers instead of generating");

    app.add_flag("--json", options.json, "Print decoded identifiers as JSON");

    app.add_option("--log-level", options.log_level,
                   "Log level (trace, debug, info, warn, error, off)")
        ->check(CLI::IsMember(
            {"trace", "debug", "info", "warn", "error", "off"}));
}

absl::StatusOr<spdlog::level::level_enum> parse_log_level(
    const std::string& name) {
    // from_str() maps unknown names to off
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return absl::InvalidArgumentError(
            absl::StrFormat("unknown log level: %s", name));
    }
    return level;
}

void to_json(nlohmann::json& j, const Options& options) {
    j = nlohmann::json{
        {"count", options.count},
        {"threads", options.threads},
        {"decode", options.decode},
        {"json", options.json},
        {"log_level", options.log_level},
    };
}

void from_json(const nlohmann::json& j, Options& options) {
    j.at("count").get_to(options.count);
    j.at("threads").get_to(options.threads);
    j.at("decode").get_to(options.decode);
    j.at("json").get_to(options.json);
    j.at("log_level").get_to(options.log_level);
}

}  // namespace snof::cli
