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

#include <ostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// self header
// =====================================================================

#include "src/cli/cli.h"

namespace snof::id {

void to_json(nlohmann::json& j, const Snowflake& id) {
    j = nlohmann::json{
        {"id", id.value()},
        {"timestamp", id.timestamp()},
        {"sequence", id.sequence()},
        {"unix_timestamp_ms", id.unix_timestamp_ms()},
    };
}

}  // namespace snof::id

namespace snof::cli {

std::vector<snof::id::Snowflake> generate(snof::id::Generator& generator,
                                          int count, int threads) {
    if (count <= 0 || threads <= 0) {
        return {};
    }
    if (threads > count) {
        threads = count;
    }

    // one result vector per thread, merged after join
    std::vector<std::vector<snof::id::Snowflake>> results(threads);
    std::vector<std::thread> workers;
    workers.reserve(threads);

    for (int i = 0; i < threads; ++i) {
        // the first (count % threads) threads take one extra
        int share = count / threads + (i < count % threads ? 1 : 0);
        workers.emplace_back([&generator, &result = results[i], share]() {
            result.reserve(share);
            for (int n = 0; n < share; ++n) {
                result.push_back(generator.generate());
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    std::vector<snof::id::Snowflake> ids;
    ids.reserve(count);
    for (const auto& result : results) {
        ids.insert(ids.end(), result.begin(), result.end());
    }
    return ids;
}

absl::StatusOr<std::string> describe(std::string_view text, bool json) {
    auto id = snof::id::Snowflake::parse(text);
    if (!id.ok()) {
        return id.status();
    }

    if (json) {
        return nlohmann::json(id.value()).dump();
    }
    return absl::StrFormat("id: %d, timestamp: %d, sequence: %d, unix_ms: %d",
                           id->value(), id->timestamp(), id->sequence(),
                           id->unix_timestamp_ms());
}

absl::Status run(const Options& options, std::ostream& out) {
    SPDLOG_DEBUG("options: {}", nlohmann::json(options).dump());

    if (!options.decode.empty()) {
        for (const auto& text : options.decode) {
            auto line = describe(text, options.json);
            if (!line.ok()) {
                SPDLOG_ERROR("failed to decode \"{}\": {}", text,
                             line.status().ToString());
                return line.status();
            }
            out << line.value() << '\n';
        }
        return absl::OkStatus();
    }

    if (options.count <= 0) {
        return absl::InvalidArgumentError(
            absl::StrFormat("count must be positive, got %d", options.count));
    }
    if (options.threads <= 0) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "threads must be positive, got %d", options.threads));
    }

    snof::id::Generator generator;
    auto ids = generate(generator, options.count, options.threads);
    SPDLOG_INFO("generated {} identifiers on {} threads", ids.size(),
                options.threads);

    for (const auto& id : ids) {
        out << id.value() << '\n';
    }
    return absl::OkStatus();
}

}  // namespace snof::cli
