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

#include <iostream>

// =====================================================================
// third-party libraries
// =====================================================================

// spdlog
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

// CLI11
#include "CLI/CLI.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/cli/cli.h"
#include "src/cli/options.h"

int main(int argc, char *argv[]) {
    // identifiers go to stdout, keep the logs out of the way
    spdlog::set_default_logger(spdlog::stderr_color_mt("snof"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%@] %v");

    CLI::App app{"snof - lock-free unique identifier generator"};

    snof::cli::Options options;
    snof::cli::add_options(app, options);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    auto level = snof::cli::parse_log_level(options.log_level);
    if (!level.ok()) {
        SPDLOG_ERROR("{}", level.status().ToString());
        return 1;
    }
    spdlog::set_level(level.value());

    auto status = snof::cli::run(options, std::cout);
    if (!status.ok()) {
        std::cerr << status.ToString() << std::endl;
        return 1;
    }
    return 0;
}
