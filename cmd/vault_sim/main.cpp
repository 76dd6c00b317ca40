// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include "scenario.hpp"

#include <vault/core/config.hpp>
#include <vault/pool/vault_host.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace vault;
namespace fs = std::filesystem;

namespace
{
    // Levels the library and the runner actually log at.
    std::map<std::string, quill::LogLevel> const log_levels = {
        {"debug", quill::LogLevel::Debug},
        {"info", quill::LogLevel::Info},
        {"error", quill::LogLevel::Error},
        {"none", quill::LogLevel::None}};
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"vault-sim"};
    cli.option_defaults()->always_capture_default();

    fs::path scenario_path;
    fs::path dump_path;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--scenario", scenario_path, "scenario file to replay")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_levels, CLI::ignore_case));
    cli.add_option(
        "--dump", dump_path, "write the final state here instead of stdout");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    std::vector<Step> steps;
    try {
        std::ifstream in{scenario_path};
        steps = parse_scenario(nlohmann::json::parse(in));
    }
    catch (std::exception const &e) {
        LOG_ERROR("failed to load {}: {}", scenario_path.string(), e.what());
        quill::flush();
        return EXIT_FAILURE;
    }
    LOG_INFO("replaying {} steps from {}", steps.size(), scenario_path.string());

    VaultHost host;
    ScenarioRunner runner{host};
    bool const ok = runner.run(steps);

    auto const state = runner.dump().dump(2);
    quill::flush();
    if (dump_path.empty()) {
        std::cout << state << std::endl;
    }
    else {
        std::ofstream out{dump_path};
        out << state << std::endl;
        LOG_INFO("wrote final state to {}", dump_path.string());
    }

    quill::flush();
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
