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

#include <vaultboost/core/log_level_map.hpp>
#include <vaultboost/core/result.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_config.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <evmc/hex.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

int main(int const argc, char const *argv[])
{
    using namespace vaultboost;
    namespace fs = std::filesystem;

    CLI::App cli{"vault_boost_genesis"};
    cli.option_defaults()->always_capture_default();

    fs::path genesis_file{};
    fs::path output_file{};
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--genesis", genesis_file, "genesis file to read")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option(
        "--output",
        output_file,
        "genesis file to write, the input file when not given");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::RequiredError const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    if (output_file.empty()) {
        output_file = genesis_file;
    }

    nlohmann::json genesis_json;
    {
        std::ifstream ifile(genesis_file);
        genesis_json = nlohmann::json::parse(ifile, nullptr, false);
    }
    if (genesis_json.is_discarded()) {
        LOG_ERROR("{} is not valid json", genesis_file.string());
        quill::flush();
        return EXIT_FAILURE;
    }

    auto const config = read_vault_boost_hook_config(genesis_json);
    if (config.has_error()) {
        LOG_ERROR(
            "reading {}: {}",
            genesis_file.string(),
            config.assume_error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }

    auto const res = write_vault_boost_hook_genesis(genesis_json, config.value());
    if (res.has_error()) {
        LOG_ERROR(
            "deploying hook at {}: {}",
            evmc::hex(config.value().address),
            res.assume_error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }

    if (save_genesis_file(output_file, genesis_json).has_error()) {
        quill::flush();
        return EXIT_FAILURE;
    }
    LOG_INFO(
        "hook {} for prize pool {} written to {}",
        evmc::hex(config.value().address),
        evmc::hex(config.value().prize_pool),
        output_file.string());

    quill::flush();
    return EXIT_SUCCESS;
}
