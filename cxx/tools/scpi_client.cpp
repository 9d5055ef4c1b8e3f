/**
 * @file
 * @brief Command line client sending SCPI commands to an instrument
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <cctype>
#include <chrono>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <magic_enum.hpp>

#include "scpilink/build.hpp"
#include "scpilink/core/config/ConfigParser.hpp"
#include "scpilink/core/link/command.hpp"
#include "scpilink/core/link/Endpoint.hpp"
#include "scpilink/core/link/InstrumentLink.hpp"
#include "scpilink/core/link/ScopedConnection.hpp"
#include "scpilink/core/log/Level.hpp"
#include "scpilink/core/log/log.hpp"
#include "scpilink/core/log/Logger.hpp"
#include "scpilink/core/log/SinkManager.hpp"
#include "scpilink/core/utils/chrono.hpp"
#include "scpilink/core/utils/exceptions.hpp"
#include "scpilink/core/utils/string.hpp"

using namespace scpilink;
using namespace scpilink::config;
using namespace scpilink::link;
using namespace scpilink::log;
using namespace scpilink::utils;

namespace {
    // Line terminator of the MT9085 SCPI server
    constexpr std::string_view MT9085_TERMINATOR = "\r\n";

    // NOLINTNEXTLINE(*-avoid-c-arrays)
    void parse_args(int argc, char* argv[], argparse::ArgumentParser& parser) {
        // Commands to send, queries are recognized by the question mark
        parser.add_argument("commands").help("SCPI commands to send (default: *IDN?)").remaining();

        // Instrument address
        parser.add_argument("-H", "--host").help("IP address or hostname of the instrument");
        parser.add_argument("-p", "--port").help("SCPI port of the instrument (default: 2288)").scan<'i', int>();
        parser.add_argument("-t", "--timeout").help("timeout in seconds (default: 10)").scan<'g', double>();
        parser.add_argument("--terminator").help("line terminator, escapes like \\r\\n are resolved (default: \\r\\n)");
        parser.add_argument("--delay").help("pause after every command in seconds (default: 0)").scan<'g', double>();

        // Configuration file with the instrument address
        parser.add_argument("-c", "--config").help("TOML configuration file with the instrument address");
        parser.add_argument("-s", "--section").help("section of the configuration file").default_value("instrument");

        // Console log level (-l)
        parser.add_argument("-l", "--level").help("console log level").default_value("WARNING");

        // Note: this might throw
        parser.parse_args(argc, argv);
    }

    // Convert an option in seconds, rejecting values which do not fit into a duration
    std::chrono::steady_clock::duration seconds_option(const argparse::ArgumentParser& parser, std::string_view name) {
        const auto seconds = parser.get<double>(name);
        if(!seconds_in_range(seconds)) {
            throw LogicError("Value " + to_string(seconds) + " of option " + to_string(name) + " is not in range 0-" +
                             to_string(std::chrono::duration<double>(MAX_DURATION).count()) + " seconds");
        }
        return seconds_to_duration(seconds);
    }

    // Build endpoint from configuration file and command line, options on the command line take precedence
    Endpoint make_endpoint(const argparse::ArgumentParser& parser) {
        Endpoint endpoint {};
        endpoint.port = MT9085_SCPI_PORT;
        endpoint.terminator = MT9085_TERMINATOR;

        // Keys missing in the configuration file keep the defaults, the host might be given on the command line only
        const auto config_file = parser.present("--config");
        if(config_file.has_value()) {
            endpoint.host = parser.present("--host").value_or("");
            const auto config_parser = ConfigParser(config_file.value());
            const auto section = parser.get("--section");
            if(!config_parser.hasConfiguration(section)) {
                throw LogicError("Configuration file has no section \"" + section + "\", available sections: " +
                                 list_to_string(config_parser.getConfigurationNames(),
                                                [](const std::string& name) { return name; }));
            }
            const auto config = config_parser.getConfiguration(section);
            endpoint = endpoint_from_config(config, std::move(endpoint));
        }

        if(parser.is_used("--host")) {
            endpoint.host = parser.get("--host");
        }
        if(parser.is_used("--port")) {
            const auto port = parser.get<int>("--port");
            if(port <= 0 || port > std::numeric_limits<Port>::max()) {
                throw LogicError("Port " + to_string(port) + " is not in range 1-65535");
            }
            endpoint.port = static_cast<Port>(port);
        }
        if(parser.is_used("--timeout")) {
            endpoint.timeout = seconds_option(parser, "--timeout");
        }
        if(parser.is_used("--terminator")) {
            endpoint.terminator = unescape(parser.get("--terminator"));
        }
        if(parser.is_used("--delay")) {
            endpoint.command_delay = seconds_option(parser, "--delay");
        }

        endpoint.validate();
        return endpoint;
    }
} // namespace

int main(int argc, char* argv[]) {
    auto logger = Logger("CLIENT");

    // CLI parsing
    argparse::ArgumentParser parser {"scpi_client", SCPILINK_VERSION};
    try {
        parse_args(argc, argv, parser);
    } catch(const std::exception& error) {
        LOG(logger, CRITICAL) << "Argument parsing failed: " << error.what();
        LOG(logger, CRITICAL) << "Run \"scpi_client --help\" for help";
        return 1;
    }

    // Set log level
    const auto default_level = magic_enum::enum_cast<Level>(transform(parser.get("--level"), ::toupper));
    if(!default_level.has_value()) {
        LOG(logger, CRITICAL) << "Log level \"" << parser.get("--level") << "\" is not valid"
                              << ", possible values are: " << list_enum_names<Level>();
        return 1;
    }
    SinkManager::getInstance().setGlobalConsoleLevel(default_level.value());

    std::optional<Endpoint> endpoint {};
    try {
        endpoint = make_endpoint(parser);
    } catch(const Exception& error) {
        LOG(logger, CRITICAL) << "Invalid instrument address: " << error.what();
        return 1;
    }

    auto commands = parser.present<std::vector<std::string>>("commands").value_or(std::vector<std::string>());
    if(commands.empty()) {
        commands.emplace_back("*IDN?");
    }

    try {
        InstrumentLink link {std::move(endpoint.value())};
        const ScopedConnection connection {link};

        for(const auto& command : commands) {
            if(is_query(command)) {
                std::cout << connection->query(command) << std::endl;
            } else {
                connection->send(command);
            }
        }
    } catch(const Exception& error) {
        LOG(logger, CRITICAL) << error.what();
        return 1;
    }

    return 0;
}
