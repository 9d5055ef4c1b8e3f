/**
 * @file
 * @brief Implementation of the instrument endpoint
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Endpoint.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include "scpilink/core/config/Configuration.hpp"
#include "scpilink/core/config/exceptions.hpp"
#include "scpilink/core/link/exceptions.hpp"
#include "scpilink/core/utils/chrono.hpp"
#include "scpilink/core/utils/string.hpp"

using namespace scpilink::config;
using namespace scpilink::link;
using namespace scpilink::utils;

void Endpoint::validate() const {
    if(host.empty()) {
        throw InvalidEndpointError("host is empty");
    }
    if(port == 0) {
        throw InvalidEndpointError("port is zero");
    }
    if(timeout <= std::chrono::steady_clock::duration::zero()) {
        throw InvalidEndpointError("timeout needs to be positive");
    }
    if(terminator.empty()) {
        throw InvalidEndpointError("terminator is empty");
    }
    if(command_delay < std::chrono::steady_clock::duration::zero()) {
        throw InvalidEndpointError("command delay is negative");
    }
    if(timeout > MAX_DURATION || command_delay > MAX_DURATION) {
        throw InvalidEndpointError("timeout and command delay cannot be longer than " + to_string(MAX_DURATION));
    }
}

Endpoint scpilink::link::endpoint_from_config(const Configuration& config, Endpoint defaults) {
    auto endpoint = std::move(defaults);

    if(config.has("host") || endpoint.host.empty()) {
        endpoint.host = config.get<std::string>("host");
        if(endpoint.host.empty()) {
            throw InvalidValueError("host", "empty host");
        }
    }

    // Read as signed integer to report out of range ports as invalid value instead of invalid type
    if(config.has("port") || endpoint.port == 0) {
        const auto port = config.get<std::int64_t>("port");
        if(port <= 0 || port > std::numeric_limits<Port>::max()) {
            throw InvalidValueError("port", "port " + std::to_string(port) + " is not in range 1-65535");
        }
        endpoint.port = static_cast<Port>(port);
    }

    if(config.has("timeout")) {
        const auto timeout = config.get<double>("timeout");
        if(timeout <= 0. || !seconds_in_range(timeout)) {
            throw InvalidValueError("timeout", "timeout needs to be positive and at most " + to_string(MAX_DURATION));
        }
        endpoint.timeout = seconds_to_duration(timeout);
    }

    if(config.has("terminator")) {
        endpoint.terminator = config.get<std::string>("terminator");
        if(endpoint.terminator.empty()) {
            throw InvalidValueError("terminator", "empty terminator");
        }
    }

    if(config.has("command_delay")) {
        const auto command_delay = config.get<double>("command_delay");
        if(!seconds_in_range(command_delay)) {
            throw InvalidValueError("command_delay",
                                    "command delay cannot be negative or longer than " + to_string(MAX_DURATION));
        }
        endpoint.command_delay = seconds_to_duration(command_delay);
    }

    endpoint.validate();
    return endpoint;
}
