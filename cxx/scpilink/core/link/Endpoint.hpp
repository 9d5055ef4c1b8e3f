/**
 * @file
 * @brief Network endpoint of an instrument
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cmath>
#include <string>

#include "scpilink/build.hpp"
#include "scpilink/core/config/Configuration.hpp"
#include "scpilink/core/utils/networking.hpp"

namespace scpilink::link {

    /** Fixed raw socket SCPI port of the Anritsu MT9085 ACCESS Master */
    constexpr utils::Port MT9085_SCPI_PORT = 2288;

    /** Default timeout for connecting, writing and waiting for a response */
    constexpr std::chrono::seconds DEFAULT_TIMEOUT {10};

    /** Default line terminator */
    constexpr auto DEFAULT_TERMINATOR = "\n";

    /** Upper limit for the timeout and the command delay */
    constexpr std::chrono::hours MAX_DURATION {24};

    /**
     * @brief Check that a number of seconds is finite, not negative and not larger than `MAX_DURATION`
     */
    inline bool seconds_in_range(double seconds) {
        return std::isfinite(seconds) && seconds >= 0. &&
               seconds <= std::chrono::duration<double>(MAX_DURATION).count();
    }

    /**
     * @brief Address and line settings of an instrument
     */
    struct Endpoint {
        /** IP address or hostname of the instrument */
        std::string host;

        /** TCP port of the instrument's SCPI server */
        utils::Port port {};

        /** Timeout for connecting, for writing a command and for receiving a response */
        std::chrono::steady_clock::duration timeout {DEFAULT_TIMEOUT};

        /** Byte sequence terminating every command and response */
        std::string terminator {DEFAULT_TERMINATOR};

        /** Pause after every command, for instruments which need time to process a command */
        std::chrono::steady_clock::duration command_delay {};

        /**
         * @brief URI of the endpoint for logging, e.g. `tcp://192.168.1.2:2288`
         */
        std::string getURI() const { return utils::endpoint_to_uri("tcp", host, port); }

        /**
         * @brief Check that the endpoint can be used by a link
         *
         * @throws InvalidEndpointError If the host or terminator is empty, the port is zero, the timeout is not
         *         positive or the command delay is negative, or one of them is longer than `MAX_DURATION`
         */
        SCPILINK_API void validate() const;
    };

    /**
     * @brief Create an endpoint from a configuration
     *
     * Reads the keys `host`, `port`, `timeout` in seconds, `terminator` and `command_delay` in seconds. Keys missing in
     * the configuration keep the value of the given defaults, `host` and `port` are required if the defaults do not
     * set them.
     *
     * @param config Configuration, e.g. the `[instrument]` section of a configuration file
     * @param defaults Endpoint providing the values of keys missing in the configuration
     * @return Validated endpoint
     * @throws config::MissingKeyError If `host` or `port` is missing and not set in the defaults
     * @throws config::InvalidTypeError If a value has the wrong type
     * @throws config::InvalidValueError If a value is out of range
     * @throws InvalidEndpointError If the defaults are not valid
     */
    SCPILINK_API Endpoint endpoint_from_config(const config::Configuration& config, Endpoint defaults = {});

} // namespace scpilink::link
