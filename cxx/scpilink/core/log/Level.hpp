/**
 * @file
 * @brief Log levels
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstdint>

#include <spdlog/common.h>

namespace scpilink::log {

    /** Log levels, ordered by severity, with the values of the matching spdlog levels */
    enum class Level : std::uint8_t {
        /** Verbose information, e.g. every command sent to an instrument */
        TRACE = 0,
        /** Information useful for debugging */
        DEBUG = 1,
        /** Informational messages */
        INFO = 2,
        /** Something unexpected happened, but operation continues */
        WARNING = 3,
        /** Failure which stops the current operation */
        CRITICAL = 5,
        /** Logging disabled */
        OFF = 6,
    };
    using enum Level;

    /** Convert a log level to the spdlog level it is emitted with */
    constexpr spdlog::level::level_enum to_spdlog_level(Level level) {
        return static_cast<spdlog::level::level_enum>(level);
    }

    /** Convert an spdlog level back to a log level */
    constexpr Level from_spdlog_level(spdlog::level::level_enum level) {
        return static_cast<Level>(level);
    }

} // namespace scpilink::log
