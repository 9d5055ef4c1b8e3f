/**
 * @file
 * @brief Logging macros
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include "scpilink/core/log/Level.hpp"
#include "scpilink/core/log/Logger.hpp"

/**
 * Log a message at the given level to the given logger
 *
 * The stream expression following the macro is only evaluated if the level is enabled:
 *
 * @code
 * LOG(logger, INFO) << "Connected to " << uri;
 * @endcode
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define LOG(logger, level)                                                                                              \
    if(!(logger).shouldLog(::scpilink::log::Level::level)) {                                                            \
    } else                                                                                                              \
        (logger).log(::scpilink::log::Level::level)

/**
 * Log a message only if the condition is true
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define LOG_IF(logger, level, condition)                                                                                \
    if(!((condition) && (logger).shouldLog(::scpilink::log::Level::level))) {                                           \
    } else                                                                                                              \
        (logger).log(::scpilink::log::Level::level)
