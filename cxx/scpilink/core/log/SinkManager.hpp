/**
 * @file
 * @brief Global sink manager
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "scpilink/build.hpp"
#include "scpilink/core/log/Level.hpp"

namespace scpilink::log {

    /**
     * Global sink manager
     *
     * This class manages the console sink and creates the spdlog loggers which write into it. Loggers are cached by
     * topic, so that all loggers with the same topic share a single spdlog logger.
     */
    class SinkManager {
    public:
        SCPILINK_API static SinkManager& getInstance();

        ~SinkManager() = default;

        // No copy/move constructor/assignment
        SinkManager(const SinkManager& other) = delete;
        SinkManager& operator=(const SinkManager& other) = delete;
        SinkManager(SinkManager&& other) = delete;
        SinkManager& operator=(SinkManager&& other) = delete;

        /**
         * @brief Set the console log level of all existing and future loggers
         *
         * @param level Minimum level of messages written to the console
         */
        SCPILINK_API void setGlobalConsoleLevel(Level level);

        /**
         * @brief Get the current console log level
         */
        SCPILINK_API Level getGlobalConsoleLevel() const;

        /**
         * @brief Get the spdlog logger for a topic, creating it if necessary
         *
         * @param topic Logger topic, written in front of every message
         * @return Shared pointer to the spdlog logger
         */
        SCPILINK_API std::shared_ptr<spdlog::logger> getLogger(std::string_view topic);

    private:
        SinkManager();

    private:
        std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
        std::map<std::string, std::shared_ptr<spdlog::logger>, std::less<>> loggers_;
        mutable std::mutex loggers_mutex_;
        Level console_level_ {INFO};
    };

} // namespace scpilink::log
