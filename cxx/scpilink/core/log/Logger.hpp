/**
 * @file
 * @brief Logger
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <memory>
#include <source_location>
#include <sstream>
#include <string_view>

#include <spdlog/logger.h>

#include "scpilink/build.hpp"
#include "scpilink/core/log/Level.hpp"

namespace scpilink::log {

    /**
     * Logger class
     *
     * A logger writes messages for a single topic into the sinks of the SinkManager. Messages are composed via a
     * temporary stream object which forwards the message once it goes out of scope. Use the `LOG` macro, which only
     * composes the message if the level is enabled.
     */
    class Logger {
    private:
        /**
         * Stream collecting a single log message
         */
        class SCPILINK_API LogStream final : public std::ostringstream {
        public:
            LogStream(const Logger& logger, Level level, std::source_location src_loc)
                : logger_(logger), level_(level), src_loc_(src_loc) {}

            ~LogStream() override;

            // No copy/move constructor/assignment
            LogStream(const LogStream& other) = delete;
            LogStream& operator=(const LogStream& other) = delete;
            LogStream(LogStream&& other) = delete;
            LogStream& operator=(LogStream&& other) = delete;

        private:
            const Logger& logger_;
            Level level_;
            std::source_location src_loc_;
        };

    public:
        /**
         * @brief Construct a new logger
         *
         * @param topic Topic of the logger, e.g. the name of the component logging
         */
        SCPILINK_API explicit Logger(std::string_view topic);

        /**
         * @brief Check if a message at the given level would be written
         */
        bool shouldLog(Level level) const { return spdlog_logger_->should_log(to_spdlog_level(level)); }

        /**
         * @brief Start a new log message
         *
         * The message is written when the returned stream is destroyed, i.e. at the end of the full expression.
         *
         * @param level Level of the message
         * @param src_loc Source location of the message
         * @return Stream to write the message into
         */
        LogStream log(Level level, std::source_location src_loc = std::source_location::current()) const {
            return {*this, level, src_loc};
        }

        /**
         * @brief Topic of the logger
         */
        std::string_view getTopic() const { return spdlog_logger_->name(); }

    private:
        std::shared_ptr<spdlog::logger> spdlog_logger_;
    };

} // namespace scpilink::log
