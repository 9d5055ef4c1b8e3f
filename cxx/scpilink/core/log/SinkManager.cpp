/**
 * @file
 * @brief Implementation of the global sink manager
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "SinkManager.hpp"

#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <magic_enum.hpp>
#include <spdlog/details/log_msg.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "scpilink/core/log/Level.hpp"

using namespace scpilink::log;

namespace {
    // Formatter for the level name, using the names of the library levels instead of the spdlog ones
    class LevelFormatter : public spdlog::custom_flag_formatter {
    public:
        void format(const spdlog::details::log_msg& msg, const std::tm& /*tm*/, spdlog::memory_buf_t& dest) override {
            const auto level_name = magic_enum::enum_name(from_spdlog_level(msg.level));
            dest.append(level_name.data(), level_name.data() + level_name.size());
        }

        std::unique_ptr<custom_flag_formatter> clone() const override { return std::make_unique<LevelFormatter>(); }
    };
} // namespace

SinkManager& SinkManager::getInstance() {
    static SinkManager instance {};
    return instance;
}

SinkManager::SinkManager() : console_sink_(std::make_shared<spdlog::sinks::stdout_color_sink_mt>()) {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelFormatter>('*').set_pattern("|%Y-%m-%d %H:%M:%S.%e| %^%*%$ [%n] %v");
    console_sink_->set_formatter(std::move(formatter));

    console_sink_->set_color(to_spdlog_level(CRITICAL), console_sink_->red_bold);
}

void SinkManager::setGlobalConsoleLevel(Level level) {
    const std::lock_guard loggers_lock {loggers_mutex_};
    console_level_ = level;
    for(auto& [topic, logger] : loggers_) {
        logger->set_level(to_spdlog_level(level));
    }
}

Level SinkManager::getGlobalConsoleLevel() const {
    const std::lock_guard loggers_lock {loggers_mutex_};
    return console_level_;
}

std::shared_ptr<spdlog::logger> SinkManager::getLogger(std::string_view topic) {
    const std::lock_guard loggers_lock {loggers_mutex_};

    const auto logger_it = loggers_.find(topic);
    if(logger_it != loggers_.end()) {
        return logger_it->second;
    }

    auto logger = std::make_shared<spdlog::logger>(std::string(topic), console_sink_);
    logger->set_level(to_spdlog_level(console_level_));
    loggers_.emplace(topic, logger);
    return logger;
}
