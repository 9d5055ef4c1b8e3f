/**
 * @file
 * @brief Collection of all configuration exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>

#include <toml++/toml.hpp>

#include "scpilink/build.hpp"
#include "scpilink/core/utils/exceptions.hpp"

namespace scpilink::config {
    /**
     * @ingroup Exceptions
     * @brief Base class for all configuration exceptions
     */
    class SCPILINK_API ConfigError : public utils::RuntimeError {
    protected:
        ConfigError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Configuration file does not exist
     */
    class SCPILINK_API ConfigFileNotFoundError : public ConfigError {
    public:
        explicit ConfigFileNotFoundError(const std::filesystem::path& file) {
            error_message_ = "Could not find configuration file \"";
            error_message_ += file.string();
            error_message_ += "\"";
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Informs of a problem in parsing a configuration
     */
    class SCPILINK_API ConfigParseError : public ConfigError {
    public:
        /**
         * @brief Construct an error for a syntax error in a file
         * @param source Region of the file in which the error occurred
         * @param issue Description of the problem
         */
        ConfigParseError(const toml::source_region& source, std::string_view issue) {
            error_message_ = "Error parsing file \"";
            std::stringstream s;
            if(source.path) {
                s << *source.path;
            }
            s << "\" at position " << source.begin;
            error_message_ += s.str();
            error_message_ += ": ";
            error_message_ += issue;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Key is missing in the configuration
     */
    class SCPILINK_API MissingKeyError : public ConfigError {
    public:
        explicit MissingKeyError(std::string_view key) {
            error_message_ = "Key \"";
            error_message_ += key;
            error_message_ += "\" does not exist";
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Value of a key has a type that cannot be converted to the requested one
     */
    class SCPILINK_API InvalidTypeError : public ConfigError {
    public:
        InvalidTypeError(std::string_view key, std::string_view vtype, std::string_view type) {
            error_message_ = "Could not convert value of type \"";
            error_message_ += vtype;
            error_message_ += "\" to type \"";
            error_message_ += type;
            error_message_ += "\" for key \"";
            error_message_ += key;
            error_message_ += "\"";
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Value of a key has the correct type but is not acceptable
     */
    class SCPILINK_API InvalidValueError : public ConfigError {
    public:
        InvalidValueError(std::string_view key, std::string_view reason) {
            error_message_ = "Value of key \"";
            error_message_ += key;
            error_message_ += "\" is not valid: ";
            error_message_ += reason;
        }
    };

} // namespace scpilink::config
