/**
 * @file
 * @brief Configuration file parser
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <toml++/toml.hpp>

#include "scpilink/build.hpp"
#include "scpilink/core/config/Configuration.hpp"

namespace scpilink::config {

    /**
     * @brief Reader class for configuration files
     *
     * Read TOML configuration file and provide access methods to obtain the configuration of individual sections,
     * e.g. `[instrument]` for the instrument to connect to.
     */
    class ConfigParser {
    public:
        /**
         * @brief Constructs a config parser from a file
         * @param file Path to the TOML file
         * @throws ConfigFileNotFoundError If the file does not exist
         * @throws ConfigParseError If the file is not valid TOML
         */
        SCPILINK_API explicit ConfigParser(const std::filesystem::path& file);

        /**
         * @brief Constructs a config parser from a string holding TOML
         * @param toml TOML document
         * @throws ConfigParseError If the string is not valid TOML
         */
        SCPILINK_API static ConfigParser fromString(std::string_view toml);

        /**
         * @brief Check if a configuration section exists
         * @param name Name of a section to search for
         * @return True if a table with this name exists, false otherwise
         */
        SCPILINK_API bool hasConfiguration(std::string_view name) const;

        /**
         * @brief Get the configuration of a section
         * @param name Name of the section
         * @return Configuration object with the keys of the section
         * @throws MissingKeyError If no section with this name exists
         * @throws InvalidTypeError If the name refers to a key which is not a table
         */
        SCPILINK_API Configuration getConfiguration(std::string_view name) const;

        /**
         * @brief Get names of all sections
         */
        SCPILINK_API std::vector<std::string> getConfigurationNames() const;

    private:
        explicit ConfigParser(toml::table table) : table_(std::move(table)) {}

    private:
        toml::table table_;
    };
} // namespace scpilink::config
