/**
 * @file
 * @brief Configuration file parser implementation
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "ConfigParser.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.hpp>

#include "scpilink/core/config/Configuration.hpp"
#include "scpilink/core/config/exceptions.hpp"

using namespace scpilink::config;

ConfigParser::ConfigParser(const std::filesystem::path& file) {
    if(!std::filesystem::is_regular_file(file)) {
        throw ConfigFileNotFoundError(file);
    }
    try {
        table_ = toml::parse_file(file.string());
    } catch(const toml::parse_error& err) {
        throw ConfigParseError(err.source(), err.description());
    }
}

ConfigParser ConfigParser::fromString(std::string_view toml) {
    try {
        return ConfigParser(toml::parse(toml));
    } catch(const toml::parse_error& err) {
        throw ConfigParseError(err.source(), err.description());
    }
}

bool ConfigParser::hasConfiguration(std::string_view name) const {
    return table_.get_as<toml::table>(name) != nullptr;
}

Configuration ConfigParser::getConfiguration(std::string_view name) const {
    const auto* node = table_.get(name);
    if(node == nullptr) {
        throw MissingKeyError(name);
    }
    const auto* section = node->as_table();
    if(section == nullptr) {
        std::ostringstream vtype {};
        vtype << node->type();
        throw InvalidTypeError(name, vtype.str(), "table");
    }
    return Configuration(*section);
}

std::vector<std::string> ConfigParser::getConfigurationNames() const {
    std::vector<std::string> names {};
    for(const auto& [key, node] : table_) {
        if(node.is_table()) {
            names.emplace_back(key.str());
        }
    }
    return names;
}
