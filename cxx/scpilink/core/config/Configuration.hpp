/**
 * @file
 * @brief Configuration class
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.hpp>

#include "scpilink/build.hpp"
#include "scpilink/core/config/exceptions.hpp"
#include "scpilink/core/utils/type.hpp"

namespace scpilink::config {

    /**
     * @brief Flat key-value configuration
     *
     * Holds the keys of a single TOML table, e.g. one section of a configuration file. Values are converted to the
     * requested type on access.
     */
    class Configuration {
    public:
        Configuration() = default;

        /**
         * @brief Construct a configuration from a TOML table
         * @param table Table holding the keys
         */
        explicit Configuration(toml::table table) : table_(std::move(table)) {}

        /**
         * @brief Check if a key is defined
         */
        bool has(std::string_view key) const { return table_.contains(key); }

        /**
         * @brief Number of keys
         */
        std::size_t size() const { return table_.size(); }

        /**
         * @brief Get value of a key in requested type
         *
         * @param key Key to get value of
         * @return Value of the key in the type of the requested template parameter
         * @throws MissingKeyError If the requested key is not defined
         * @throws InvalidTypeError If the value cannot be converted to the requested type
         */
        template <typename T> T get(std::string_view key) const {
            const auto* node = table_.get(key);
            if(node == nullptr) {
                throw MissingKeyError(key);
            }
            auto value = node->value<T>();
            if(!value.has_value()) {
                std::ostringstream vtype {};
                vtype << node->type();
                throw InvalidTypeError(key, vtype.str(), utils::demangle<T>());
            }
            return std::move(value.value());
        }

        /**
         * @brief Get value of a key in requested type or default value if it does not exist
         *
         * @param key Key to get value of
         * @param def Default value to use if no value is defined
         * @return Value of the key in the type of the requested template parameter
         * @throws InvalidTypeError If the value cannot be converted to the requested type
         */
        template <typename T> T get(std::string_view key, const T& def) const {
            if(!has(key)) {
                return def;
            }
            return get<T>(key);
        }

    private:
        toml::table table_;
    };

} // namespace scpilink::config
