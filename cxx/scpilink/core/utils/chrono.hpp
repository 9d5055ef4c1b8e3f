/**
 * @file
 * @brief Utilities for std::chrono objects
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <string>
#include <version>

namespace scpilink::utils {

    template <typename T>
    concept chrono_duration = requires(T t) { std::chrono::duration(t); };

    /**
     * @brief Convert a floating point number of seconds to a duration
     *
     * Used for configuration values, which are given in seconds but may have a fractional part.
     */
    template <typename D = std::chrono::steady_clock::duration> inline D seconds_to_duration(double seconds) {
        return std::chrono::duration_cast<D>(std::chrono::duration<double>(seconds));
    }

} // namespace scpilink::utils

#ifdef __cpp_lib_format
#include <format>

namespace scpilink::utils {

    template <typename T>
        requires chrono_duration<T>
    inline std::string duration_to_string(T d) {
        return std::format("{}", std::chrono::duration_cast<std::chrono::milliseconds>(d));
    }

} // namespace scpilink::utils

#else
#include <sstream>

namespace scpilink::utils {

    template <typename T>
        requires chrono_duration<T>
    inline std::string duration_to_string(T d) {
        std::ostringstream oss {};
        oss << std::chrono::duration_cast<std::chrono::milliseconds>(d).count() << "ms";
        return oss.str();
    }

} // namespace scpilink::utils

#endif
