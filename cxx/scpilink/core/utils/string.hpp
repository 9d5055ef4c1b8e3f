/**
 * @file
 * @brief Utilities for manipulating strings
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <concepts>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

#include <magic_enum.hpp>

#include "scpilink/core/utils/chrono.hpp"

namespace scpilink::utils {

    template <typename T> inline std::string transform(std::string_view string, const T& operation) {
        std::string out {};
        out.reserve(string.size());
        for(auto character : string) {
            out += static_cast<char>(operation(static_cast<unsigned char>(character)));
        }
        return out;
    }

    template <typename T>
        requires std::convertible_to<T, std::string_view>
    inline std::string to_string(T string_like) {
        const std::string_view string_view {string_like};
        return {string_view.data(), string_view.size()};
    }

    template <typename T>
        requires std::is_arithmetic_v<T>
    inline std::string to_string(T number) {
        if constexpr(std::same_as<T, bool>) {
            return number ? "true" : "false";
        }
        return std::to_string(number);
    }

    template <typename T>
        requires chrono_duration<T>
    std::string to_string(T duration) {
        return duration_to_string(duration);
    }

    template <typename E>
        requires std::is_enum_v<E>
    inline std::string to_string(E enum_val) {
        return to_string(magic_enum::enum_name<E>(enum_val));
    }

    template <typename R, typename F>
        requires std::ranges::range<R> && std::is_invocable_r_v<std::string, F, std::ranges::range_value_t<R>>
    inline std::string list_to_string(const R& range, F to_string_func, const std::string& delim = ", ") {
        std::string out {};
        if(!std::ranges::empty(range)) {
            std::ranges::for_each(std::ranges::subrange(std::cbegin(range), std::ranges::prev(std::ranges::cend(range))),
                                  [&](const auto& element) { out += to_string_func(element) + delim; });
            out += to_string_func(*std::ranges::crbegin(range));
        }
        return out;
    }

    template <typename E>
        requires std::is_enum_v<E>
    inline std::string list_enum_names() {
        return list_to_string(magic_enum::enum_names<E>(), [](std::string_view name) { return to_string(name); });
    }

    /**
     * @brief Make control characters visible, e.g. for logging line terminators
     *
     * Carriage return, line feed and tab become `\r`, `\n` and `\t`, a backslash becomes `\\`, any other
     * non-printable byte is written as `\xHH`.
     */
    inline std::string escape(std::string_view string) {
        constexpr std::string_view hex_digits = "0123456789ABCDEF";
        std::string out {};
        out.reserve(string.size());
        for(const auto character : string) {
            const auto byte = static_cast<unsigned char>(character);
            switch(character) {
            case '\r': out += "\\r"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\\': out += "\\\\"; break;
            default:
                if(std::isprint(byte) != 0) {
                    out += character;
                } else {
                    out += "\\x";
                    out += hex_digits[byte >> 4U];
                    out += hex_digits[byte & 0x0FU];
                }
                break;
            }
        }
        return out;
    }

    /**
     * @brief Resolve the escape sequences `\r`, `\n`, `\t` and `\\`
     *
     * Unknown escape sequences are kept verbatim.
     */
    inline std::string unescape(std::string_view string) {
        std::string out {};
        out.reserve(string.size());
        for(std::size_t i = 0; i < string.size(); ++i) {
            if(string[i] != '\\' || i + 1 == string.size()) {
                out += string[i];
                continue;
            }
            switch(string[i + 1]) {
            case 'r': out += '\r'; break;
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case '\\': out += '\\'; break;
            default:
                out += string[i];
                out += string[i + 1];
                break;
            }
            ++i;
        }
        return out;
    }

} // namespace scpilink::utils
