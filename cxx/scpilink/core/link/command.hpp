/**
 * @file
 * @brief Helpers for SCPI command strings
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string_view>

namespace scpilink::link {

    /**
     * @brief Check if a command is a query, i.e. elicits a response from the instrument
     *
     * A command is a query if its header, the part before the first space, ends in a question mark, e.g. `*IDN?` or
     * `CALC:MARK1:Y? 1`. Leading and trailing whitespace is ignored.
     */
    constexpr bool is_query(std::string_view command) {
        constexpr std::string_view whitespace = " \t\r\n";
        const auto begin = command.find_first_not_of(whitespace);
        if(begin == std::string_view::npos) {
            return false;
        }
        command.remove_prefix(begin);
        const auto header = command.substr(0, command.find_first_of(whitespace));
        return header.ends_with('?');
    }

} // namespace scpilink::link
