/**
 * @file
 * @brief Compile-time type names
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <source_location>
#include <string_view>

namespace scpilink::utils {

    /** Helpers for compile-time demangling using source_location */
    struct dummy_type {};
    template <typename T> constexpr std::string_view embed_type() {
        return std::string_view {std::source_location::current().function_name()};
    }

    /**
     * @brief Get the human-readable name of a type
     *
     * The name is cut out of the function signature of `embed_type<T>`, using the position of the type name in the
     * signature of `embed_type<dummy_type>` as reference.
     */
    template <typename T> inline std::string_view demangle() {
        constexpr std::string_view dummy_name = "scpilink::utils::dummy_type";
        const auto dummy_sig = embed_type<dummy_type>();
        const auto prefix_length = dummy_sig.find(dummy_name);
        if(prefix_length == std::string_view::npos) {
            return "unknown";
        }
        const auto suffix_length = dummy_sig.size() - prefix_length - dummy_name.size();
        const auto embed_sig = embed_type<T>();
        return embed_sig.substr(prefix_length, embed_sig.size() - prefix_length - suffix_length);
    }

} // namespace scpilink::utils
