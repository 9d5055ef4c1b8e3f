/**
 * @file
 * @brief Networking helpers
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <asio/ip/tcp.hpp>

#include "scpilink/core/utils/string.hpp"

namespace scpilink::utils {

    /**
     * @brief Port number for a network connection
     */
    using Port = std::uint16_t;

    /**
     * @brief Converts a host and port to a URI with given protocol
     */
    inline std::string endpoint_to_uri(std::string_view protocol, std::string_view host, Port port) {
        return to_string(protocol) + "://" + to_string(host) + ":" + to_string(port);
    }

    /**
     * @brief Converts a resolved asio endpoint to a URI with given protocol
     */
    inline std::string endpoint_to_uri(std::string_view protocol, const asio::ip::tcp::endpoint& endpoint) {
        return endpoint_to_uri(protocol, endpoint.address().to_string(), endpoint.port());
    }

} // namespace scpilink::utils
