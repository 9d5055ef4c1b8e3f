/**
 * @file
 * @brief Scoped connection of an instrument link
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include "scpilink/core/link/InstrumentLink.hpp"

namespace scpilink::link {

    /**
     * @brief Holds the connection of an instrument link for the lifetime of the object
     *
     * The link is connected on construction and disconnected on destruction, also if the scope is left through an
     * exception:
     *
     * @code
     * InstrumentLink link {endpoint};
     * {
     *     ScopedConnection connection {link};
     *     const auto idn = connection->query("*IDN?");
     * }
     * @endcode
     */
    class ScopedConnection {
    public:
        /**
         * @brief Connect the link
         *
         * @param link Link to connect, needs to outlive this object
         * @throws AlreadyConnectedError If the link is already connected
         * @throws ConnectionError If the connection cannot be established
         */
        explicit ScopedConnection(InstrumentLink& link) : link_(link) { link_.connect(); }

        /**
         * @brief Disconnect the link
         */
        ~ScopedConnection() { link_.disconnect(); }

        // No copy/move constructor/assignment
        ScopedConnection(const ScopedConnection& other) = delete;
        ScopedConnection& operator=(const ScopedConnection& other) = delete;
        ScopedConnection(ScopedConnection&& other) = delete;
        ScopedConnection& operator=(ScopedConnection&& other) = delete;

        InstrumentLink& operator*() const { return link_; }
        InstrumentLink* operator->() const { return &link_; }

    private:
        InstrumentLink& link_;
    };

} // namespace scpilink::link
