/**
 * @file
 * @brief Link to a single SCPI instrument over TCP
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include "scpilink/build.hpp"
#include "scpilink/core/link/Endpoint.hpp"
#include "scpilink/core/log/Logger.hpp"

namespace scpilink::link {

    /** Maximum length of a single response line before the read is aborted */
    constexpr std::size_t MAX_RESPONSE_SIZE = 1024 * 1024;

    /**
     * @brief Link to a single instrument, exchanging SCPI commands as text lines over a raw TCP socket
     *
     * Every command is sent as `<command><terminator>`. For queries, the response is read until the terminator and
     * returned without it. Bytes received after the terminator are kept for the next query.
     *
     * All operations block the calling thread. Connecting, writing and reading are limited by the timeout of the
     * endpoint. A link must not be used from multiple threads at the same time.
     */
    class InstrumentLink {
    public:
        /** Connection state of the link */
        enum class State : std::uint8_t {
            DISCONNECTED,
            CONNECTED,
        };

    public:
        /**
         * @brief Construct a disconnected link
         *
         * @param endpoint Endpoint of the instrument
         * @throws InvalidEndpointError If the endpoint is not valid
         */
        SCPILINK_API explicit InstrumentLink(Endpoint endpoint);

        /**
         * @brief Destruct the link, closing the connection if open
         */
        SCPILINK_API ~InstrumentLink();

        // No copy/move constructor/assignment
        InstrumentLink(const InstrumentLink& other) = delete;
        InstrumentLink& operator=(const InstrumentLink& other) = delete;
        InstrumentLink(InstrumentLink&& other) = delete;
        InstrumentLink& operator=(InstrumentLink&& other) = delete;

        /**
         * @brief Open the TCP connection to the instrument
         *
         * The timeout bounds establishing the connection. Resolving a hostname blocks until the system resolver
         * returns and is not bounded by the timeout.
         *
         * @throws AlreadyConnectedError If the link is already connected
         * @throws ConnectionError If the host cannot be resolved, the connection is refused or the timeout is reached
         */
        SCPILINK_API void connect();

        /**
         * @brief Send a command to the instrument
         *
         * The terminator is appended to the command and the line is written in full. If the timeout is reached, part
         * of the line might already be written and the link stays connected. The next command would then continue the
         * incomplete line, so the link should be reconnected after a `TimeoutError`.
         *
         * @param command SCPI command, without terminator
         * @throws NotConnectedError If the link is not connected
         * @throws TransportError If writing to the socket fails
         * @throws TimeoutError If the command could not be written within the timeout
         */
        SCPILINK_API void send(std::string_view command);

        /**
         * @brief Send a query to the instrument and read its response
         *
         * Bytes received after the terminator are kept for the next query. A response longer than
         * `MAX_RESPONSE_SIZE` is dropped, its remaining bytes are returned as part of the next response.
         *
         * @param command SCPI query, without terminator
         * @return Response line without terminator
         * @throws NotConnectedError If the link is not connected
         * @throws TransportError If writing or reading fails, the instrument closes the connection or the response
         *         exceeds `MAX_RESPONSE_SIZE`
         * @throws TimeoutError If no complete response line arrives within the timeout
         */
        SCPILINK_API std::string query(std::string_view command);

        /**
         * @brief Close the connection
         *
         * Errors from closing an already broken connection are ignored. Does nothing if not connected. Unread
         * response bytes are discarded.
         */
        SCPILINK_API void disconnect() noexcept;

        /**
         * @brief Check if the link is connected
         */
        bool isConnected() const { return socket_.is_open(); }

        /**
         * @brief Get the connection state
         */
        State getState() const { return isConnected() ? State::CONNECTED : State::DISCONNECTED; }

        /**
         * @brief Get the endpoint of the link
         */
        const Endpoint& getEndpoint() const { return endpoint_; }

    private:
        /**
         * @brief Run the IO context until all pending operations completed or the timeout is reached
         *
         * @return True if all operations completed, false if the timeout was reached
         */
        bool run_with_timeout();

        /**
         * @brief Abort pending operations after a timeout and wait for their handlers to finish
         *
         * @param close_socket If true the socket is closed, otherwise pending operations are only cancelled
         */
        void abort_pending(bool close_socket);

        /**
         * @brief Read until the terminator and remove the line from the read buffer
         */
        std::string read_line();

    private:
        Endpoint endpoint_;
        log::Logger logger_;

        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;

        std::string read_buffer_;
    };

} // namespace scpilink::link
