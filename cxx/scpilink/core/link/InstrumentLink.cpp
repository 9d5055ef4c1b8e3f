/**
 * @file
 * @brief Implementation of the instrument link
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "InstrumentLink.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <asio/buffer.hpp>
#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/read_until.hpp>
#include <asio/system_error.hpp>
#include <asio/use_future.hpp>
#include <asio/write.hpp>

#include "scpilink/core/link/Endpoint.hpp"
#include "scpilink/core/link/exceptions.hpp"
#include "scpilink/core/log/log.hpp"
#include "scpilink/core/utils/networking.hpp"
#include "scpilink/core/utils/string.hpp"

using namespace scpilink::link;
using namespace scpilink::utils;

InstrumentLink::InstrumentLink(Endpoint endpoint)
    : endpoint_(std::move(endpoint)), logger_("LINK"), socket_(io_context_) {
    endpoint_.validate();
}

InstrumentLink::~InstrumentLink() {
    disconnect();
}

bool InstrumentLink::run_with_timeout() {
    io_context_.restart();
    io_context_.run_for(endpoint_.timeout);

    // If IO context not stopped, then operations are still pending
    return io_context_.stopped();
}

void InstrumentLink::abort_pending(bool close_socket) {
    asio::error_code ec {};
    if(close_socket) {
        socket_.close(ec);
    } else {
        socket_.cancel(ec);
    }

    // Handlers of aborted operations complete immediately
    io_context_.restart();
    io_context_.run();
}

void InstrumentLink::connect() {
    const auto uri = endpoint_.getURI();
    if(isConnected()) {
        throw AlreadyConnectedError(uri);
    }

    LOG(logger_, INFO) << "Connecting to " << uri;

    asio::ip::tcp::resolver resolver {io_context_};
    asio::error_code ec {};
    const auto endpoints =
        resolver.resolve(endpoint_.host, to_string(endpoint_.port), asio::ip::resolver_base::numeric_service, ec);
    if(ec) {
        throw ConnectionError(uri, ec.message());
    }

    auto connect_future = asio::async_connect(socket_, endpoints, asio::use_future);
    if(!run_with_timeout()) {
        abort_pending(true);
        throw ConnectionError(uri, "timed out after " + to_string(endpoint_.timeout));
    }

    asio::ip::tcp::endpoint remote {};
    try {
        remote = connect_future.get();
    } catch(const asio::system_error& error) {
        socket_.close(ec);
        throw ConnectionError(uri, error.code().message());
    }

    // Commands are short lines, send them without delay
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    LOG_IF(logger_, WARNING, ec) << "Could not disable Nagle's algorithm: " << ec.message();

    read_buffer_.clear();
    LOG(logger_, INFO) << "Connected to " << endpoint_to_uri("tcp", remote);
}

void InstrumentLink::send(std::string_view command) {
    if(!isConnected()) {
        throw NotConnectedError("send command \"" + escape(command) + "\"");
    }

    std::string line {command};
    line += endpoint_.terminator;
    LOG(logger_, TRACE) << "Sending " << escape(line);

    auto length_future = asio::async_write(socket_, asio::buffer(line), asio::use_future);
    if(!run_with_timeout()) {
        abort_pending(false);
        throw TimeoutError("writing command \"" + escape(command) + "\"", endpoint_.timeout);
    }

    try {
        length_future.get();
    } catch(const asio::system_error& error) {
        throw TransportError("writing command \"" + escape(command) + "\"", error.code().message());
    }

    if(endpoint_.command_delay > std::chrono::steady_clock::duration::zero()) {
        std::this_thread::sleep_for(endpoint_.command_delay);
    }
}

std::string InstrumentLink::query(std::string_view command) {
    if(!isConnected()) {
        throw NotConnectedError("query \"" + escape(command) + "\"");
    }

    send(command);
    auto response = read_line();

    LOG(logger_, TRACE) << "Received " << escape(response);
    return response;
}

std::string InstrumentLink::read_line() {
    // Data after the terminator stays in the read buffer for the next call
    auto length_future = asio::async_read_until(
        socket_, asio::dynamic_buffer(read_buffer_, MAX_RESPONSE_SIZE), endpoint_.terminator, asio::use_future);
    if(!run_with_timeout()) {
        abort_pending(false);
        throw TimeoutError("waiting for response", endpoint_.timeout);
    }

    std::size_t length {};
    try {
        length = length_future.get();
    } catch(const asio::system_error& error) {
        if(error.code() == asio::error::eof) {
            throw TransportError("reading response", "connection closed by instrument");
        }
        if(error.code() == asio::error::not_found) {
            // Drop the incomplete line, otherwise the full buffer fails every following read
            read_buffer_.clear();
            throw TransportError("reading response",
                                 "no terminator within " + to_string(MAX_RESPONSE_SIZE) + " bytes");
        }
        throw TransportError("reading response", error.code().message());
    }

    // Length includes the terminator
    auto line = read_buffer_.substr(0, length - endpoint_.terminator.size());
    read_buffer_.erase(0, length);
    return line;
}

void InstrumentLink::disconnect() noexcept {
    if(!socket_.is_open()) {
        return;
    }

    // Errors are ignored, the socket might already be broken
    asio::error_code ec {};
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    if(!read_buffer_.empty()) {
        LOG(logger_, DEBUG) << "Discarding " << read_buffer_.size() << " unread bytes";
        read_buffer_.clear();
    }

    LOG(logger_, INFO) << "Disconnected from " << endpoint_.getURI();
}
