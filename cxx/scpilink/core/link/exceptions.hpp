/**
 * @file
 * @brief Collection of all instrument link exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "scpilink/build.hpp"
#include "scpilink/core/utils/exceptions.hpp"
#include "scpilink/core/utils/string.hpp"

namespace scpilink::link {
    /**
     * @ingroup Exceptions
     * @brief Base class for all run time errors of an instrument link
     */
    class SCPILINK_API LinkError : public utils::RuntimeError {
    protected:
        LinkError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Connection to the instrument could not be established
     *
     * The host could not be resolved, the port refused the connection or the attempt timed out.
     */
    class SCPILINK_API ConnectionError : public LinkError {
    public:
        ConnectionError(std::string_view uri, std::string_view reason) {
            error_message_ = "Failed to connect to ";
            error_message_ += uri;
            error_message_ += ": ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Reading from or writing to an established connection failed
     */
    class SCPILINK_API TransportError : public LinkError {
    public:
        TransportError(std::string_view action, std::string_view reason) {
            error_message_ = "Failed ";
            error_message_ += action;
            error_message_ += ": ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Operation on an established connection did not complete in time
     */
    class SCPILINK_API TimeoutError : public LinkError {
    public:
        TimeoutError(std::string_view action, std::chrono::steady_clock::duration timeout) {
            error_message_ = "Timed out ";
            error_message_ += action;
            error_message_ += " after ";
            error_message_ += utils::to_string(timeout);
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Operation requires a connection but the link is disconnected
     */
    class SCPILINK_API NotConnectedError : public utils::LogicError {
    public:
        explicit NotConnectedError(std::string_view action) {
            error_message_ = "Cannot ";
            error_message_ += action;
            error_message_ += ": link is not connected";
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Connect was requested on a link which is already connected
     */
    class SCPILINK_API AlreadyConnectedError : public utils::LogicError {
    public:
        explicit AlreadyConnectedError(std::string_view uri) {
            error_message_ = "Link is already connected to ";
            error_message_ += uri;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Endpoint of a link has invalid values
     */
    class SCPILINK_API InvalidEndpointError : public utils::LogicError {
    public:
        explicit InvalidEndpointError(std::string_view reason) {
            error_message_ = "Invalid endpoint: ";
            error_message_ += reason;
        }
    };

} // namespace scpilink::link
