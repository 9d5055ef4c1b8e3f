/**
 * @file
 * @brief Base exceptions of the library
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <exception>
#include <string>
#include <string_view>

#include "scpilink/build.hpp"

namespace scpilink::utils {

    /**
     * @defgroup Exceptions Exceptions
     * @brief Collection of all exceptions thrown by the library
     */

    /**
     * @ingroup Exceptions
     * @brief Base class for all exceptions of the library
     *
     * Derived classes fill the error message during construction.
     */
    class SCPILINK_API Exception : public std::exception {
    public:
        /**
         * @brief Return the error message
         * @return Error message
         */
        const char* what() const noexcept override { return error_message_.c_str(); }

    protected:
        Exception() = default;
        explicit Exception(std::string_view what) : error_message_(what) {}

        std::string error_message_;
    };

    /**
     * @ingroup Exceptions
     * @brief Errors that can only be detected at run time, e.g. I/O failures
     */
    class SCPILINK_API RuntimeError : public Exception {
    public:
        explicit RuntimeError(std::string_view what) : Exception(what) {}

    protected:
        RuntimeError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Errors in the usage of an interface which could be prevented by the caller
     */
    class SCPILINK_API LogicError : public Exception {
    public:
        explicit LogicError(std::string_view what) : Exception(what) {}

    protected:
        LogicError() = default;
    };

} // namespace scpilink::utils
