/**
 *    Copyright (C) 2018-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#pragma once

#include <iosfwd>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/smart_ptr/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

#include "hails/base/error_codes.h"
#include "hails/base/string_data.h"
#include "hails/platform/compiler.h"

namespace hails {

/**
 * Status represents an error state or the absence thereof.
 *
 * A Status uses the standardized error codes from ErrorCodes to determine an error's cause, and
 * further clarifies the error with a textual description.
 *
 * The error payload is reference counted and immutable, so copying a Status is cheap.
 */
class [[nodiscard]] Status {
public:
    /** This is the best way to construct an OK status. */
    static Status OK() {
        return {};
    }

    /**
     * Builds an error Status given the error code and a textual description of the error.
     *
     * The `reason` can be given as any type explicitly convertible to `std::string`, such as
     * `const char*` or `str::stream`.
     *
     * If code is ErrorCodes::OK, the remaining arguments are ignored. Prefer using Status::OK(),
     * to make an OK Status.
     */
    HAILS_COMPILER_COLD_FUNCTION Status(ErrorCodes::Error code, std::string reason);

    template <typename Reason,
              std::enable_if_t<std::is_constructible_v<std::string, Reason&&>, int> = 0>
    HAILS_COMPILER_COLD_FUNCTION Status(ErrorCodes::Error code, Reason&& reason)
        : Status{code, std::string{std::forward<Reason>(reason)}} {}

    /**
     * Returns a new Status with the same code as this, but with the reason string replaced with
     * newReason.
     *
     * No-op when called on an OK status.
     */
    Status withReason(std::string newReason) const {
        return isOK() ? OK() : Status(code(), std::move(newReason));
    }

    /** In-place version of `withContext`. Returns *this for chaining. */
    Status& addContext(StringData reasonPrefix);

    /**
     * Returns a new Status with the same data as this, but with the reason string prefixed with
     * reasonPrefix and our standard " :: caused by :: " separator.
     *
     * No-op when called on an OK status.
     */
    Status withContext(StringData reasonPrefix) const {
        return Status(*this).addContext(reasonPrefix);
    }

    bool isOK() const {
        return !_error;
    }

    ErrorCodes::Error code() const {
        return _error ? _error->code : ErrorCodes::OK;
    }

    std::string codeString() const {
        return ErrorCodes::errorString(code());
    }

    /** Returns the reason string or the empty string if isOK(). */
    const std::string& reason() const;

    std::string toString() const;

    /**
     * Call this method to indicate that it is your intention to ignore a returned status.
     */
    constexpr void ignore() const noexcept {}

    /** Only compares codes. Ignores reason strings. */
    bool operator==(const Status& s) const {
        return code() == s.code();
    }

    /** Compares this Status's code with an error code. */
    bool operator==(ErrorCodes::Error other) const {
        return code() == other;
    }

    /** Number of Status objects sharing this error payload. Zero for OK. Used by tests. */
    unsigned refCount() const {
        return _error ? _error->use_count() : 0;
    }

    friend std::ostream& operator<<(std::ostream& os, const Status& status) {
        return status._streamTo(os);
    }

private:
    struct ErrorInfo : boost::intrusive_ref_counter<ErrorInfo> {
        ErrorInfo(ErrorCodes::Error code, std::string reason)
            : code{code}, reason{std::move(reason)} {}

        const ErrorCodes::Error code;
        const std::string reason;
    };

    Status() = default;

    std::ostream& _streamTo(std::ostream& os) const;

    boost::intrusive_ptr<const ErrorInfo> _error;
};

}  // namespace hails
