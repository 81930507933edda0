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

#include <exception>
#include <string>
#include <utility>

#include "hails/base/error_codes.h"
#include "hails/base/status.h"
#include "hails/base/status_with.h"
#include "hails/base/string_data.h"
#include "hails/platform/compiler.h"
#include "hails/util/assert_util_core.h"

namespace hails {

/**
 * Most hails exceptions inherit from this; this is commonly caught at the outer edge of a
 * computation.
 *
 * A DBException always carries a non-OK Status.
 */
class DBException : public std::exception {
public:
    const char* what() const noexcept final {
        return reason().c_str();
    }

    ErrorCodes::Error code() const {
        return _status.code();
    }

    const std::string& reason() const {
        return _status.reason();
    }

    std::string codeString() const {
        return _status.codeString();
    }

    const Status& toStatus() const {
        return _status;
    }

    Status toStatus(StringData context) const {
        return _status.withContext(context);
    }

    std::string toString() const {
        return _status.toString();
    }

    void addContext(StringData context) {
        _status.addContext(context);
    }

protected:
    explicit DBException(const Status& status);

private:
    Status _status;
};

class AssertionException : public DBException {
public:
    explicit AssertionException(const Status& status) : DBException(status) {}
};

#define fassertFailed HAILS_fassertFailed
#define HAILS_fassertFailed(...) ::hails::fassertFailedWithLocation(__VA_ARGS__, __FILE__, __LINE__)
HAILS_COMPILER_NORETURN void fassertFailedWithLocation(int msgid,
                                                       const char* file,
                                                       unsigned line) noexcept;

#define fassertFailedWithStatus HAILS_fassertFailedWithStatus
#define HAILS_fassertFailedWithStatus(...) \
    ::hails::fassertFailedWithStatusWithLocation(__VA_ARGS__, __FILE__, __LINE__)
HAILS_COMPILER_NORETURN void fassertFailedWithStatusWithLocation(int msgid,
                                                                 const Status& status,
                                                                 const char* file,
                                                                 unsigned line) noexcept;

/**
 * "user assertion". Throws an AssertionException. Used for errors the caller of a hails API
 * could cause, such as asking for a missing field.
 */
HAILS_COMPILER_NORETURN void uassertedWithLocation(const Status& status,
                                                   const char* file,
                                                   unsigned line);

/* convert various types of exceptions to strings */
std::string causedBy(StringData e);
std::string causedBy(const char* e);
std::string causedBy(const std::string& e);
std::string causedBy(const DBException& e);
std::string causedBy(const std::exception& e);
std::string causedBy(const Status& e);

#define fassert HAILS_fassert
#define HAILS_fassert(...) ::hails::fassertWithLocation(__VA_ARGS__, __FILE__, __LINE__)

/** aborts on condition failure */
inline void fassertWithLocation(int msgid, bool testOK, const char* file, unsigned line) {
    if (HAILS_unlikely(!testOK)) {
        fassertFailedWithLocation(msgid, file, line);
    }
}

inline void fassertWithLocation(int msgid, const Status& status, const char* file, unsigned line) {
    if (HAILS_unlikely(!status.isOK())) {
        fassertFailedWithStatusWithLocation(msgid, status, file, line);
    }
}

/**
 * "user assert".  if asserts, user did something wrong, not our code.
 *
 * Using an immediately invoked lambda to give the compiler an easy way to inline the check (expr)
 * and out-of-line the error path. This is most helpful when the error path involves building a
 * complex error message in the expansion of msg.
 */
#define uassert HAILS_uassert
#define HAILS_uassert(code, msg, expr)                                                  \
    do {                                                                                \
        if (HAILS_unlikely(!(expr))) {                                                  \
            [&]() HAILS_COMPILER_COLD_FUNCTION {                                        \
                ::hails::uassertedWithLocation(                                         \
                    ::hails::Status(::hails::ErrorCodes::Error(code), msg), __FILE__, __LINE__); \
            }();                                                                        \
            HAILS_COMPILER_UNREACHABLE;                                                 \
        }                                                                               \
    } while (false)

#define uasserted HAILS_uasserted
#define HAILS_uasserted(code, msg)                                                          \
    ::hails::uassertedWithLocation(                                                         \
        ::hails::Status(::hails::ErrorCodes::Error(code), msg), __FILE__, __LINE__)

#define uassertStatusOK HAILS_uassertStatusOK
#define HAILS_uassertStatusOK(...) \
    ::hails::uassertStatusOKWithLocation(__VA_ARGS__, __FILE__, __LINE__)
inline void uassertStatusOKWithLocation(const Status& status, const char* file, unsigned line) {
    if (HAILS_unlikely(!status.isOK())) {
        uassertedWithLocation(status, file, line);
    }
}

template <typename T>
inline T uassertStatusOKWithLocation(StatusWith<T> sw, const char* file, unsigned line) {
    uassertStatusOKWithLocation(sw.getStatus(), file, line);
    return std::move(sw.getValue());
}

}  // namespace hails
