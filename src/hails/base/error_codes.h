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

#include <cstdint>
#include <iosfwd>
#include <string>

#include "hails/base/string_data.h"

namespace hails {

/**
 * The table of error codes used by Status and DBException, with their names.
 *
 * Numeric values follow the server's error code registry so that codes stay stable when
 * reported alongside server errors.
 */
#define HAILS_ERROR_CODE_LIST(X) \
    X(OK, 0)                     \
    X(InternalError, 1)          \
    X(BadValue, 2)               \
    X(NoSuchKey, 4)              \
    X(UnknownError, 8)           \
    X(TypeMismatch, 14)          \
    X(IllegalOperation, 20)

class ErrorCodes {
public:
    // Explicitly 32-bits wide so that non-symbolic values,
    // like uassert codes, are valid.
    enum Error : std::int32_t {
#define HAILS_ERROR_CODE_ENUM(name, code) name = code,
        HAILS_ERROR_CODE_LIST(HAILS_ERROR_CODE_ENUM)
#undef HAILS_ERROR_CODE_ENUM
            MaxError
    };

    static std::string errorString(Error err);

    /**
     * Parses an Error from its "name".  Returns UnknownError if "name" is unrecognized.
     *
     * NOTE: Also returns UnknownError for the string "UnknownError".
     */
    static Error fromString(StringData name);
};

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code);

}  // namespace hails
