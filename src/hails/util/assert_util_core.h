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

#include <string>

#include "hails/platform/compiler.h"

/**
 * invariant(), for headers that assert_util.h itself includes, such as status_with.h.
 */

namespace hails {

HAILS_COMPILER_NORETURN void invariantFailed(const char* expr,
                                             const char* file,
                                             unsigned line) noexcept;
HAILS_COMPILER_NORETURN void invariantFailedWithMsg(const char* expr,
                                                    const std::string& msg,
                                                    const char* file,
                                                    unsigned line) noexcept;

#define invariant HAILS_invariant
#define HAILS_invariant(...) \
    HAILS_INVARIANT_SELECT(__VA_ARGS__, HAILS_invariant2, HAILS_invariant1)(__VA_ARGS__)
#define HAILS_INVARIANT_SELECT(_1, _2, NAME, ...) NAME
#define HAILS_invariant1(expr)                                             \
    do {                                                                   \
        if (HAILS_unlikely(!(expr))) {                                     \
            ::hails::invariantFailed(#expr, __FILE__, __LINE__);           \
        }                                                                  \
    } while (false)
#define HAILS_invariant2(expr, msg)                                             \
    do {                                                                        \
        if (HAILS_unlikely(!(expr))) {                                          \
            ::hails::invariantFailedWithMsg(#expr, msg, __FILE__, __LINE__);    \
        }                                                                       \
    } while (false)

}  // namespace hails
