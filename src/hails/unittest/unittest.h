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


/**
 * Unit test assertions, layered on GoogleTest.
 *
 * Test files include only this header and use the gtest TEST/TEST_F macros together with the
 * ASSERT_* vocabulary below.
 */

#pragma once

#include <string>

#include <gtest/gtest.h>

#include "hails/base/status.h"
#include "hails/base/status_with.h"
#include "hails/util/assert_util.h"

namespace hails {
namespace unittest {

inline const Status& extractStatus(const Status& status) {
    return status;
}

template <typename T>
const Status& extractStatus(const StatusWith<T>& sw) {
    return sw.getStatus();
}

}  // namespace unittest
}  // namespace hails

/** Fails unless EXPRESSION is true. */
#define ASSERT(EXPRESSION) ASSERT_TRUE(EXPRESSION)

#define ASSERT_EQUALS(a, b) ASSERT_EQ(a, b)
#define ASSERT_NOT_EQUALS(a, b) ASSERT_NE(a, b)
#define ASSERT_LTE(a, b) ASSERT_LE(a, b)
#define ASSERT_GTE(a, b) ASSERT_GE(a, b)

/** Fails unless EXPRESSION, a Status or a StatusWith, is OK. */
#define ASSERT_OK(EXPRESSION) \
    ASSERT_EQ(::hails::Status::OK(), ::hails::unittest::extractStatus(EXPRESSION))

/** Fails if EXPRESSION, a Status or a StatusWith, is OK. */
#define ASSERT_NOT_OK(EXPRESSION) \
    ASSERT_FALSE(::hails::unittest::extractStatus(EXPRESSION).isOK())

#define ASSERT_THROWS(STATEMENT, EXCEPTION_TYPE) ASSERT_THROW(STATEMENT, EXCEPTION_TYPE)

/**
 * Runs STATEMENT, requires it to throw an EXCEPTION_TYPE and calls CHECK with the caught
 * exception.
 */
#define ASSERT_THROWS_WITH_CHECK(STATEMENT, EXCEPTION_TYPE, CHECK)                             \
    do {                                                                                       \
        bool threw_ = false;                                                                   \
        try {                                                                                  \
            STATEMENT;                                                                         \
        } catch (const EXCEPTION_TYPE& ex_) {                                                  \
            threw_ = true;                                                                     \
            CHECK(ex_);                                                                        \
        }                                                                                      \
        ASSERT_TRUE(threw_) << "Expected " #STATEMENT " to throw " #EXCEPTION_TYPE;            \
    } while (false)

#define ASSERT_THROWS_CODE(STATEMENT, EXCEPTION_TYPE, EXPECTED_CODE)                          \
    ASSERT_THROWS_WITH_CHECK(STATEMENT, EXCEPTION_TYPE, ([&](const EXCEPTION_TYPE& ex) {       \
                                 ASSERT_EQ(::hails::ErrorCodes::Error(EXPECTED_CODE),          \
                                           ex.toStatus().code());                              \
                             }))

#define ASSERT_THROWS_CODE_AND_WHAT(STATEMENT, EXCEPTION_TYPE, EXPECTED_CODE, EXPECTED_WHAT)  \
    ASSERT_THROWS_WITH_CHECK(STATEMENT, EXCEPTION_TYPE, ([&](const EXCEPTION_TYPE& ex) {       \
                                 ASSERT_EQ(::hails::ErrorCodes::Error(EXPECTED_CODE),          \
                                           ex.toStatus().code());                              \
                                 ASSERT_EQ(std::string(EXPECTED_WHAT), std::string(ex.what())); \
                             }))

/** Fails unless the string BIG contains the string CONTAINS. */
#define ASSERT_STRING_CONTAINS(BIG, CONTAINS)                                               \
    do {                                                                                    \
        std::string big_(BIG);                                                              \
        std::string contains_(CONTAINS);                                                    \
        ASSERT_NE(big_.find(contains_), std::string::npos)                                  \
            << "'" << big_ << "' does not contain '" << contains_ << "'";                   \
    } while (false)
