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

#include <compare>
#include <cstdint>
#include <ctime>
#include <iosfwd>
#include <string>

namespace hails {

/**
 * Representation of a point in time, with millisecond resolution, as a count of milliseconds
 * since the POSIX epoch. This is the payload of the BSON date type.
 */
class Date_t {
public:
    static Date_t fromMillisSinceEpoch(long long m) {
        return Date_t(m);
    }

    static Date_t fromTimeT(time_t t) {
        return Date_t(static_cast<long long>(t) * 1000);
    }

    /** The current wall clock time. */
    static Date_t now();

    static Date_t max() {
        return Date_t(INT64_MAX);
    }

    Date_t() = default;

    long long toMillisSinceEpoch() const {
        return _millis;
    }

    time_t toTimeT() const {
        return static_cast<time_t>(_millis / 1000);
    }

    /** ISO-8601 UTC rendering, e.g. "2012-04-15T10:20:30.123Z". */
    std::string toString() const;

    auto operator<=>(const Date_t&) const = default;

private:
    explicit Date_t(long long m) : _millis(m) {}

    long long _millis = 0;
};

std::ostream& operator<<(std::ostream& os, Date_t date);

}  // namespace hails
