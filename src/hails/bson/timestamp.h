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
#include <iosfwd>
#include <string>

namespace hails {

/**
 * Payload of the BSON timestamp kind: seconds since the epoch plus an increment that orders
 * events within the same second. Ordered by seconds, then increment.
 */
class Timestamp {
public:
    Timestamp() = default;
    Timestamp(uint32_t secs, uint32_t inc) : _secs(secs), _inc(inc) {}

    uint32_t getSecs() const {
        return _secs;
    }

    uint32_t getInc() const {
        return _inc;
    }

    /** Renders as "Timestamp(secs, inc)". */
    std::string toString() const;

    bool operator==(const Timestamp&) const = default;
    std::strong_ordering operator<=>(const Timestamp&) const = default;

private:
    // Declaration order defines the ordering.
    uint32_t _secs = 0;
    uint32_t _inc = 0;
};

std::ostream& operator<<(std::ostream& out, const Timestamp& ts);

}  // namespace hails
