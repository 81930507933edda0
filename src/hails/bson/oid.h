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

#include <array>
#include <compare>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>

#include "hails/base/status_with.h"
#include "hails/base/string_data.h"
#include "hails/util/time_support.h"

namespace hails {

/**
 * A 12 byte object identifier, unique with high probability across processes:
 *
 *     bytes 0-3    creation time, seconds since the epoch, big endian
 *     bytes 4-8    random value chosen once per process
 *     bytes 9-11   counter, big endian, starting at a random value
 *
 * The big endian fields make byte-wise ordering follow creation order within a process.
 *
 * A process that forks must call OID::justForked() in the child before generating ids.
 */
class OID {
public:
    static constexpr size_t kOIDSize = 12;

    /** The all-zero id. */
    OID() = default;

    /** A fresh id stamped with the current time. */
    static OID gen();

    /** Parses 24 hex digits. Returns BadValue on any other input. */
    static StatusWith<OID> parse(StringData input);

    /** Picks a new per-process random value. */
    static void justForked();

    /** Creation time in seconds since the epoch. */
    uint32_t getTimestamp() const;

    /** Creation time, at second precision. */
    Date_t asDateT() const {
        return Date_t::fromMillisSinceEpoch(static_cast<long long>(getTimestamp()) * 1000);
    }

    /** 24 lower case hex digits. */
    std::string toString() const;

    bool operator==(const OID&) const = default;
    std::strong_ordering operator<=>(const OID&) const = default;

    template <typename H>
    friend H AbslHashValue(H h, const OID& oid) {
        return H::combine(std::move(h), oid._bytes);
    }

private:
    std::array<uint8_t, kOIDSize> _bytes{};
};

std::ostream& operator<<(std::ostream& s, const OID& o);

}  // namespace hails
