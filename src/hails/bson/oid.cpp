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

#include "hails/bson/oid.h"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <ctime>
#include <mutex>
#include <ostream>

#include <boost/endian/conversion.hpp>

#include "hails/platform/random.h"
#include "hails/util/hex.h"
#include "hails/util/str.h"

namespace hails {

namespace {

constexpr size_t kTimestampOffset = 0;
constexpr size_t kInstanceUniqueOffset = 4;
constexpr size_t kInstanceUniqueSize = 5;
constexpr size_t kCounterOffset = 9;

struct GenerationState {
    GenerationState() {
        reseed();
    }

    void reseed() {
        SecureRandom entropy;
        std::lock_guard<std::mutex> lk(mutex);
        entropy.fill(instanceUnique.data(), instanceUnique.size());
        counter.store(static_cast<uint32_t>(entropy.nextInt64()));
    }

    std::mutex mutex;
    std::array<uint8_t, kInstanceUniqueSize> instanceUnique;
    std::atomic<uint32_t> counter;
};

GenerationState& generationState() {
    static GenerationState state;
    return state;
}

}  // namespace

OID OID::gen() {
    auto& state = generationState();
    OID oid;

    uint32_t seconds = boost::endian::native_to_big(static_cast<uint32_t>(std::time(nullptr)));
    std::memcpy(oid._bytes.data() + kTimestampOffset, &seconds, sizeof(seconds));

    {
        std::lock_guard<std::mutex> lk(state.mutex);
        std::copy(state.instanceUnique.begin(),
                  state.instanceUnique.end(),
                  oid._bytes.begin() + kInstanceUniqueOffset);
    }

    // Only the low three bytes of the counter are stored.
    uint32_t counter = state.counter.fetch_add(1);
    oid._bytes[kCounterOffset] = static_cast<uint8_t>(counter >> 16);
    oid._bytes[kCounterOffset + 1] = static_cast<uint8_t>(counter >> 8);
    oid._bytes[kCounterOffset + 2] = static_cast<uint8_t>(counter);
    return oid;
}

StatusWith<OID> OID::parse(StringData input) {
    if (input.size() != 2 * kOIDSize) {
        return {ErrorCodes::BadValue,
                str::stream() << "an ObjectId has " << 2 * kOIDSize << " hex digits, got "
                              << input.size() << ": '" << input << "'"};
    }
    if (!std::all_of(input.begin(), input.end(), hexblob::isHexDigit)) {
        return {ErrorCodes::BadValue,
                str::stream() << "an ObjectId must only contain hex digits: '" << input << "'"};
    }

    std::string bytes = hexblob::decode(input);
    OID oid;
    std::copy(bytes.begin(), bytes.end(), oid._bytes.begin());
    return oid;
}

void OID::justForked() {
    generationState().reseed();
}

uint32_t OID::getTimestamp() const {
    uint32_t big;
    std::memcpy(&big, _bytes.data() + kTimestampOffset, sizeof(big));
    return boost::endian::big_to_native(big);
}

std::string OID::toString() const {
    return hexblob::encodeLower(_bytes.data(), _bytes.size());
}

std::ostream& operator<<(std::ostream& s, const OID& o) {
    return s << o.toString();
}

}  // namespace hails
