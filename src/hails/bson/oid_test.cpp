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

#include <set>
#include <sstream>
#include <string>

#include <absl/hash/hash.h>

#include "hails/unittest/unittest.h"

namespace hails {
namespace {

constexpr auto kSampleHex = "541b1a00e8a23afa832b218e"_sd;

OID parseOrDie(StringData hex) {
    return uassertStatusOK(OID::parse(hex));
}

TEST(OIDTest, DefaultIsZero) {
    ASSERT_EQUALS(OID().toString(), "000000000000000000000000");
    ASSERT_EQUALS(OID().getTimestamp(), 0U);
}

TEST(OIDTest, GeneratedIdsAreDistinct) {
    std::set<OID> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(OID::gen());
    }
    ASSERT_EQUALS(ids.size(), 1000U);
}

TEST(OIDTest, GeneratedIdsShareTheProcessBytes) {
    std::string a = OID::gen().toString();
    std::string b = OID::gen().toString();
    // Hex digits 8 to 17 hold the per-process value.
    ASSERT_EQUALS(a.substr(8, 10), b.substr(8, 10));
}

TEST(OIDTest, JustForkedChangesTheProcessBytes) {
    std::string before = OID::gen().toString();
    OID::justForked();
    std::string after = OID::gen().toString();
    ASSERT_NOT_EQUALS(before.substr(8, 10), after.substr(8, 10));
}

TEST(OIDTest, ParseAndRender) {
    auto sw = OID::parse(kSampleHex);
    ASSERT_OK(sw);
    ASSERT_EQUALS(sw.getValue().toString(), kSampleHex.toString());

    std::ostringstream os;
    os << sw.getValue();
    ASSERT_EQUALS(os.str(), kSampleHex.toString());
}

TEST(OIDTest, ParseAcceptsUpperCase) {
    ASSERT_EQUALS(parseOrDie("541B1A00E8A23AFA832B218E"), parseOrDie(kSampleHex));
}

TEST(OIDTest, ParseRejectsMalformedInput) {
    ASSERT_EQUALS(OID::parse("541b1a00").getStatus().code(), ErrorCodes::BadValue);
    ASSERT_EQUALS(OID::parse("zz1b1a00e8a23afa832b218e").getStatus().code(),
                  ErrorCodes::BadValue);
    ASSERT_EQUALS(OID::parse("").getStatus().code(), ErrorCodes::BadValue);
}

TEST(OIDTest, TimestampIsTheLeadingBigEndianWord) {
    // 0x6553f100 == 1700000000
    OID oid = parseOrDie("6553f1000000000000000000");
    ASSERT_EQUALS(oid.getTimestamp(), 1700000000U);
    ASSERT_EQUALS(oid.asDateT(), Date_t::fromMillisSinceEpoch(1700000000000LL));
}

TEST(OIDTest, GeneratedTimestampIsNow) {
    auto before = static_cast<uint32_t>(Date_t::now().toMillisSinceEpoch() / 1000);
    OID oid = OID::gen();
    auto after = static_cast<uint32_t>(Date_t::now().toMillisSinceEpoch() / 1000);
    ASSERT_TRUE(before <= oid.getTimestamp() && oid.getTimestamp() <= after);
}

TEST(OIDTest, OrderFollowsBytes) {
    OID earlier = parseOrDie("000003e8ffffffffffffffff");
    OID later = parseOrDie("000003e90000000000000000");
    ASSERT_TRUE(earlier < later);
    ASSERT_TRUE(OID() < earlier);
    ASSERT_FALSE(later < earlier);
}

TEST(OIDTest, EqualIdsHashEqually) {
    OID a = parseOrDie(kSampleHex);
    OID b = parseOrDie(kSampleHex);
    ASSERT_EQUALS(a, b);
    ASSERT_EQUALS(absl::Hash<OID>{}(a), absl::Hash<OID>{}(b));
}

}  // namespace
}  // namespace hails
