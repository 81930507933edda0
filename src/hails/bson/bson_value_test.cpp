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


#include "hails/bson/bson_value.h"

#include <cstdint>
#include <sstream>
#include <string>

#include "hails/unittest/unittest.h"

namespace hails {
namespace {

TEST(BSONValueTest, DefaultIsNull) {
    BSONValue v;
    ASSERT_TRUE(v.isNull());
    ASSERT_EQUALS(v.type(), BSONType::null);
    ASSERT_EQUALS(v.toString(), "null");
}

TEST(BSONValueTest, KindsReportTheirType) {
    ASSERT_EQUALS(BSONValue(1.5).type(), BSONType::numberDouble);
    ASSERT_EQUALS(BSONValue(std::string("s")).type(), BSONType::string);
    ASSERT_EQUALS(BSONValue(BSONDocument{}).type(), BSONType::object);
    ASSERT_EQUALS(BSONValue(BSONArray{}).type(), BSONType::array);
    ASSERT_EQUALS(BSONValue(BSONBinData("x")).type(), BSONType::binData);
    ASSERT_EQUALS(BSONValue(BSONUUID("x")).type(), BSONType::binData);
    ASSERT_EQUALS(BSONValue(OID()).type(), BSONType::oid);
    ASSERT_EQUALS(BSONValue(true).type(), BSONType::boolean);
    ASSERT_EQUALS(BSONValue(Date_t::fromMillisSinceEpoch(0)).type(), BSONType::date);
    ASSERT_EQUALS(BSONValue(BSONNULL).type(), BSONType::null);
    ASSERT_EQUALS(BSONValue(BSONRegEx("a")).type(), BSONType::regEx);
    ASSERT_EQUALS(BSONValue(BSONCode("f()")).type(), BSONType::code);
    ASSERT_EQUALS(BSONValue(BSONSymbol("s")).type(), BSONType::symbol);
    ASSERT_EQUALS(BSONValue(int32_t(1)).type(), BSONType::numberInt);
    ASSERT_EQUALS(BSONValue(Timestamp(1, 1)).type(), BSONType::timestamp);
    ASSERT_EQUALS(BSONValue(int64_t(1)).type(), BSONType::numberLong);
    ASSERT_EQUALS(BSONValue(MINKEY).type(), BSONType::minKey);
    ASSERT_EQUALS(BSONValue(MAXKEY).type(), BSONType::maxKey);
}

TEST(BSONValueTest, CodeWithScopeIsItsOwnType) {
    BSONDocument scope{BSONElement("x", BSONValue(int32_t(1)))};
    BSONValue code(BSONCode("f()", scope));
    ASSERT_EQUALS(code.type(), BSONType::codeWScope);
    ASSERT_EQUALS(code.toString(), "CodeWScope(\"f()\", { x: 1 })");
}

TEST(BSONValueTest, GetIfMatchesOnlyTheStoredKind) {
    BSONValue v(int32_t(7));
    ASSERT_TRUE(v.getIf<int32_t>());
    ASSERT_EQUALS(*v.getIf<int32_t>(), 7);
    ASSERT_FALSE(v.getIf<int64_t>());
    ASSERT_FALSE(v.getIf<double>());
}

TEST(BSONValueTest, RenderScalars) {
    ASSERT_EQUALS(BSONValue(3.0).toString(), "3.0");
    ASSERT_EQUALS(BSONValue(2.5).toString(), "2.5");
    ASSERT_EQUALS(BSONValue(int32_t(5)).toString(), "5");
    ASSERT_EQUALS(BSONValue(int64_t(5)).toString(), "NumberLong(5)");
    ASSERT_EQUALS(BSONValue(false).toString(), "false");
    ASSERT_EQUALS(BSONValue(std::string("say \"hi\"")).toString(), "\"say \\\"hi\\\"\"");
    ASSERT_EQUALS(BSONValue(Date_t::fromMillisSinceEpoch(1000)).toString(), "new Date(1000)");
    ASSERT_EQUALS(BSONValue(Timestamp(1, 2)).toString(), "Timestamp(1, 2)");
    ASSERT_EQUALS(BSONValue(BSONRegEx("^a", "i")).toString(), "/^a/i");
    ASSERT_EQUALS(BSONValue(BSONCode("f()")).toString(), "Code(\"f()\")");
    ASSERT_EQUALS(BSONValue(BSONSymbol("s")).toString(), "Symbol(\"s\")");
    ASSERT_EQUALS(BSONValue(BSONBinData(std::string("\x01\x02", 2))).toString(),
                  "BinData(0, 0102)");
    ASSERT_EQUALS(BSONValue(BSONMD5("")).toString(), "BinData(5, )");
    ASSERT_EQUALS(BSONValue(MINKEY).toString(), "MinKey");
    ASSERT_EQUALS(BSONValue(MAXKEY).toString(), "MaxKey");
    ASSERT_EQUALS(BSONValue(OID::parse("541b1a00e8a23afa832b218e").getValue()).toString(),
                  "ObjectId('541b1a00e8a23afa832b218e')");
}

TEST(BSONValueTest, RenderNested) {
    BSONDocument doc{BSONElement("a", BSONValue(int32_t(1))),
                     BSONElement("b",
                                 BSONValue(BSONArray{BSONValue(std::string("x")),
                                                     BSONValue(BSONDocument{})}))};
    ASSERT_EQUALS(BSONValue(doc).toString(), "{ a: 1, b: [ \"x\", {} ] }");
    ASSERT_EQUALS(toString(doc), "{ a: 1, b: [ \"x\", {} ] }");
    ASSERT_EQUALS(toString(BSONArray{}), "[]");
}

TEST(BSONValueTest, EqualityIsByKindAndPayload) {
    ASSERT_EQUALS(BSONValue(int32_t(1)), BSONValue(int32_t(1)));
    ASSERT_NOT_EQUALS(BSONValue(int32_t(1)), BSONValue(int64_t(1)));
    ASSERT_NOT_EQUALS(BSONValue(int32_t(1)), BSONValue(1.0));
    ASSERT_NOT_EQUALS(BSONValue(BSONBinData("x")), BSONValue(BSONUUID("x")));
    ASSERT_EQUALS(BSONValue(), BSONValue(BSONNULL));
    ASSERT_NOT_EQUALS(BSONValue(std::string("s")), BSONValue(BSONSymbol("s")));
}

TEST(BSONValueTest, CopiesAreDeep) {
    BSONDocument inner{BSONElement("k", BSONValue(std::string("v")))};
    BSONValue original(inner);
    BSONValue copy = original;
    inner.push_back(BSONElement("extra", BSONValue(true)));
    ASSERT_EQUALS(copy, original);
    ASSERT_EQUALS(copy.getIf<BSONDocument>()->size(), 1U);
}

TEST(BSONElementTest, Accessors) {
    BSONElement elem("name", BSONValue(std::string("alice")));
    ASSERT_EQUALS(elem.fieldName(), "name");
    ASSERT_EQUALS(elem.type(), BSONType::string);
    ASSERT_EQUALS(elem.toString(), "name: \"alice\"");

    std::ostringstream ss;
    ss << elem;
    ASSERT_EQUALS(ss.str(), "name: \"alice\"");
}

TEST(BSONElementTest, Equality) {
    ASSERT_EQUALS(BSONElement("a", BSONValue(true)), BSONElement("a", BSONValue(true)));
    ASSERT_NOT_EQUALS(BSONElement("a", BSONValue(true)), BSONElement("b", BSONValue(true)));
}

}  // namespace
}  // namespace hails
