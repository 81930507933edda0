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


#include "hails/lbson/val.h"

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "hails/config.h"
#include "hails/lio/category_label.h"
#include "hails/unittest/unittest.h"

namespace hails {
namespace lbson {
namespace {

using L = lio::CategoryLabel;
using V = Value<L>;
using LabeledString = lio::Labeled<L, std::string>;
using PolicyLabeledInt = PolicyLabeled<L, int>;

static_assert(ValType<int, L>);
static_assert(ValType<std::string, L>);
static_assert(ValType<std::vector<int>, L>);
static_assert(ValType<V, L>);
static_assert(ValType<LabeledString, L>);
static_assert(ValType<PolicyLabeledInt, L>);
static_assert(!ValType<char, L>);
static_assert(ValType<boost::optional<int>, L>);
static_assert(!ValType<boost::optional<BSONNULLType>, L>);
static_assert(!ValType<boost::optional<V>, L>);

TEST(ValTest, PlainRoundTrip) {
    V v = val<L>(42);
    ASSERT_TRUE(v.isPlain());
    auto back = castMaybe<int>(v);
    ASSERT_TRUE(back);
    ASSERT_EQUALS(*back, 42);

    auto name = castMaybe<std::string>(val<L>("alice"));
    ASSERT_TRUE(name);
    ASSERT_EQUALS(*name, "alice");

    auto list = castMaybe<std::vector<int>>(val<L>(std::vector<int>{1, 2}));
    ASSERT_TRUE(list);
    ASSERT_EQUALS(list->size(), 2U);
}

TEST(ValTest, DoubleToIntRoundsHalfToEven) {
    auto two = castMaybe<int>(val<L>(2.5));
    ASSERT_TRUE(two);
    ASSERT_EQUALS(*two, 2);

    auto zero = castMaybe<int>(val<L>(-0.5));
    ASSERT_TRUE(zero);
    ASSERT_EQUALS(*zero, 0);
}

TEST(ValTest, ValueIsIdentity) {
    V v = val<L>(1.5);
    V same = val<L>(v);
    ASSERT_EQUALS(same, v);
    auto back = castMaybe<V>(v);
    ASSERT_TRUE(back);
    ASSERT_EQUALS(*back, v);
}

TEST(ValTest, LabeledRoundTrip) {
    V v = val<L>(lio::tcb::labelTCB(L{1, 2}, std::string("secret")));
    ASSERT_TRUE(v.isLabeled());
    ASSERT_EQUALS(v.getLabeled()->getLabel(), (L{1, 2}));

    auto back = castMaybe<LabeledString>(v);
    ASSERT_TRUE(back);
    ASSERT_EQUALS(back->getLabel(), (L{1, 2}));
    ASSERT_EQUALS(lio::tcb::unlabelTCB(*back), "secret");
}

TEST(ValTest, PolicyLabeledRoundTrip) {
    V unapplied = val<L>(pu<L>(3));
    ASSERT_TRUE(unapplied.isPolicyLabeled());
    auto backUnapplied = castMaybe<PolicyLabeledInt>(unapplied);
    ASSERT_TRUE(backUnapplied);
    ASSERT_FALSE(backUnapplied->isApplied());
    ASSERT_EQUALS(backUnapplied->getUnapplied(), 3);

    V applied = val<L>(pl(lio::tcb::labelTCB(L{7}, 4)));
    auto backApplied = castMaybe<PolicyLabeledInt>(applied);
    ASSERT_TRUE(backApplied);
    ASSERT_TRUE(backApplied->isApplied());
    ASSERT_EQUALS(backApplied->getApplied().getLabel(), L{7});
    ASSERT_EQUALS(lio::tcb::unlabelTCB(backApplied->getApplied()), 4);
}

TEST(ValTest, KindsDoNotConvertIntoEachOther) {
    V plain = val<L>(std::string("x"));
    V labeled = val<L>(lio::tcb::labelTCB(L{1}, std::string("x")));
    V policy = val<L>(pu<L>(std::string("x")));

    ASSERT_FALSE(castMaybe<LabeledString>(plain));
    ASSERT_FALSE(castMaybe<std::string>(labeled));
    ASSERT_FALSE(castMaybe<std::string>(policy));
    ASSERT_FALSE(castMaybe<LabeledString>(policy));
    ASSERT_FALSE((castMaybe<PolicyLabeled<L, std::string>>(labeled)));
}

TEST(ValTest, PayloadMismatchInsideLabelFails) {
    V labeled = val<L>(lio::tcb::labelTCB(L{1}, 5));
    ASSERT_FALSE(castMaybe<LabeledString>(labeled));
    ASSERT_TRUE((castMaybe<lio::Labeled<L, int>>(labeled)));
}

TEST(ValTest, TypeNames) {
    ASSERT_EQUALS((Val<L, int>::typeName()), "int");
    ASSERT_EQUALS((Val<L, V>::typeName()), "Value");
    ASSERT_EQUALS((Val<L, LabeledString>::typeName()), "Labeled string");
    ASSERT_EQUALS((Val<L, PolicyLabeledInt>::typeName()), "PolicyLabeled int");
}

TEST(ValTest, CastReportsTypeMismatch) {
    auto sw = cast<int>(val<L>("abc"));
    ASSERT_EQUALS(sw.getStatus().code(), ErrorCodes::TypeMismatch);
    ASSERT_EQUALS(sw.getStatus().reason(), "expected int: \"abc\"");

    auto ok = cast<std::string>(val<L>("abc"));
    ASSERT_OK(ok);
    ASSERT_EQUALS(ok.getValue(), "abc");
}

TEST(ValTest, CastOfLabeledValueHidesContent) {
    auto sw = cast<int>(val<L>(lio::tcb::labelTCB(L{1}, 5)));
    ASSERT_EQUALS(sw.getStatus().code(), ErrorCodes::TypeMismatch);
    if constexpr (!kDebugLabeledRendering) {
        ASSERT_EQUALS(sw.getStatus().reason(), "expected int: {- HIDING DATA -} ");
    }
}

TEST(ValTest, TypedThrowsOnMismatch) {
    ASSERT_EQUALS(typed<int>(val<L>(9)), 9);
    ASSERT_THROWS_CODE_AND_WHAT(typed<bool>(val<L>(9)),
                                AssertionException,
                                ErrorCodes::TypeMismatch,
                                "expected bool: 9");
}

}  // namespace
}  // namespace lbson
}  // namespace hails
