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


#include "hails/lio/category_label.h"

#include <absl/container/flat_hash_set.h>

#include "hails/lio/label.h"
#include "hails/unittest/unittest.h"

namespace hails {
namespace lio {
namespace {

static_assert(Label<CategoryLabel>);

TEST(CategoryLabelTest, ConstructionSortsAndDeduplicates) {
    CategoryLabel label{3, 1, 3, 2};
    ASSERT_EQUALS(label.size(), 3U);
    ASSERT_EQUALS(label.toString(), "{1,2,3}");
    ASSERT_TRUE(label.contains(2));
    ASSERT_FALSE(label.contains(4));
}

TEST(CategoryLabelTest, EmptyIsBottom) {
    CategoryLabel bottom;
    ASSERT_TRUE(bottom.isEmpty());
    ASSERT_EQUALS(bottom.toString(), "{}");
    ASSERT_TRUE(bottom.canFlowTo(CategoryLabel{7}));
    ASSERT_TRUE(bottom.canFlowTo(bottom));
    ASSERT_FALSE(CategoryLabel{7}.canFlowTo(bottom));
}

TEST(CategoryLabelTest, CanFlowToIsSubset) {
    CategoryLabel low{1};
    CategoryLabel high{1, 2};
    ASSERT_TRUE(low.canFlowTo(high));
    ASSERT_FALSE(high.canFlowTo(low));
    ASSERT_FALSE(CategoryLabel{3}.canFlowTo(high));
}

TEST(CategoryLabelTest, LubAndGlb) {
    CategoryLabel a{1, 2};
    CategoryLabel b{2, 3};
    ASSERT_EQUALS(a.lub(b), (CategoryLabel{1, 2, 3}));
    ASSERT_EQUALS(a.glb(b), CategoryLabel{2});
    ASSERT_TRUE(a.canFlowTo(a.lub(b)));
    ASSERT_TRUE(a.glb(b).canFlowTo(b));
}

TEST(CategoryLabelTest, AddAndRemove) {
    CategoryLabel label;
    label.add(5);
    label.add(1);
    label.add(5);
    ASSERT_EQUALS(label.toString(), "{1,5}");
    label.add(CategoryLabel{2, 9});
    ASSERT_EQUALS(label.toString(), "{1,2,5,9}");
    label.remove(5);
    label.remove(42);
    ASSERT_EQUALS(label.toString(), "{1,2,9}");
}

TEST(CategoryLabelTest, ParseRoundTrip) {
    auto sw = CategoryLabel::parse("{ 4, 2 ,9 }");
    ASSERT_OK(sw);
    ASSERT_EQUALS(sw.getValue().toString(), "{2,4,9}");
    ASSERT_EQUALS(CategoryLabel::parse(sw.getValue().toString()).getValue(), sw.getValue());

    auto empty = CategoryLabel::parse("{}");
    ASSERT_OK(empty);
    ASSERT_TRUE(empty.getValue().isEmpty());
}

TEST(CategoryLabelTest, ParseRejectsMalformedInput) {
    ASSERT_EQUALS(CategoryLabel::parse("1,2").getStatus().code(), ErrorCodes::BadValue);
    ASSERT_EQUALS(CategoryLabel::parse("{1,x}").getStatus().code(), ErrorCodes::BadValue);
    ASSERT_EQUALS(CategoryLabel::parse("{1,,2}").getStatus().code(), ErrorCodes::BadValue);
    ASSERT_EQUALS(CategoryLabel::parse("{-1}").getStatus().code(), ErrorCodes::BadValue);
}

TEST(CategoryLabelTest, Hashable) {
    absl::flat_hash_set<CategoryLabel> labels;
    labels.insert(CategoryLabel{1, 2});
    labels.insert(CategoryLabel{2, 1});
    labels.insert(CategoryLabel{});
    ASSERT_EQUALS(labels.size(), 2U);
}

}  // namespace
}  // namespace lio
}  // namespace hails
