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


#include "hails/lio/labeled.h"

#include <concepts>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

#include "hails/config.h"
#include "hails/lio/category_label.h"
#include "hails/unittest/unittest.h"

namespace hails {
namespace lio {
namespace {

using LabeledInt = Labeled<CategoryLabel, int>;
using LabeledString = Labeled<CategoryLabel, std::string>;

template <typename T>
concept Streamable = requires(std::ostream& os, const T& v) { os << v; };

static_assert(!std::equality_comparable<LabeledInt>);
static_assert(!Streamable<LabeledInt>);
static_assert(!std::is_constructible_v<LabeledInt, CategoryLabel, int>);
static_assert(std::is_copy_constructible_v<LabeledInt>);

template <typename LV>
std::string showIfEnabled(const LV& lv) {
    if constexpr (kDebugLabeledRendering) {
        return tcb::showTCB(lv);
    } else {
        return {};
    }
}

TEST(LabeledTest, LabelAndUnlabel) {
    auto lv = tcb::labelTCB(CategoryLabel{1, 2}, 5);
    static_assert(std::is_same_v<decltype(lv), LabeledInt>);
    ASSERT_EQUALS(tcb::unlabelTCB(lv), 5);
    ASSERT_EQUALS(lv.getLabel(), (CategoryLabel{1, 2}));
    ASSERT_EQUALS(labelOf(lv), lv.getLabel());
}

TEST(LabeledTest, LabelDecaysReferences) {
    const std::string secret = "secret";
    auto lv = tcb::labelTCB(CategoryLabel{3}, secret);
    static_assert(std::is_same_v<decltype(lv), LabeledString>);
    ASSERT_EQUALS(tcb::unlabelTCB(lv), "secret");
}

TEST(LabeledTest, CopiesKeepLabelAndPayload) {
    auto lv = tcb::labelTCB(CategoryLabel{4}, std::vector<int>{1, 2, 3});
    auto copy = lv;
    ASSERT_EQUALS(copy.getLabel(), CategoryLabel{4});
    ASSERT_EQUALS(tcb::unlabelTCB(copy).size(), 3U);
    ASSERT_EQUALS(tcb::unlabelTCB(copy)[2], 3);
}

TEST(LabeledTest, ShowRendersPayloadAndLabelInDebugBuilds) {
    auto lv = tcb::labelTCB(CategoryLabel{1, 2}, 5);
    if constexpr (kDebugLabeledRendering) {
        ASSERT_EQUALS(showIfEnabled(lv), "5 {1,2}");
    } else {
        ASSERT_EQUALS(showIfEnabled(lv), "");
    }
}

}  // namespace
}  // namespace lio
}  // namespace hails
