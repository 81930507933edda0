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


#include "hails/lio/lio.h"

#include <string>
#include <type_traits>
#include <vector>

#include "hails/lio/category_label.h"
#include "hails/unittest/unittest.h"

namespace hails {
namespace lio {
namespace {

struct Trace {
    std::vector<std::string> steps;
};

using TracingLIO = LIO<CategoryLabel, NoPrivs, Trace>;

static_assert(!std::is_copy_constructible_v<TracingLIO>);

TEST(LIOTest, Accessors) {
    LIO<CategoryLabel> lio(CategoryLabel{}, CategoryLabel{1, 2, 3});
    ASSERT_TRUE(lio.getLabel().isEmpty());
    ASSERT_EQUALS(lio.getClearance(), (CategoryLabel{1, 2, 3}));
    ASSERT_TRUE(lio.getLabel().canFlowTo(lio.getClearance()));
    ASSERT_EQUALS(lio.ioActionCount(), 0U);
}

TEST(LIOTest, RtioRunsActionsInOrder) {
    TracingLIO lio(CategoryLabel{}, CategoryLabel{1});
    int first = lio.rtioTCB([&] {
        lio.getState().steps.push_back("first");
        return 1;
    });
    lio.rtioTCB([&] { lio.getState().steps.push_back("second"); });

    ASSERT_EQUALS(first, 1);
    ASSERT_EQUALS(lio.ioActionCount(), 2U);
    ASSERT_EQUALS(lio.getState().steps.size(), 2U);
    ASSERT_EQUALS(lio.getState().steps[0], "first");
    ASSERT_EQUALS(lio.getState().steps[1], "second");
}

TEST(LIOTest, RtioPropagatesExceptions) {
    LIO<CategoryLabel> lio(CategoryLabel{}, CategoryLabel{});
    ASSERT_THROWS_CODE(lio.rtioTCB([]() -> int { uasserted(ErrorCodes::IllegalOperation, "no"); }),
                       AssertionException,
                       ErrorCodes::IllegalOperation);
    ASSERT_EQUALS(lio.ioActionCount(), 1U);
}

}  // namespace
}  // namespace lio
}  // namespace hails
