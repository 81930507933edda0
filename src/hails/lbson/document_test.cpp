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


#include "hails/lbson/document.h"

#include <string>
#include <vector>

#include "hails/config.h"
#include "hails/lio/category_label.h"
#include "hails/unittest/unittest.h"

namespace hails {
namespace lbson {
namespace {

using L = lio::CategoryLabel;
using Doc = Document<L>;
using Keys = std::vector<std::string>;

Doc abc() {
    return Doc{makeField<L>("a", 1), makeField<L>("b", 2), makeField<L>("c", 3)};
}

TEST(DocumentTest, Rendering) {
    ASSERT_EQUALS(toString(Doc{}), "[]");
    ASSERT_EQUALS(toString(abc()), "[ a: 1, b: 2, c: 3]");
}

TEST(DocumentTest, LookFindsFirstOccurrence) {
    Doc doc{makeField<L>("x", 1), makeField<L>("x", 2)};
    auto v = look("x", doc);
    ASSERT_OK(v);
    ASSERT_EQUALS(v.getValue(), val<L>(1));
}

TEST(DocumentTest, LookMissingKey) {
    auto v = look("missing", abc());
    ASSERT_EQUALS(v.getStatus().code(), ErrorCodes::NoSuchKey);
    ASSERT_EQUALS(v.getStatus().reason(), "expected \"missing\"");
}

TEST(DocumentTest, LookupCastsTheValue) {
    Doc doc{makeField<L>("name", "alice"), makeField<L>("age", 30)};

    auto name = lookup<std::string>("name", doc);
    ASSERT_OK(name);
    ASSERT_EQUALS(name.getValue(), "alice");

    ASSERT_EQUALS(lookup<int>("missing", doc).getStatus().code(), ErrorCodes::NoSuchKey);
    ASSERT_EQUALS(lookup<int>("name", doc).getStatus().code(), ErrorCodes::TypeMismatch);
}

TEST(DocumentTest, LookupOfLabeledField) {
    Doc doc{makeField<L>("ssn", lio::tcb::labelTCB(L{3}, std::string("123")))};

    auto ssn = lookup<lio::Labeled<L, std::string>>("ssn", doc);
    ASSERT_OK(ssn);
    ASSERT_EQUALS(ssn.getValue().getLabel(), L{3});
    ASSERT_EQUALS(lio::tcb::unlabelTCB(ssn.getValue()), "123");

    ASSERT_EQUALS(lookup<std::string>("ssn", doc).getStatus().code(), ErrorCodes::TypeMismatch);
}

TEST(DocumentTest, ValueAt) {
    ASSERT_EQUALS(valueAt("b", abc()), val<L>(2));
    ASSERT_THROWS_CODE_AND_WHAT(
        valueAt("missing", abc()), AssertionException, ErrorCodes::NoSuchKey, "expected \"missing\"");
}

TEST(DocumentTest, At) {
    ASSERT_EQUALS(at<int>("c", abc()), 3);
    ASSERT_THROWS_CODE_AND_WHAT(at<int>("missing", abc()),
                                AssertionException,
                                ErrorCodes::NoSuchKey,
                                "expected (\"missing\" :: int) in [ a: 1, b: 2, c: 3]");
    ASSERT_THROWS_CODE_AND_WHAT(at<bool>("a", abc()),
                                AssertionException,
                                ErrorCodes::TypeMismatch,
                                "expected (\"a\" :: bool) in [ a: 1, b: 2, c: 3]");
}

TEST(DocumentTest, AtDoesNotLeakLabeledContent) {
    Doc doc{makeField<L>("ssn", lio::tcb::labelTCB(L{3}, std::string("123")))};
    if constexpr (!kDebugLabeledRendering) {
        ASSERT_THROWS_CODE_AND_WHAT(at<int>("ssn", doc),
                                    AssertionException,
                                    ErrorCodes::TypeMismatch,
                                    "expected (\"ssn\" :: int) in [ ssn: {- HIDING DATA -} ]");
    }
}

TEST(DocumentTest, IncludeFollowsKeyOrder) {
    Doc projected = include(Keys{"b", "a"}, abc());
    ASSERT_EQUALS(projected, (Doc{makeField<L>("b", 2), makeField<L>("a", 1)}));
}

TEST(DocumentTest, IncludeDropsAbsentKeys) {
    ASSERT_TRUE(include(Keys{"z"}, abc()).empty());
    ASSERT_TRUE(include(Keys{}, abc()).empty());
}

TEST(DocumentTest, IncludeIsIdempotent) {
    Keys keys{"c", "z", "a"};
    Doc once = include(keys, abc());
    ASSERT_EQUALS(include(keys, once), once);
    ASSERT_EQUALS(toString(once), "[ c: 3, a: 1]");
}

TEST(DocumentTest, ExcludePreservesDocumentOrder) {
    Doc projected = exclude(Keys{"b"}, abc());
    ASSERT_EQUALS(projected, (Doc{makeField<L>("a", 1), makeField<L>("c", 3)}));
    ASSERT_EQUALS(exclude(Keys{}, abc()), abc());
}

TEST(DocumentTest, ExcludeDropsEveryOccurrence) {
    Doc doc{makeField<L>("x", 1), makeField<L>("y", 2), makeField<L>("x", 3)};
    ASSERT_EQUALS(exclude(Keys{"x"}, doc), Doc{makeField<L>("y", 2)});
}

TEST(DocumentTest, MergeReplacesInPlace) {
    Doc preferred{makeField<L>("a", 10)};
    Doc doc{makeField<L>("a", 1), makeField<L>("b", 2)};
    ASSERT_EQUALS(merge(preferred, doc), (Doc{makeField<L>("a", 10), makeField<L>("b", 2)}));
}

TEST(DocumentTest, MergeAppendsAbsentKeys) {
    Doc preferred{makeField<L>("c", 3)};
    Doc doc{makeField<L>("a", 1)};
    ASSERT_EQUALS(merge(preferred, doc), (Doc{makeField<L>("a", 1), makeField<L>("c", 3)}));
}

TEST(DocumentTest, MergeReplacesFirstOccurrenceOnly) {
    Doc doc{makeField<L>("x", 1), makeField<L>("x", 2)};
    Doc merged = merge(Doc{makeField<L>("x", 9)}, doc);
    ASSERT_EQUALS(merged, (Doc{makeField<L>("x", 9), makeField<L>("x", 2)}));
}

TEST(DocumentTest, MergeWithEmptyDocuments) {
    ASSERT_EQUALS(merge(Doc{}, abc()), abc());
    ASSERT_EQUALS(merge(abc(), Doc{}), abc());
}

TEST(DocumentTest, AlgebraDoesNotModifyInputs) {
    const Doc doc = abc();
    merge(Doc{makeField<L>("a", 5)}, doc);
    exclude(Keys{"a"}, doc);
    include(Keys{"a"}, doc);
    ASSERT_EQUALS(doc, abc());
}

TEST(DocumentTest, LabeledDocument) {
    LabeledDocument<L> ldoc = lio::tcb::labelTCB(L{1, 2}, abc());
    ASSERT_EQUALS(ldoc.getLabel(), (L{1, 2}));
    ASSERT_EQUALS(at<int>("b", lio::tcb::unlabelTCB(ldoc)), 2);
}

}  // namespace
}  // namespace lbson
}  // namespace hails
