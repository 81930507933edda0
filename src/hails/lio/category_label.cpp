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

#include <algorithm>
#include <iterator>
#include <ostream>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

#include "hails/util/str.h"

namespace hails {
namespace lio {

CategoryLabel::CategoryLabel(std::initializer_list<Category> categories)
    : _categories(categories) {
    std::sort(_categories.begin(), _categories.end());
    _categories.erase(std::unique(_categories.begin(), _categories.end()), _categories.end());
}

StatusWith<CategoryLabel> CategoryLabel::parse(StringData input) {
    auto body = absl::StripAsciiWhitespace(absl::string_view{input.data(), input.size()});
    if (body.size() < 2 || body.front() != '{' || body.back() != '}') {
        return Status(ErrorCodes::BadValue,
                      str::stream() << "label must be of the form {c1,c2}: '" << input << "'");
    }
    body = absl::StripAsciiWhitespace(body.substr(1, body.size() - 2));

    CategoryLabel label;
    if (body.empty())
        return label;

    for (absl::string_view part : absl::StrSplit(body, ',')) {
        Category cat;
        if (!absl::SimpleAtoi(part, &cat)) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "invalid category '" << part << "' in label '" << input
                                        << "'");
        }
        label.add(cat);
    }
    return label;
}

bool CategoryLabel::contains(Category cat) const {
    return std::binary_search(_categories.begin(), _categories.end(), cat);
}

void CategoryLabel::add(Category cat) {
    auto it = std::lower_bound(_categories.begin(), _categories.end(), cat);
    if (it == _categories.end() || *it != cat)
        _categories.insert(it, cat);
}

void CategoryLabel::add(const CategoryLabel& other) {
    *this = lub(other);
}

void CategoryLabel::remove(Category cat) {
    auto it = std::lower_bound(_categories.begin(), _categories.end(), cat);
    if (it != _categories.end() && *it == cat)
        _categories.erase(it);
}

bool CategoryLabel::canFlowTo(const CategoryLabel& other) const {
    return std::includes(other._categories.begin(),
                         other._categories.end(),
                         _categories.begin(),
                         _categories.end());
}

CategoryLabel CategoryLabel::lub(const CategoryLabel& other) const {
    CategoryLabel out;
    std::set_union(_categories.begin(),
                   _categories.end(),
                   other._categories.begin(),
                   other._categories.end(),
                   std::back_inserter(out._categories));
    return out;
}

CategoryLabel CategoryLabel::glb(const CategoryLabel& other) const {
    CategoryLabel out;
    std::set_intersection(_categories.begin(),
                          _categories.end(),
                          other._categories.begin(),
                          other._categories.end(),
                          std::back_inserter(out._categories));
    return out;
}

std::string CategoryLabel::toString() const {
    return "{" + absl::StrJoin(_categories, ",") + "}";
}

std::ostream& operator<<(std::ostream& os, const CategoryLabel& label) {
    return os << label.toString();
}

}  // namespace lio
}  // namespace hails
