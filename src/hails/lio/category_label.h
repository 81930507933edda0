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

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include "hails/base/status_with.h"
#include "hails/base/string_data.h"

namespace hails {
namespace lio {

/**
 * A secrecy label made of a set of categories. Data labeled L may flow to a context labeled M
 * when every category of L is also in M. The empty label is the bottom of the lattice.
 */
class CategoryLabel {
public:
    using Category = uint64_t;

    CategoryLabel() = default;
    CategoryLabel(std::initializer_list<Category> categories);

    /** Parses the "{c1,c2}" form produced by toString(). */
    static StatusWith<CategoryLabel> parse(StringData input);

    bool contains(Category cat) const;
    void add(Category cat);
    void add(const CategoryLabel& other);
    void remove(Category cat);

    bool isEmpty() const {
        return _categories.empty();
    }

    size_t size() const {
        return _categories.size();
    }

    /** Subset test. */
    bool canFlowTo(const CategoryLabel& other) const;

    /** Union. */
    CategoryLabel lub(const CategoryLabel& other) const;

    /** Intersection. */
    CategoryLabel glb(const CategoryLabel& other) const;

    std::string toString() const;

    bool operator==(const CategoryLabel& other) const = default;

    template <typename H>
    friend H AbslHashValue(H h, const CategoryLabel& label) {
        return H::combine(std::move(h), label._categories);
    }

private:
    // Sorted, no duplicates.
    std::vector<Category> _categories;
};

std::ostream& operator<<(std::ostream& os, const CategoryLabel& label);

}  // namespace lio
}  // namespace hails
