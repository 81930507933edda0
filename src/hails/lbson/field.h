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

#include <ostream>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "hails/base/string_data.h"
#include "hails/lbson/val.h"
#include "hails/lbson/value.h"
#include "hails/lio/label.h"

namespace hails {
namespace lbson {

/**
 * A key/value pair, the unit of a Document.
 */
template <lio::Label L>
struct Field {
    std::string key;
    Value<L> value;

    /** Renders as " key: value". */
    std::string toString() const {
        return " " + key + ": " + value.toString();
    }

    bool operator==(const Field& other) const = default;
};

template <lio::Label L>
std::ostream& operator<<(std::ostream& os, const Field<L>& field) {
    return os << field.toString();
}

/** Builds the field 'key' holding 'v'. */
template <lio::Label L, typename T>
Field<L> makeField(StringData key, const T& v) {
    return Field<L>{std::string{key}, val<L>(v)};
}

/**
 * Returns a one field document if 'v' is set, and an empty document otherwise. Used to add
 * optional fields when building a document.
 */
template <lio::Label L, typename T>
std::vector<Field<L>> makeOptionalField(StringData key, const boost::optional<T>& v) {
    std::vector<Field<L>> out;
    if (v)
        out.push_back(makeField<L>(key, *v));
    return out;
}

}  // namespace lbson
}  // namespace hails
