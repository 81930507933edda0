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
#include <iosfwd>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "hails/base/string_data.h"
#include "hails/bson/bsonmisc.h"
#include "hails/bson/bsontypes.h"
#include "hails/bson/oid.h"
#include "hails/bson/timestamp.h"
#include "hails/util/time_support.h"

namespace hails {

namespace bson_value_detail {
template <typename T, typename V>
struct IsAlternative : std::false_type {};

template <typename T, typename... Kinds>
struct IsAlternative<T, std::variant<Kinds...>>
    : std::bool_constant<(std::is_same_v<T, Kinds> || ...)> {};
}  // namespace bson_value_detail

/**
 * A single, unnamed BSON value of any of the primitive BSON kinds.
 *
 * BSONValue is an immutable value type. Embedded documents and arrays are held by value, so
 * copies are deep and never share state.
 *
 * Example:
 *     BSONValue v(int32_t(5));
 *     invariant(v.type() == BSONType::numberInt);
 *     invariant(*v.getIf<int32_t>() == 5);
 */
class BSONValue {
public:
    using Storage = std::variant<BSONNULLType,
                                 double,
                                 std::string,
                                 BSONDocument,
                                 BSONArray,
                                 BSONBinData,
                                 BSONFunction,
                                 BSONUUID,
                                 BSONMD5,
                                 BSONUserDefined,
                                 OID,
                                 bool,
                                 Date_t,
                                 BSONRegEx,
                                 BSONCode,
                                 BSONSymbol,
                                 int32_t,
                                 Timestamp,
                                 int64_t,
                                 MinKeyType,
                                 MaxKeyType>;

    /** True for the payload types a BSONValue can hold. */
    template <typename T>
    static constexpr bool isKind = bson_value_detail::IsAlternative<T, Storage>::value;

    /** The null value. */
    BSONValue() = default;

    /**
     * Builds a value holding exactly 'v'. Only the storage kinds are accepted, so that an int
     * never silently becomes a bool or a double.
     */
    template <typename T>
    requires isKind<std::decay_t<T>>
    explicit BSONValue(T&& v) : _storage(std::in_place_type<std::decay_t<T>>, std::forward<T>(v)) {}

    BSONType type() const;

    bool isNull() const {
        return std::holds_alternative<BSONNULLType>(_storage);
    }

    /** Returns a pointer to the payload if this value holds a T, nullptr otherwise. */
    template <typename T>
    const T* getIf() const {
        return std::get_if<T>(&_storage);
    }

    const Storage& storage() const {
        return _storage;
    }

    /**
     * Shell-like rendering, e.g. "hello" for a string, { a: 1 } for a document and
     * ObjectId('...') for an OID.
     */
    std::string toString() const;

    /** Structural equality: same kind and equal payload. */
    bool operator==(const BSONValue& other) const;

private:
    Storage _storage;
};

std::ostream& operator<<(std::ostream& os, const BSONValue& value);

/**
 * A named value inside a BSONDocument.
 */
class BSONElement {
public:
    BSONElement(std::string fieldName, BSONValue value)
        : _fieldName(std::move(fieldName)), _value(std::move(value)) {}

    const std::string& fieldName() const {
        return _fieldName;
    }

    const BSONValue& value() const {
        return _value;
    }

    BSONType type() const {
        return _value.type();
    }

    /** Renders as "name: value". */
    std::string toString() const;

    bool operator==(const BSONElement& other) const = default;

private:
    std::string _fieldName;
    BSONValue _value;
};

std::ostream& operator<<(std::ostream& os, const BSONElement& element);

/** Renders a document as { a: 1, b: "x" }. */
std::string toString(const BSONDocument& doc);

/** Renders an array as [ 1, 2 ]. */
std::string toString(const BSONArray& arr);

}  // namespace hails
