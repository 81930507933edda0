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

#include <string>
#include <utility>
#include <vector>

#include "hails/bson/bsontypes.h"

namespace hails {

class BSONElement;
class BSONValue;

/** An embedded document: an ordered list of name/value elements. */
using BSONDocument = std::vector<BSONElement>;

/** An embedded array. */
using BSONArray = std::vector<BSONValue>;

/** Tag type for the BSON null value. */
struct BSONNULLType {
    bool operator==(const BSONNULLType&) const = default;
};
inline constexpr BSONNULLType BSONNULL{};

/** Tag types for the special values that sort below and above every other value. */
struct MinKeyType {
    bool operator==(const MinKeyType&) const = default;
};
inline constexpr MinKeyType MINKEY{};

struct MaxKeyType {
    bool operator==(const MaxKeyType&) const = default;
};
inline constexpr MaxKeyType MAXKEY{};

/**
 * Binary data of a given subtype. Each subtype is a distinct C++ type so that a cast to one
 * kind of binary payload never matches another kind.
 */
template <BinDataSubtype kSubtype>
struct BinDataValue {
    static constexpr BinDataSubtype subtype = kSubtype;

    BinDataValue() = default;
    explicit BinDataValue(std::string bytes) : bytes(std::move(bytes)) {}

    bool operator==(const BinDataValue&) const = default;

    std::string bytes;
};

using BSONBinData = BinDataValue<BinDataSubtype::kGeneral>;
using BSONFunction = BinDataValue<BinDataSubtype::kFunction>;
using BSONUUID = BinDataValue<BinDataSubtype::kUUID>;
using BSONMD5 = BinDataValue<BinDataSubtype::kMD5>;
using BSONUserDefined = BinDataValue<BinDataSubtype::kUserDefined>;

struct BSONRegEx {
    BSONRegEx() = default;
    explicit BSONRegEx(std::string pattern, std::string flags = "")
        : pattern(std::move(pattern)), flags(std::move(flags)) {}

    bool operator==(const BSONRegEx&) const = default;

    std::string pattern;
    std::string flags;
};

struct BSONSymbol {
    BSONSymbol() = default;
    explicit BSONSymbol(std::string symbol) : symbol(std::move(symbol)) {}

    bool operator==(const BSONSymbol&) const = default;

    std::string symbol;
};

/**
 * Javascript code. A non-empty scope makes this a code-with-scope value.
 */
struct BSONCode {
    BSONCode() = default;
    explicit BSONCode(std::string code);
    BSONCode(std::string code, BSONDocument scope);

    bool operator==(const BSONCode& other) const;

    std::string code;
    BSONDocument scope;
};

}  // namespace hails
