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

#include "hails/bson/bsontypes.h"

#include <ostream>

namespace hails {

const char* typeName(BSONType type) {
    switch (type) {
        case BSONType::minKey:
            return "minKey";
        case BSONType::numberDouble:
            return "double";
        case BSONType::string:
            return "string";
        case BSONType::object:
            return "object";
        case BSONType::array:
            return "array";
        case BSONType::binData:
            return "binData";
        case BSONType::oid:
            return "objectId";
        case BSONType::boolean:
            return "bool";
        case BSONType::date:
            return "date";
        case BSONType::null:
            return "null";
        case BSONType::regEx:
            return "regex";
        case BSONType::code:
            return "javascript";
        case BSONType::symbol:
            return "symbol";
        case BSONType::codeWScope:
            return "javascriptWithScope";
        case BSONType::numberInt:
            return "int";
        case BSONType::timestamp:
            return "timestamp";
        case BSONType::numberLong:
            return "long";
        case BSONType::maxKey:
            return "maxKey";
    }
    return "invalid";
}

std::ostream& operator<<(std::ostream& stream, BSONType type) {
    return stream << typeName(type);
}

const char* typeName(BinDataSubtype subtype) {
    switch (subtype) {
        case BinDataSubtype::kGeneral:
            return "general";
        case BinDataSubtype::kFunction:
            return "function";
        case BinDataSubtype::kUUID:
            return "UUID";
        case BinDataSubtype::kMD5:
            return "MD5";
        case BinDataSubtype::kUserDefined:
            return "userDefined";
    }
    return "invalid";
}

}  // namespace hails
