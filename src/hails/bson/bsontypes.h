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

namespace hails {

/**
 * Type tags of the values a BSONValue can hold. The numbers are the type bytes of the BSON wire
 * format, so that BSONType values order the same way as in a server.
 */
enum class BSONType : int {
    minKey = -1,
    numberDouble = 1,
    string = 2,
    object = 3,
    array = 4,
    binData = 5,
    oid = 7,
    boolean = 8,
    date = 9,
    null = 10,
    regEx = 11,
    code = 13,
    symbol = 14,
    /** javascript carrying a scope document */
    codeWScope = 15,
    numberInt = 16,
    timestamp = 17,
    numberLong = 18,
    maxKey = 127
};

/** Name used for 'type' in lookup and cast errors, e.g. "objectId". */
const char* typeName(BSONType type);

std::ostream& operator<<(std::ostream& stream, BSONType type);

/** Subtypes of binary data that have their own payload type. */
enum class BinDataSubtype : uint8_t {
    kGeneral = 0,
    kFunction = 1,
    kUUID = 4,
    kMD5 = 5,
    kUserDefined = 128
};

const char* typeName(BinDataSubtype subtype);

}  // namespace hails
