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

#include "hails/util/hex.h"

#include "hails/util/assert_util.h"
#include "hails/util/str.h"

namespace hails {
namespace hexblob {

namespace {
constexpr char kLowerDigits[] = "0123456789abcdef";

int fromHexDigit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return c - 'A' + 10;
}
}  // namespace

std::string encodeLower(const void* data, size_t size) {
    std::string out;
    out.reserve(2 * size);
    auto bytes = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(kLowerDigits[bytes[i] >> 4]);
        out.push_back(kLowerDigits[bytes[i] & 0xF]);
    }
    return out;
}

bool isHexDigit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

std::string decode(StringData s) {
    uassert(ErrorCodes::BadValue,
            str::stream() << "Hex blob with odd digit count: " << s.size(),
            s.size() % 2 == 0);
    std::string out;
    out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        uassert(ErrorCodes::BadValue,
                str::stream() << "Invalid hex character in string: " << s,
                isHexDigit(s[i]) && isHexDigit(s[i + 1]));
        out.push_back(static_cast<char>((fromHexDigit(s[i]) << 4) | fromHexDigit(s[i + 1])));
    }
    return out;
}

}  // namespace hexblob
}  // namespace hails
