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

/**
 * String utilities.
 *
 * The `str::stream` class allows building a string inline, for example to pass as the reason of
 * a Status:
 *
 *     return Status(ErrorCodes::BadValue, str::stream() << "bad key: " << key);
 */

#include <sstream>
#include <string>

#include "hails/base/string_data.h"

namespace hails {
namespace str {

class stream {
public:
    template <typename T>
    stream& operator<<(const T& v) {
        _ss << v;
        return *this;
    }

    operator std::string() const {
        return _ss.str();
    }

    std::string ss() const {
        return _ss.str();
    }

private:
    std::ostringstream _ss;
};

inline bool startsWith(StringData s, StringData prefix) {
    return s.startsWith(prefix);
}

inline bool endsWith(StringData s, StringData suffix) {
    return s.endsWith(suffix);
}

}  // namespace str
}  // namespace hails
