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

#include "hails/base/status.h"

#include <ostream>

#include "hails/util/assert_util.h"
#include "hails/util/str.h"

namespace hails {

Status::Status(ErrorCodes::Error code, std::string reason) {
    if (code != ErrorCodes::OK)
        _error = new ErrorInfo{code, std::move(reason)};
}

Status& Status::addContext(StringData reasonPrefix) {
    if (!isOK())
        *this = Status(code(), reasonPrefix + causedBy(reason()));
    return *this;
}

const std::string& Status::reason() const {
    if (_error)
        return _error->reason;
    static const std::string empty;
    return empty;
}

std::string Status::toString() const {
    str::stream ss;
    ss << *this;
    return ss;
}

std::ostream& Status::_streamTo(std::ostream& os) const {
    os << codeString();
    if (!isOK())
        os << ": " << reason();
    return os;
}

}  // namespace hails
