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

#include "hails/logv2/log_component.h"

namespace hails::logv2 {

StringData LogComponent::getShortName() const {
    switch (_value) {
        case kDefault:
            return "default"_sd;
        case kAssert:
            return "assert"_sd;
        case kControl:
            return "control"_sd;
        case kLBSON:
            return "lbson"_sd;
        case kTest:
            return "test"_sd;
        case kNumLogComponents:
            return "total"_sd;
    }
    return "unknown"_sd;
}

StringData LogComponent::getNameForLog() const {
    switch (_value) {
        case kDefault:
            return "-       "_sd;
        case kAssert:
            return "ASSERT  "_sd;
        case kControl:
            return "CONTROL "_sd;
        case kLBSON:
            return "LBSON   "_sd;
        case kTest:
            return "TEST    "_sd;
        case kNumLogComponents:
            return "TOTAL   "_sd;
    }
    return "UNKNOWN "_sd;
}

}  // namespace hails::logv2
