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

#define HAILS_LOGV2_DEFAULT_COMPONENT ::hails::logv2::LogComponent::kLBSON

#include "hails/lbson/lookup_errors.h"

#include "hails/logv2/log.h"
#include "hails/util/assert_util.h"
#include "hails/util/str.h"

namespace hails {
namespace lbson {

Status makeMissingKeyStatus(StringData key) {
    return Status(ErrorCodes::NoSuchKey, str::stream() << "expected \"" << key << "\"");
}

Status makeTypeMismatchStatus(StringData expectedType, StringData renderedValue) {
    return Status(ErrorCodes::TypeMismatch,
                  str::stream() << "expected " << expectedType << ": " << renderedValue);
}

void uassertedTypedLookupFailure(StringData key,
                                 StringData expectedType,
                                 StringData renderedDoc,
                                 const Status& cause) {
    LOGV2_DEBUG(5100200,
                2,
                "Typed lookup failed",
                "key"_attr = key,
                "expectedType"_attr = expectedType,
                "error"_attr = cause);
    uasserted(cause.code(),
              str::stream() << "expected (\"" << key << "\" :: " << expectedType << ") in "
                            << renderedDoc);
}

}  // namespace lbson
}  // namespace hails
