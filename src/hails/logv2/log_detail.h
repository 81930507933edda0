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

#include "hails/base/string_data.h"
#include "hails/logv2/attribute_storage.h"
#include "hails/logv2/log_component.h"
#include "hails/logv2/log_severity.h"

namespace hails::logv2::detail {

void doLogImpl(int32_t id,
               LogSeverity const& severity,
               LogComponent component,
               StringData message,
               const RenderedAttributes& attrs);

/**
 * Formats 'message', replacing each {name} placeholder with the attribute of the same name.
 * Attributes without a placeholder are appended to the line.
 */
std::string formatLogLine(StringData message, const RenderedAttributes& attrs);

template <typename... Args>
void doLog(int32_t id,
           LogSeverity const& severity,
           LogComponent component,
           StringData message,
           const NamedArg<Args>&... args) {
    RenderedAttributes attrs;
    attrs.reserve(sizeof...(Args));
    (attrs.push_back({args.name, renderAttribute(args.value)}), ...);
    doLogImpl(id, severity, component, message, attrs);
}

}  // namespace hails::logv2::detail
