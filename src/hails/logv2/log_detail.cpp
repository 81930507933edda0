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

#include "hails/logv2/log_detail.h"

#include <string>

#include <boost/log/sources/logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <fmt/args.h>
#include <fmt/format.h>

namespace hails::logv2::detail {

namespace {

bool hasPlaceholder(StringData message, const char* name) {
    return std::string_view{message}.find(fmt::format("{{{}}}", name)) != std::string_view::npos;
}

}  // namespace

std::string formatLogLine(StringData message, const RenderedAttributes& attrs) {
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto& attr : attrs)
        store.push_back(fmt::arg(attr.name, attr.value));

    std::string line;
    try {
        line = fmt::vformat(std::string_view{message}, store);
    } catch (const fmt::format_error&) {
        // A placeholder without a matching attribute; keep the raw message.
        line = message.toString();
    }

    bool first = true;
    for (const auto& attr : attrs) {
        if (hasPlaceholder(message, attr.name))
            continue;
        line += first ? " {" : ",";
        first = false;
        line += fmt::format(" {}: {}", attr.name, attr.value);
    }
    if (!first)
        line += " }";
    return line;
}

void doLogImpl(int32_t id,
               LogSeverity const& severity,
               LogComponent component,
               StringData message,
               const RenderedAttributes& attrs) {
    static boost::log::sources::logger_mt logger;

    BOOST_LOG(logger) << boost::log::add_value("Id", id)
                      << boost::log::add_value("Severity",
                                               severity.toStringDataCompact().toString())
                      << boost::log::add_value("Component",
                                               component.getNameForLog().toString())
                      << formatLogLine(message, attrs);
}

}  // namespace hails::logv2::detail
