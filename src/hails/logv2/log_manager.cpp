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

#include "hails/logv2/log_manager.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/formatters/date_time.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace hails::logv2 {

namespace {

// Each slot holds the explicit level plus kBias, or zero when the component has no level of its
// own and falls back to kDefault.
constexpr int kBias = 100;
std::array<std::atomic<int>, LogComponent::kNumLogComponents> severities{};

std::once_flag consoleInitFlag;

}  // namespace

void initializeConsoleLogging() {
    std::call_once(consoleInitFlag, [] {
        namespace expr = boost::log::expressions;
        namespace keywords = boost::log::keywords;

        boost::log::add_common_attributes();
        boost::log::add_console_log(
            std::clog,
            keywords::format =
                (expr::stream << expr::format_date_time<boost::posix_time::ptime>(
                                     "TimeStamp", "%Y-%m-%dT%H:%M:%S.%f")
                              << " " << expr::attr<std::string>("Severity") << " "
                              << expr::attr<std::string>("Component") << " ["
                              << expr::attr<int32_t>("Id") << "] " << expr::smessage),
            keywords::auto_flush = true);
    });
}

void setMinimumLoggedSeverity(LogComponent component, LogSeverity severity) {
    severities[component].store(severity.toInt() + kBias);
}

void clearMinimumLoggedSeverity(LogComponent component) {
    severities[component].store(0);
}

LogSeverity getMinimumLogSeverity(LogComponent component) {
    int level = severities[component].load();
    if (!level)
        level = severities[LogComponent::kDefault].load();
    if (!level)
        return LogSeverity::Log();
    return LogSeverity::cast(level - kBias);
}

bool shouldLog(LogComponent component, LogSeverity severity) {
    return severity.toInt() <= getMinimumLogSeverity(component).toInt();
}

}  // namespace hails::logv2
