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

/**
 * Unified logging system.
 *
 * Each log statement has a unique numeric id, a message with {name} placeholders, and named
 * attributes created with the _attr literal:
 *
 *     LOGV2(5100100, "Document is missing key {key}", "key"_attr = key);
 *
 * Translation units that log must define HAILS_LOGV2_DEFAULT_COMPONENT before including this
 * header:
 *
 *     #define HAILS_LOGV2_DEFAULT_COMPONENT ::hails::logv2::LogComponent::kLBSON
 */

#pragma once

#include "hails/logv2/attribute_storage.h"
#include "hails/logv2/log_component.h"
#include "hails/logv2/log_detail.h"
#include "hails/logv2/log_manager.h"
#include "hails/logv2/log_severity.h"
#include "hails/util/assert_util.h"

#ifndef HAILS_LOGV2_DEFAULT_COMPONENT
#error \
    "HAILS_LOGV2_DEFAULT_COMPONENT must be defined before including hails/logv2/log.h in a .cpp file"
#endif

namespace hails {
using logv2::literals::operator""_attr;
}  // namespace hails

#define LOGV2_IMPL(ID, SEVERITY, COMPONENT, MESSAGE, ...)                                  \
    do {                                                                                   \
        auto logv2Severity_ = (SEVERITY);                                                  \
        ::hails::logv2::LogComponent logv2Component_ = (COMPONENT);                        \
        if (::hails::logv2::shouldLog(logv2Component_, logv2Severity_)) {                  \
            ::hails::logv2::detail::doLog(                                                 \
                ID, logv2Severity_, logv2Component_, MESSAGE __VA_OPT__(, ) __VA_ARGS__);  \
        }                                                                                  \
    } while (false)

#define LOGV2(ID, MESSAGE, ...)                            \
    LOGV2_IMPL(ID,                                         \
               ::hails::logv2::LogSeverity::Log(),         \
               HAILS_LOGV2_DEFAULT_COMPONENT,              \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_OPTIONS(ID, COMPONENT, MESSAGE, ...)         \
    LOGV2_IMPL(ID,                                         \
               ::hails::logv2::LogSeverity::Log(),         \
               COMPONENT,                                  \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_INFO(ID, MESSAGE, ...)                       \
    LOGV2_IMPL(ID,                                         \
               ::hails::logv2::LogSeverity::Info(),        \
               HAILS_LOGV2_DEFAULT_COMPONENT,              \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_WARNING(ID, MESSAGE, ...)                    \
    LOGV2_IMPL(ID,                                         \
               ::hails::logv2::LogSeverity::Warning(),     \
               HAILS_LOGV2_DEFAULT_COMPONENT,              \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_ERROR(ID, MESSAGE, ...)                      \
    LOGV2_IMPL(ID,                                         \
               ::hails::logv2::LogSeverity::Error(),       \
               HAILS_LOGV2_DEFAULT_COMPONENT,              \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_DEBUG(ID, DLEVEL, MESSAGE, ...)              \
    LOGV2_IMPL(ID,                                         \
               ::hails::logv2::LogSeverity::Debug(DLEVEL), \
               HAILS_LOGV2_DEFAULT_COMPONENT,              \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

/** Logs at Severe and then terminates the process with fassertFailed(ID). */
#define LOGV2_FATAL(ID, MESSAGE, ...)                      \
    do {                                                   \
        LOGV2_IMPL(ID,                                     \
                   ::hails::logv2::LogSeverity::Severe(),  \
                   HAILS_LOGV2_DEFAULT_COMPONENT,          \
                   MESSAGE __VA_OPT__(, ) __VA_ARGS__);    \
        fassertFailed(ID);                                 \
    } while (false)

/** Logs at Severe without terminating. For use on paths that terminate on their own. */
#define LOGV2_FATAL_CONTINUE(ID, MESSAGE, ...)             \
    LOGV2_IMPL(ID,                                         \
               ::hails::logv2::LogSeverity::Severe(),      \
               HAILS_LOGV2_DEFAULT_COMPONENT,              \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)
