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

#include "hails/logv2/log_component.h"
#include "hails/logv2/log_severity.h"

namespace hails::logv2 {

/**
 * Installs the plain text console sink on std::clog. Safe to call more than once; only the
 * first call has an effect.
 */
void initializeConsoleLogging();

/**
 * Sets the least severe level logged for 'component'. Setting the level of kDefault affects
 * every component that has no explicit level of its own.
 */
void setMinimumLoggedSeverity(LogComponent component, LogSeverity severity);

/** Removes an explicit level for 'component' so that it follows kDefault again. */
void clearMinimumLoggedSeverity(LogComponent component);

LogSeverity getMinimumLogSeverity(LogComponent component);

/** Returns true if a message at 'severity' for 'component' should be emitted. */
bool shouldLog(LogComponent component, LogSeverity severity);

}  // namespace hails::logv2
