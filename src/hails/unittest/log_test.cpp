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


#include "hails/unittest/log_test.h"

#include <cstdint>
#include <string_view>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

namespace hails {
namespace unittest {

LogCaptureGuard::LogCaptureGuard()
    : _stream(boost::make_shared<std::ostringstream>()), _sink(boost::make_shared<Sink>()) {
    namespace expr = boost::log::expressions;

    _sink->locked_backend()->add_stream(_stream);
    _sink->set_formatter(expr::stream << expr::attr<std::string>("Severity") << " "
                                      << expr::attr<std::string>("Component") << " ["
                                      << expr::attr<int32_t>("Id") << "] " << expr::smessage);
    boost::log::core::get()->add_sink(_sink);
}

LogCaptureGuard::~LogCaptureGuard() {
    boost::log::core::get()->remove_sink(_sink);
    _sink->flush();
}

std::string LogCaptureGuard::getText() const {
    _sink->flush();
    return _stream->str();
}

size_t LogCaptureGuard::countLinesContaining(StringData needle) const {
    std::istringstream lines(getText());
    size_t count = 0;
    for (std::string line; std::getline(lines, line);) {
        if (line.find(std::string_view{needle}) != std::string::npos)
            ++count;
    }
    return count;
}

}  // namespace unittest
}  // namespace hails
