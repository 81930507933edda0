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


#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include "hails/logv2/log_component.h"
#include "hails/logv2/log_manager.h"
#include "hails/logv2/log_severity.h"
#include "hails/unittest/unittest.h"

namespace po = boost::program_options;

int main(int argc, char** argv) {
    // gtest consumes its own --gtest_* flags first.
    ::testing::InitGoogleTest(&argc, argv);

    po::options_description options("Unit test options");
    options.add_options()("help,h", "Show this help")(
        "verbose,v",
        po::value<std::string>()->implicit_value("v")->default_value(""),
        "Log debug output, e.g. --verbose=vvv for debug level 3");

    po::variables_map environment;
    try {
        po::store(po::command_line_parser(argc, argv).options(options).allow_unregistered().run(),
                  environment);
        po::notify(environment);
    } catch (const po::error& ex) {
        std::cerr << ex.what() << std::endl << options;
        return EXIT_FAILURE;
    }

    if (environment.count("help")) {
        std::cout << options;
        return EXIT_SUCCESS;
    }

    const auto& verbose = environment["verbose"].as<std::string>();
    if (std::any_of(verbose.cbegin(), verbose.cend(), [](char ch) { return ch != 'v'; })) {
        std::cerr << "The string for the --verbose option cannot contain characters other than 'v'"
                  << std::endl
                  << options;
        return EXIT_FAILURE;
    }

    ::hails::logv2::initializeConsoleLogging();
    ::hails::logv2::setMinimumLoggedSeverity(
        ::hails::logv2::LogComponent::kDefault,
        ::hails::logv2::LogSeverity::Debug(static_cast<int>(verbose.length())));

    return RUN_ALL_TESTS();
}
