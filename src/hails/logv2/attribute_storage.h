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

#include <concepts>
#include <cstddef>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "hails/base/string_data.h"

namespace hails::logv2 {

/**
 * A named attribute attached to a log statement, created with the _attr literal:
 *
 *     LOGV2(5000100, "Generated id {id}", "id"_attr = oid);
 *
 * Holds a reference to the value, which only needs to live for the duration of the log statement.
 */
template <typename T>
struct NamedArg {
    const char* name;
    const T& value;
};

struct AttrUdl {
    const char* name;

    template <typename T>
    NamedArg<T> operator=(const T& v) const {
        return {name, v};
    }
};

inline namespace literals {

constexpr AttrUdl operator""_attr(const char* name, std::size_t) {
    return {name};
}

}  // namespace literals

/** An attribute after its value has been rendered for output. */
struct RenderedAttribute {
    const char* name;
    std::string value;
};

using RenderedAttributes = std::vector<RenderedAttribute>;

namespace detail {

template <typename T>
concept HasToString = requires(const T& t) {
    { t.toString() } -> std::convertible_to<std::string>;
};

template <typename T>
concept Streamable = requires(std::ostream& os, const T& t) { os << t; };

/** Maps an attribute value onto its textual log representation. */
template <typename T>
std::string renderAttribute(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        return fmt::format("{}", value);
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return std::string{std::string_view{value}};
    } else if constexpr (std::is_same_v<T, StringData>) {
        return value.toString();
    } else if constexpr (HasToString<T>) {
        return value.toString();
    } else {
        static_assert(Streamable<T>, "log attribute type is not loggable");
        std::ostringstream os;
        os << value;
        return os.str();
    }
}

}  // namespace detail
}  // namespace hails::logv2
