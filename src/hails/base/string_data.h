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

#include <compare>
#include <cstring>
#include <iosfwd>
#include <string>
#include <string_view>  // NOLINT

#include <absl/hash/hash.h>
#include <fmt/format.h>

namespace hails {

/**
 * A StringData object refers to an array of `char` without owning it.
 * The most common usage is as a function argument.
 *
 * Implements the subset of the `std::string_view` API used in this project by forwarding to an
 * internal `string_view` member.
 *
 * The string data to which StringData refers must outlive it. StringData is not
 * null-terminated and should almost always be passed by value.
 */
class StringData {
public:
    using const_iterator = std::string_view::const_iterator;
    using size_type = std::string_view::size_type;

    static constexpr inline size_type npos = std::string_view::npos;

    constexpr StringData() = default;

    StringData(std::nullptr_t) = delete;

    /**
     * Used where string length is not known in advance.
     * 'c' must be null or point to a null-terminated string.
     */
    constexpr StringData(const char* c) : _sv{c ? std::string_view{c} : std::string_view{}} {}

    StringData(const std::string& s) : _sv{s} {}

    constexpr StringData(const char* c, size_type len) : _sv{c, len} {}

    explicit operator std::string() const {
        return std::string{_sv};
    }

    explicit constexpr operator std::string_view() const noexcept {
        return _sv;
    }

    constexpr const_iterator begin() const noexcept {
        return _sv.begin();
    }
    constexpr const_iterator end() const noexcept {
        return _sv.end();
    }

    constexpr const char& operator[](size_t pos) const {
        return _sv[pos];
    }
    constexpr const char* data() const noexcept {
        return _sv.data();
    }
    constexpr bool empty() const noexcept {
        return _sv.empty();
    }
    constexpr size_type size() const noexcept {
        return _sv.size();
    }

    constexpr StringData substr(size_type pos, size_type n = npos) const {
        return StringData{_sv.substr(pos, n)};
    }

    constexpr int compare(StringData other) const noexcept {
        return _sv.compare(other._sv);
    }

    constexpr bool startsWith(StringData prefix) const noexcept {
        return _sv.starts_with(prefix._sv);
    }

    constexpr bool endsWith(StringData suffix) const noexcept {
        return _sv.ends_with(suffix._sv);
    }

    constexpr size_type find(char c, size_type pos = 0) const noexcept {
        return _sv.find(c, pos);
    }

    std::string toString() const {
        return std::string{_sv};
    }

    template <typename H>
    friend H AbslHashValue(H h, StringData sd) {
        return H::combine(std::move(h), sd._sv);
    }

private:
    constexpr explicit StringData(std::string_view sv) : _sv{sv} {}

    std::string_view _sv;
};

constexpr bool operator==(StringData a, StringData b) noexcept {
    return a.compare(b) == 0;
}

constexpr std::strong_ordering operator<=>(StringData a, StringData b) noexcept {
    return a.compare(b) <=> 0;
}

std::ostream& operator<<(std::ostream& stream, StringData value);

inline std::string& operator+=(std::string& a, StringData b) {
    return a.append(b.data(), b.size());
}

inline std::string operator+(std::string a, StringData b) {
    return std::move(a += b);
}

inline std::string operator+(StringData a, std::string b) {
    return std::move(b.insert(0, a.data(), a.size()));
}

inline namespace literals {

constexpr StringData operator""_sd(const char* c, std::size_t len) {
    return {c, len};
}

}  // namespace literals

}  // namespace hails

template <>
struct fmt::formatter<hails::StringData> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(hails::StringData s, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(std::string_view{s}, ctx);
    }
};
