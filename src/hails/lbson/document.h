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

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "hails/base/status_with.h"
#include "hails/base/string_data.h"
#include "hails/lbson/field.h"
#include "hails/lbson/lookup_errors.h"
#include "hails/lbson/val.h"
#include "hails/lbson/value.h"
#include "hails/lio/label.h"
#include "hails/lio/labeled.h"
#include "hails/util/assert_util.h"

namespace hails {
namespace lbson {

/**
 * An ordered list of fields. Keys are expected to be unique but this is not enforced; lookups
 * resolve duplicate keys to the first matching field.
 */
template <lio::Label L>
using Document = std::vector<Field<L>>;

template <lio::Label L>
using LabeledDocument = lio::Labeled<L, Document<L>>;

/** Renders as "[ a: 1, b: 2]". */
template <lio::Label L>
std::string toString(const Document<L>& doc) {
    std::string out = "[";
    bool first = true;
    for (const auto& field : doc) {
        if (!first)
            out += ",";
        first = false;
        out += field.toString();
    }
    out += "]";
    return out;
}

namespace document_detail {
template <lio::Label L>
typename Document<L>::const_iterator findField(StringData key, const Document<L>& doc) {
    return std::find_if(
        doc.begin(), doc.end(), [&](const Field<L>& field) { return field.key == key; });
}

inline bool containsKey(const std::vector<std::string>& keys, StringData key) {
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}
}  // namespace document_detail

/** The value of the first field named 'key', or NoSuchKey. */
template <lio::Label L>
StatusWith<Value<L>> look(StringData key, const Document<L>& doc) {
    auto it = document_detail::findField(key, doc);
    if (it == doc.end())
        return makeMissingKeyStatus(key);
    return it->value;
}

/** The value of the first field named 'key' cast to T. Fails if 'key' is missing or not a T. */
template <typename T, lio::Label L>
requires ValType<T, L>
StatusWith<T> lookup(StringData key, const Document<L>& doc) {
    auto v = look(key, doc);
    if (!v.isOK())
        return v.getStatus();
    return cast<T>(v.getValue());
}

/** Like look(), but throws if 'key' is missing. */
template <lio::Label L>
Value<L> valueAt(StringData key, const Document<L>& doc) {
    return uassertStatusOK(look(key, doc));
}

/** Like lookup(), but throws if 'key' is missing or not a T. */
template <typename T, lio::Label L>
requires ValType<T, L>
T at(StringData key, const Document<L>& doc) {
    auto result = lookup<T>(key, doc);
    if (!result.isOK()) {
        uassertedTypedLookupFailure(
            key, Val<L, T>::typeName(), toString(doc), result.getStatus());
    }
    return std::move(result.getValue());
}

/** Keeps only the fields named in 'keys', in the order of 'keys'. */
template <lio::Label L>
Document<L> include(const std::vector<std::string>& keys, const Document<L>& doc) {
    Document<L> out;
    for (const auto& key : keys) {
        auto it = document_detail::findField(key, doc);
        if (it != doc.end())
            out.push_back(*it);
    }
    return out;
}

/** Drops the fields named in 'keys', keeping the order of 'doc'. */
template <lio::Label L>
Document<L> exclude(const std::vector<std::string>& keys, const Document<L>& doc) {
    Document<L> out;
    std::copy_if(doc.begin(), doc.end(), std::back_inserter(out), [&](const Field<L>& field) {
        return !document_detail::containsKey(keys, field.key);
    });
    return out;
}

/**
 * Merges 'preferred' into 'doc'. Each field of 'preferred' replaces the first field of 'doc'
 * with the same key, or is appended if there is none. Fields of 'doc' whose key is not in
 * 'preferred' keep their position.
 */
template <lio::Label L>
Document<L> merge(const Document<L>& preferred, const Document<L>& doc) {
    Document<L> out = doc;
    for (const auto& field : preferred) {
        auto it = std::find_if(
            out.begin(), out.end(), [&](const Field<L>& f) { return f.key == field.key; });
        if (it == out.end()) {
            out.push_back(field);
        } else {
            *it = field;
        }
    }
    return out;
}

}  // namespace lbson
}  // namespace hails
