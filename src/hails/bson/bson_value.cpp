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


#include "hails/bson/bson_value.h"

#include <cmath>
#include <ostream>
#include <sstream>

#include <fmt/format.h>

#include "hails/util/hex.h"
#include "hails/util/str.h"

namespace hails {

BSONCode::BSONCode(std::string code) : code(std::move(code)) {}

BSONCode::BSONCode(std::string code, BSONDocument scope)
    : code(std::move(code)), scope(std::move(scope)) {}

bool BSONCode::operator==(const BSONCode& other) const {
    return code == other.code && scope == other.scope;
}

namespace {

template <class... Ts>
struct OverloadedVisitor : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
OverloadedVisitor(Ts...) -> OverloadedVisitor<Ts...>;

void appendQuoted(std::ostream& os, StringData s) {
    os << '"';
    for (char c : s) {
        switch (c) {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            case '\t':
                os << "\\t";
                break;
            default:
                os << c;
        }
    }
    os << '"';
}

void appendDouble(std::ostream& os, double d) {
    if (std::isnan(d)) {
        os << "NaN";
    } else if (std::isinf(d)) {
        os << (d > 0 ? "Infinity" : "-Infinity");
    } else if (d == std::trunc(d) && std::fabs(d) < 1e15) {
        os << fmt::format("{:.1f}", d);
    } else {
        os << fmt::format("{}", d);
    }
}

template <BinDataSubtype kSubtype>
void appendBinData(std::ostream& os, const BinDataValue<kSubtype>& bin) {
    os << "BinData(" << static_cast<int>(kSubtype) << ", "
       << hexblob::encodeLower(bin.bytes.data(), bin.bytes.size()) << ")";
}

void appendValue(std::ostream& os, const BSONValue& value);

void appendDocument(std::ostream& os, const BSONDocument& doc) {
    if (doc.empty()) {
        os << "{}";
        return;
    }
    os << "{ ";
    bool first = true;
    for (const auto& elem : doc) {
        if (!first)
            os << ", ";
        first = false;
        os << elem.fieldName() << ": ";
        appendValue(os, elem.value());
    }
    os << " }";
}

void appendArray(std::ostream& os, const BSONArray& arr) {
    if (arr.empty()) {
        os << "[]";
        return;
    }
    os << "[ ";
    bool first = true;
    for (const auto& v : arr) {
        if (!first)
            os << ", ";
        first = false;
        appendValue(os, v);
    }
    os << " ]";
}

void appendValue(std::ostream& os, const BSONValue& value) {
    std::visit(
        OverloadedVisitor{
            [&](const BSONNULLType&) { os << "null"; },
            [&](double d) { appendDouble(os, d); },
            [&](const std::string& s) { appendQuoted(os, s); },
            [&](const BSONDocument& doc) { appendDocument(os, doc); },
            [&](const BSONArray& arr) { appendArray(os, arr); },
            [&](const BSONBinData& bin) { appendBinData(os, bin); },
            [&](const BSONFunction& bin) { appendBinData(os, bin); },
            [&](const BSONUUID& bin) { appendBinData(os, bin); },
            [&](const BSONMD5& bin) { appendBinData(os, bin); },
            [&](const BSONUserDefined& bin) { appendBinData(os, bin); },
            [&](const OID& oid) { os << "ObjectId('" << oid.toString() << "')"; },
            [&](bool b) { os << (b ? "true" : "false"); },
            [&](const Date_t& date) { os << "new Date(" << date.toMillisSinceEpoch() << ")"; },
            [&](const BSONRegEx& re) { os << '/' << re.pattern << '/' << re.flags; },
            [&](const BSONCode& code) {
                if (code.scope.empty()) {
                    os << "Code(";
                    appendQuoted(os, code.code);
                    os << ")";
                } else {
                    os << "CodeWScope(";
                    appendQuoted(os, code.code);
                    os << ", ";
                    appendDocument(os, code.scope);
                    os << ")";
                }
            },
            [&](const BSONSymbol& sym) {
                os << "Symbol(";
                appendQuoted(os, sym.symbol);
                os << ")";
            },
            [&](int32_t i) { os << i; },
            [&](const Timestamp& ts) { os << ts.toString(); },
            [&](int64_t l) { os << "NumberLong(" << l << ")"; },
            [&](const MinKeyType&) { os << "MinKey"; },
            [&](const MaxKeyType&) { os << "MaxKey"; },
        },
        value.storage());
}

}  // namespace

BSONType BSONValue::type() const {
    return std::visit(
        OverloadedVisitor{
            [](const BSONNULLType&) { return BSONType::null; },
            [](double) { return BSONType::numberDouble; },
            [](const std::string&) { return BSONType::string; },
            [](const BSONDocument&) { return BSONType::object; },
            [](const BSONArray&) { return BSONType::array; },
            [](const BSONBinData&) { return BSONType::binData; },
            [](const BSONFunction&) { return BSONType::binData; },
            [](const BSONUUID&) { return BSONType::binData; },
            [](const BSONMD5&) { return BSONType::binData; },
            [](const BSONUserDefined&) { return BSONType::binData; },
            [](const OID&) { return BSONType::oid; },
            [](bool) { return BSONType::boolean; },
            [](const Date_t&) { return BSONType::date; },
            [](const BSONRegEx&) { return BSONType::regEx; },
            [](const BSONCode& code) {
                return code.scope.empty() ? BSONType::code : BSONType::codeWScope;
            },
            [](const BSONSymbol&) { return BSONType::symbol; },
            [](int32_t) { return BSONType::numberInt; },
            [](const Timestamp&) { return BSONType::timestamp; },
            [](int64_t) { return BSONType::numberLong; },
            [](const MinKeyType&) { return BSONType::minKey; },
            [](const MaxKeyType&) { return BSONType::maxKey; },
        },
        _storage);
}

std::string BSONValue::toString() const {
    std::ostringstream ss;
    appendValue(ss, *this);
    return ss.str();
}

bool BSONValue::operator==(const BSONValue& other) const {
    return _storage == other._storage;
}

std::ostream& operator<<(std::ostream& os, const BSONValue& value) {
    appendValue(os, value);
    return os;
}

std::string BSONElement::toString() const {
    return str::stream() << _fieldName << ": " << _value;
}

std::ostream& operator<<(std::ostream& os, const BSONElement& element) {
    return os << element.fieldName() << ": " << element.value();
}

std::string toString(const BSONDocument& doc) {
    std::ostringstream ss;
    appendDocument(ss, doc);
    return ss.str();
}

std::string toString(const BSONArray& arr) {
    std::ostringstream ss;
    appendArray(ss, arr);
    return ss.str();
}

}  // namespace hails
