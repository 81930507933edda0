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

#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "hails/bson/bson_value.h"
#include "hails/bson/bsonmisc.h"
#include "hails/bson/bsontypes.h"

namespace hails {

/**
 * BSONValTraits<T> bridges the C++ type T to and from BSONValue:
 *
 *     static BSONValue val(const T&);                      // total
 *     static boost::optional<T> cast(const BSONValue&);    // boost::none on kind mismatch
 *     static std::string typeName();                       // used in diagnostics
 *
 * Types without a specialization are not bridgeable; see the BSONVal concept below.
 */
template <typename T>
struct BSONValTraits;

namespace bson_val_detail {

/** Bridge for types that are stored as-is and only accept their own kind. */
template <typename T, BSONType kType>
struct SameKind {
    static BSONValue val(const T& v) {
        return BSONValue(v);
    }

    static boost::optional<T> cast(const BSONValue& v) {
        if (const T* p = v.getIf<T>())
            return *p;
        return boost::none;
    }

    static std::string typeName() {
        return hails::typeName(kType);
    }
};

template <BinDataSubtype kSubtype>
struct BinDataKind : SameKind<BinDataValue<kSubtype>, BSONType::binData> {
    static std::string typeName() {
        return std::string("binData(") + hails::typeName(kSubtype) + ")";
    }
};

/**
 * Rounds 'd' to the nearest integer, ties to even, and returns it if it is representable as
 * an I.
 */
template <typename I>
boost::optional<I> roundedToIntegral(double d) {
    if (!std::isfinite(d))
        return boost::none;
    const double r = std::nearbyint(d);
    // 2^(digits) is exactly representable as a double; the upper bound is exclusive.
    const double upper = std::ldexp(1.0, std::numeric_limits<I>::digits);
    if (r < -upper || r >= upper)
        return boost::none;
    return static_cast<I>(r);
}

template <typename T>
struct Int64Kind {
    static BSONValue val(const T& v) {
        return BSONValue(static_cast<std::int64_t>(v));
    }

    static boost::optional<T> cast(const BSONValue& v) {
        if (const std::int64_t* p = v.getIf<std::int64_t>())
            return static_cast<T>(*p);
        if (const std::int32_t* p = v.getIf<std::int32_t>())
            return static_cast<T>(*p);
        if (const double* p = v.getIf<double>()) {
            if (auto r = roundedToIntegral<std::int64_t>(*p))
                return static_cast<T>(*r);
        }
        return boost::none;
    }

    static std::string typeName() {
        return hails::typeName(BSONType::numberLong);
    }
};

/**
 * The trait BSONValTraits falls back to when there is no explicit specialization for a type.
 */
template <typename T>
struct BSONValFallbackTraits {};

/**
 * long long and int64_t are the same type on some platforms but different on others. If they
 * are the same, the long long specialization of BSONValTraits is used for both, otherwise
 * int64_t resolves here.
 */
template <>
struct BSONValFallbackTraits<std::int64_t> : Int64Kind<std::int64_t> {};

}  // namespace bson_val_detail

template <typename T>
struct BSONValTraits : bson_val_detail::BSONValFallbackTraits<T> {};

/**
 * A type whose values can be stored in, and recovered from, a BSONValue.
 */
template <typename T>
concept BSONVal = requires(const T& t, const BSONValue& v) {
    { BSONValTraits<T>::val(t) } -> std::same_as<BSONValue>;
    { BSONValTraits<T>::cast(v) } -> std::same_as<boost::optional<T>>;
    { BSONValTraits<T>::typeName() } -> std::convertible_to<std::string>;
};

template <>
struct BSONValTraits<BSONValue> {
    static BSONValue val(const BSONValue& v) {
        return v;
    }

    static boost::optional<BSONValue> cast(const BSONValue& v) {
        return v;
    }

    static std::string typeName() {
        return "any";
    }
};

template <>
struct BSONValTraits<double> {
    static BSONValue val(double v) {
        return BSONValue(v);
    }

    static boost::optional<double> cast(const BSONValue& v) {
        if (const double* p = v.getIf<double>())
            return *p;
        if (const std::int32_t* p = v.getIf<std::int32_t>())
            return static_cast<double>(*p);
        if (const std::int64_t* p = v.getIf<std::int64_t>())
            return static_cast<double>(*p);
        return boost::none;
    }

    static std::string typeName() {
        return hails::typeName(BSONType::numberDouble);
    }
};

template <>
struct BSONValTraits<float> {
    static BSONValue val(float v) {
        return BSONValue(static_cast<double>(v));
    }

    static boost::optional<float> cast(const BSONValue& v) {
        if (auto d = BSONValTraits<double>::cast(v))
            return static_cast<float>(*d);
        return boost::none;
    }

    static std::string typeName() {
        return hails::typeName(BSONType::numberDouble);
    }
};

template <>
struct BSONValTraits<int> {
    static BSONValue val(int v) {
        return BSONValue(static_cast<std::int32_t>(v));
    }

    static boost::optional<int> cast(const BSONValue& v) {
        if (const std::int32_t* p = v.getIf<std::int32_t>())
            return *p;
        if (const std::int64_t* p = v.getIf<std::int64_t>()) {
            if (*p < std::numeric_limits<int>::min() || *p > std::numeric_limits<int>::max())
                return boost::none;
            return static_cast<int>(*p);
        }
        if (const double* p = v.getIf<double>())
            return bson_val_detail::roundedToIntegral<int>(*p);
        return boost::none;
    }

    static std::string typeName() {
        return hails::typeName(BSONType::numberInt);
    }
};

/* For platforms where long long and int64_t are the same, this specialization is used for
   both. Otherwise, int64_t uses the fallback above. */
template <>
struct BSONValTraits<long long> : bson_val_detail::Int64Kind<long long> {};

template <>
struct BSONValTraits<bool> : bson_val_detail::SameKind<bool, BSONType::boolean> {};

template <>
struct BSONValTraits<std::string> {
    static BSONValue val(const std::string& v) {
        return BSONValue(v);
    }

    static boost::optional<std::string> cast(const BSONValue& v) {
        if (const std::string* p = v.getIf<std::string>())
            return *p;
        if (const BSONSymbol* p = v.getIf<BSONSymbol>())
            return p->symbol;
        return boost::none;
    }

    static std::string typeName() {
        return hails::typeName(BSONType::string);
    }
};

template <>
struct BSONValTraits<BSONDocument> : bson_val_detail::SameKind<BSONDocument, BSONType::object> {};

template <>
struct BSONValTraits<BSONArray> : bson_val_detail::SameKind<BSONArray, BSONType::array> {};

template <>
struct BSONValTraits<BSONBinData> : bson_val_detail::BinDataKind<BinDataSubtype::kGeneral> {};

template <>
struct BSONValTraits<BSONFunction> : bson_val_detail::BinDataKind<BinDataSubtype::kFunction> {};

template <>
struct BSONValTraits<BSONUUID> : bson_val_detail::BinDataKind<BinDataSubtype::kUUID> {};

template <>
struct BSONValTraits<BSONMD5> : bson_val_detail::BinDataKind<BinDataSubtype::kMD5> {};

template <>
struct BSONValTraits<BSONUserDefined> : bson_val_detail::BinDataKind<BinDataSubtype::kUserDefined> {};

template <>
struct BSONValTraits<OID> : bson_val_detail::SameKind<OID, BSONType::oid> {};

template <>
struct BSONValTraits<Date_t> : bson_val_detail::SameKind<Date_t, BSONType::date> {};

template <>
struct BSONValTraits<BSONNULLType> : bson_val_detail::SameKind<BSONNULLType, BSONType::null> {};

template <>
struct BSONValTraits<BSONRegEx> : bson_val_detail::SameKind<BSONRegEx, BSONType::regEx> {};

template <>
struct BSONValTraits<BSONCode> : bson_val_detail::SameKind<BSONCode, BSONType::code> {};

template <>
struct BSONValTraits<BSONSymbol> : bson_val_detail::SameKind<BSONSymbol, BSONType::symbol> {};

template <>
struct BSONValTraits<Timestamp> : bson_val_detail::SameKind<Timestamp, BSONType::timestamp> {};

template <>
struct BSONValTraits<MinKeyType> : bson_val_detail::SameKind<MinKeyType, BSONType::minKey> {};

template <>
struct BSONValTraits<MaxKeyType> : bson_val_detail::SameKind<MaxKeyType, BSONType::maxKey> {};

/**
 * Homogeneous arrays. A cast fails if any element fails to cast.
 */
template <BSONVal T>
struct BSONValTraits<std::vector<T>> {
    static BSONValue val(const std::vector<T>& v) {
        BSONArray arr;
        arr.reserve(v.size());
        for (const auto& elem : v) {
            arr.push_back(BSONValTraits<T>::val(elem));
        }
        return BSONValue(std::move(arr));
    }

    static boost::optional<std::vector<T>> cast(const BSONValue& v) {
        const BSONArray* arr = v.getIf<BSONArray>();
        if (!arr)
            return boost::none;
        std::vector<T> out;
        out.reserve(arr->size());
        for (const auto& elem : *arr) {
            auto casted = BSONValTraits<T>::cast(elem);
            if (!casted)
                return boost::none;
            out.push_back(std::move(*casted));
        }
        return out;
    }

    static std::string typeName() {
        return "array<" + BSONValTraits<T>::typeName() + ">";
    }
};

namespace bson_val_detail {

/** True for bridgeable types that have a value stored as null. */
template <typename T>
inline constexpr bool storesAsNull = false;
template <>
inline constexpr bool storesAsNull<BSONNULLType> = true;
template <>
inline constexpr bool storesAsNull<BSONValue> = true;
template <typename T>
inline constexpr bool storesAsNull<boost::optional<T>> = true;

}  // namespace bson_val_detail

/**
 * Nullable values: boost::none is stored as null, and null casts back to boost::none.
 * Not offered for a T that can itself be stored as null, since boost::none and that T value
 * would share a rendering.
 */
template <BSONVal T>
requires(!bson_val_detail::storesAsNull<T>)
struct BSONValTraits<boost::optional<T>> {
    static BSONValue val(const boost::optional<T>& v) {
        if (!v)
            return BSONValue();
        return BSONValTraits<T>::val(*v);
    }

    static boost::optional<boost::optional<T>> cast(const BSONValue& v) {
        boost::optional<boost::optional<T>> out;
        if (v.isNull()) {
            out.emplace();
            return out;
        }
        if (auto casted = BSONValTraits<T>::cast(v))
            out.emplace(std::move(*casted));
        return out;
    }

    static std::string typeName() {
        return BSONValTraits<T>::typeName() + " or null";
    }
};

/** Shorthands for BSONValTraits<T>::val and BSONValTraits<T>::cast. */
template <BSONVal T>
BSONValue bsonVal(const T& v) {
    return BSONValTraits<T>::val(v);
}

template <BSONVal T>
boost::optional<T> bsonCast(const BSONValue& v) {
    return BSONValTraits<T>::cast(v);
}

}  // namespace hails
