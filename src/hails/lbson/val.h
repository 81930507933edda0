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

#include <string>
#include <type_traits>
#include <utility>

#include <boost/optional.hpp>

#include "hails/base/status_with.h"
#include "hails/bson/bson_val.h"
#include "hails/bson/bson_value.h"
#include "hails/lbson/lookup_errors.h"
#include "hails/lbson/policy_labeled.h"
#include "hails/lbson/value.h"
#include "hails/lio/label.h"
#include "hails/lio/labeled.h"
#include "hails/util/assert_util.h"

namespace hails {
namespace lbson {

/**
 * Val<L, T> converts between the C++ type T and Value<L>:
 *
 *     static Value<L> val(const T&);                          // total
 *     static boost::optional<T> castMaybe(const Value<L>&);   // boost::none on mismatch
 *     static std::string typeName();
 *
 * Specializations are chosen in this order:
 *   1. T = Value<L>: identity.
 *   2. T = lio::Labeled<L, A>: produces and only accepts labeled values.
 *   3. T = PolicyLabeled<L, A>: produces and only accepts policy-labeled values.
 *   4. Any other T with a BSONValTraits bridge: produces and only accepts plain values.
 */
template <lio::Label L, typename T>
struct Val {};

namespace val_detail {
template <lio::Label L, typename T>
inline constexpr bool isLabelWrapper = false;

template <lio::Label L>
inline constexpr bool isLabelWrapper<L, Value<L>> = true;

template <lio::Label L, typename A>
inline constexpr bool isLabelWrapper<L, lio::Labeled<L, A>> = true;

template <lio::Label L, typename A>
inline constexpr bool isLabelWrapper<L, PolicyLabeled<L, A>> = true;
}  // namespace val_detail

template <lio::Label L>
struct Val<L, Value<L>> {
    static Value<L> val(const Value<L>& v) {
        return v;
    }

    static boost::optional<Value<L>> castMaybe(const Value<L>& v) {
        return v;
    }

    static std::string typeName() {
        return "Value";
    }
};

template <lio::Label L, BSONVal A>
struct Val<L, lio::Labeled<L, A>> {
    static Value<L> val(const lio::Labeled<L, A>& lv) {
        return Value<L>(
            lio::tcb::labelTCB(lv.getLabel(), BSONValTraits<A>::val(lio::tcb::unlabelTCB(lv))));
    }

    static boost::optional<lio::Labeled<L, A>> castMaybe(const Value<L>& v) {
        const auto* lv = v.getLabeled();
        if (!lv)
            return boost::none;
        auto payload = BSONValTraits<A>::cast(lio::tcb::unlabelTCB(*lv));
        if (!payload)
            return boost::none;
        return lio::tcb::labelTCB(lv->getLabel(), std::move(*payload));
    }

    static std::string typeName() {
        return "Labeled " + BSONValTraits<A>::typeName();
    }
};

template <lio::Label L, BSONVal A>
struct Val<L, PolicyLabeled<L, A>> {
    static Value<L> val(const PolicyLabeled<L, A>& plv) {
        if (plv.isApplied()) {
            const auto& lv = plv.getApplied();
            return Value<L>(pl(lio::tcb::labelTCB(
                lv.getLabel(), BSONValTraits<A>::val(lio::tcb::unlabelTCB(lv)))));
        }
        return Value<L>(pu<L>(BSONValTraits<A>::val(plv.getUnapplied())));
    }

    static boost::optional<PolicyLabeled<L, A>> castMaybe(const Value<L>& v) {
        const auto* plv = v.getPolicyLabeled();
        if (!plv)
            return boost::none;
        if (plv->isApplied()) {
            const auto& lv = plv->getApplied();
            auto payload = BSONValTraits<A>::cast(lio::tcb::unlabelTCB(lv));
            if (!payload)
                return boost::none;
            return pl(lio::tcb::labelTCB(lv.getLabel(), std::move(*payload)));
        }
        auto payload = BSONValTraits<A>::cast(plv->getUnapplied());
        if (!payload)
            return boost::none;
        return pu<L>(std::move(*payload));
    }

    static std::string typeName() {
        return "PolicyLabeled " + BSONValTraits<A>::typeName();
    }
};

template <lio::Label L, BSONVal T>
requires(!val_detail::isLabelWrapper<L, T>)
struct Val<L, T> {
    static Value<L> val(const T& v) {
        return Value<L>(BSONValTraits<T>::val(v));
    }

    static boost::optional<T> castMaybe(const Value<L>& v) {
        const BSONValue* plain = v.getPlain();
        if (!plain)
            return boost::none;
        return BSONValTraits<T>::cast(*plain);
    }

    static std::string typeName() {
        return BSONValTraits<T>::typeName();
    }
};

/**
 * A type that can be stored in and recovered from a Value<L>.
 */
template <typename T, typename L>
concept ValType = lio::Label<L> && requires(const T& t, const Value<L>& v) {
    { Val<L, T>::val(t) } -> std::same_as<Value<L>>;
    { Val<L, T>::castMaybe(v) } -> std::same_as<boost::optional<T>>;
    { Val<L, T>::typeName() } -> std::convertible_to<std::string>;
};

/** Injects 'v' into a Value. Never fails. */
template <lio::Label L, ValType<L> T>
Value<L> val(const T& v) {
    return Val<L, T>::val(v);
}

template <lio::Label L>
Value<L> val(const char* s) {
    return Val<L, std::string>::val(std::string{s});
}

/** Recovers a T from 'v', or boost::none if 'v' does not hold a T. */
template <typename T, lio::Label L>
requires ValType<T, L>
boost::optional<T> castMaybe(const Value<L>& v) {
    return Val<L, T>::castMaybe(v);
}

/**
 * Recovers a T from 'v'. Returns TypeMismatch, naming the expected type and the rendered value,
 * if 'v' does not hold a T.
 */
template <typename T, lio::Label L>
requires ValType<T, L>
StatusWith<T> cast(const Value<L>& v) {
    auto result = Val<L, T>::castMaybe(v);
    if (!result)
        return makeTypeMismatchStatus(Val<L, T>::typeName(), v.toString());
    return std::move(*result);
}

/**
 * Like cast(), but throws an AssertionException on a mismatch. For call sites that already know
 * the type of 'v'.
 */
template <typename T, lio::Label L>
requires ValType<T, L>
T typed(const Value<L>& v) {
    return uassertStatusOK(cast<T>(v));
}

}  // namespace lbson
}  // namespace hails
