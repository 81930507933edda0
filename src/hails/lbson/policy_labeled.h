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
#include <variant>

#include "hails/config.h"
#include "hails/lio/label.h"
#include "hails/lio/labeled.h"
#include "hails/util/assert_util.h"

namespace hails {
namespace lbson {

/**
 * A value whose labeling policy has either not been applied yet (a plain payload) or has been
 * applied (a Labeled payload).
 *
 * Like lio::Labeled, PolicyLabeled offers no equality and no stream operator.
 */
template <lio::Label L, typename T>
class PolicyLabeled {
public:
    using LabelType = L;
    using ValueType = T;
    using LabeledType = lio::Labeled<L, T>;

    /** Policy not applied. */
    static PolicyLabeled unapplied(T value) {
        return PolicyLabeled(std::in_place_index<0>, std::move(value));
    }

    /** Policy applied. */
    static PolicyLabeled applied(LabeledType lv) {
        return PolicyLabeled(std::in_place_index<1>, std::move(lv));
    }

    bool isApplied() const {
        return _value.index() == 1;
    }

    const T& getUnapplied() const {
        invariant(!isApplied());
        return std::get<0>(_value);
    }

    const LabeledType& getApplied() const {
        invariant(isApplied());
        return std::get<1>(_value);
    }

    /**
     * Calls 'visitor' with either the unapplied payload (const T&) or the applied Labeled
     * payload (const LabeledType&).
     */
    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), _value);
    }

private:
    template <size_t I, typename U>
    PolicyLabeled(std::in_place_index_t<I> idx, U&& v) : _value(idx, std::forward<U>(v)) {}

    std::variant<T, LabeledType> _value;
};

/** Wraps a value whose policy has not been applied yet. */
template <lio::Label L, typename T>
PolicyLabeled<L, std::decay_t<T>> pu(T&& x) {
    return PolicyLabeled<L, std::decay_t<T>>::unapplied(std::forward<T>(x));
}

/** Wraps an already labeled value. */
template <lio::Label L, typename T>
PolicyLabeled<L, T> pl(lio::Labeled<L, T> lv) {
    return PolicyLabeled<L, T>::applied(std::move(lv));
}

namespace tcb {

/**
 * Renders the payload of either state. Only available in builds configured with debug rendering
 * of labeled values.
 */
template <lio::Label L, typename T>
requires(kDebugLabeledRendering)
std::string showTCB(const PolicyLabeled<L, T>& plv) {
    if (plv.isApplied())
        return lio::tcb::showTCB(plv.getApplied());
    return lio::tcb::detail::renderPayload(plv.getUnapplied());
}

}  // namespace tcb
}  // namespace lbson
}  // namespace hails
