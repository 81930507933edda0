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

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "hails/config.h"
#include "hails/lio/label.h"

namespace hails {
namespace lio {

namespace tcb {
struct LabeledAccess;
}  // namespace tcb

/**
 * An immutable value protected by a label.
 *
 * Only the label is public. The payload can only be reached through the trusted functions in
 * lio::tcb. Labeled has no equality operator and no stream operator, so protected
 * content can neither be compared nor printed by ordinary code.
 */
template <Label L, typename T>
class Labeled {
public:
    using LabelType = L;
    using ValueType = T;

    const L& getLabel() const {
        return _label;
    }

private:
    friend struct tcb::LabeledAccess;

    Labeled(L label, T value) : _label(std::move(label)), _value(std::move(value)) {}

    L _label;
    T _value;
};

template <Label L, typename T>
const L& labelOf(const Labeled<L, T>& lv) {
    return lv.getLabel();
}

/**
 * Trusted computing base. These functions bypass label checks and may only be used by code that
 * converts between representations of an already labeled value.
 */
namespace tcb {

struct LabeledAccess {
    template <Label L, typename T>
    static Labeled<L, T> make(L label, T value) {
        return Labeled<L, T>(std::move(label), std::move(value));
    }

    template <Label L, typename T>
    static const T& payload(const Labeled<L, T>& lv) {
        return lv._value;
    }
};

/** Wraps 'value' with 'label' without any flow check. */
template <Label L, typename T>
Labeled<L, std::decay_t<T>> labelTCB(L label, T&& value) {
    return LabeledAccess::make<L, std::decay_t<T>>(std::move(label), std::forward<T>(value));
}

/** Returns the payload of 'lv' without raising the current label. */
template <Label L, typename T>
const T& unlabelTCB(const Labeled<L, T>& lv) {
    return LabeledAccess::payload(lv);
}

namespace detail {
template <typename T>
std::string renderPayload(const T& v) {
    if constexpr (requires { v.toString(); }) {
        return v.toString();
    } else if constexpr (requires { toString(v); }) {
        return toString(v);
    } else {
        std::ostringstream ss;
        ss << v;
        return ss.str();
    }
}
}  // namespace detail

/**
 * Renders the payload followed by the label, e.g. "5 {1,2}". Only available in builds
 * configured with debug rendering of labeled values.
 */
template <Label L, typename T>
requires(kDebugLabeledRendering)
std::string showTCB(const Labeled<L, T>& lv) {
    return detail::renderPayload(unlabelTCB(lv)) + " " + lv.getLabel().toString();
}

}  // namespace tcb
}  // namespace lio
}  // namespace hails
