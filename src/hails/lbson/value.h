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

#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include "hails/base/string_data.h"
#include "hails/bson/bson_value.h"
#include "hails/config.h"
#include "hails/lbson/policy_labeled.h"
#include "hails/lio/label.h"
#include "hails/lio/labeled.h"
#include "hails/platform/compiler.h"

namespace hails {
namespace lbson {

/** Rendering of labeled content in builds without debug rendering. */
constexpr inline StringData kHiddenDataPlaceholder = "{- HIDING DATA -} "_sd;

/**
 * The value of a Field: a plain BSON value, a labeled BSON value, or a policy-labeled BSON value.
 *
 * Only plain values take part in equality. A comparison involving a labeled or policy-labeled
 * value is always false, even when a value is compared to itself. Likewise toString() only shows
 * labeled content in builds configured with debug rendering.
 */
template <lio::Label L>
class Value {
public:
    using LabeledType = lio::Labeled<L, BSONValue>;
    using PolicyLabeledType = PolicyLabeled<L, BSONValue>;

    enum class Kind { kPlain, kLabeled, kPolicyLabeled };

    explicit Value(BSONValue v) : _value(std::in_place_index<0>, std::move(v)) {}
    explicit Value(LabeledType lv) : _value(std::in_place_index<1>, std::move(lv)) {}
    explicit Value(PolicyLabeledType plv) : _value(std::in_place_index<2>, std::move(plv)) {}

    Kind kind() const {
        return static_cast<Kind>(_value.index());
    }

    bool isPlain() const {
        return kind() == Kind::kPlain;
    }

    bool isLabeled() const {
        return kind() == Kind::kLabeled;
    }

    bool isPolicyLabeled() const {
        return kind() == Kind::kPolicyLabeled;
    }

    /** The payload of a plain value, nullptr for any other kind. */
    const BSONValue* getPlain() const {
        return std::get_if<0>(&_value);
    }

    const LabeledType* getLabeled() const {
        return std::get_if<1>(&_value);
    }

    const PolicyLabeledType* getPolicyLabeled() const {
        return std::get_if<2>(&_value);
    }

    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), _value);
    }

    std::string toString() const {
        switch (kind()) {
            case Kind::kPlain:
                return getPlain()->toString();
            case Kind::kLabeled:
                if constexpr (kDebugLabeledRendering) {
                    return lio::tcb::showTCB(*getLabeled());
                } else {
                    return std::string{kHiddenDataPlaceholder};
                }
            case Kind::kPolicyLabeled:
                if constexpr (kDebugLabeledRendering) {
                    return tcb::showTCB(*getPolicyLabeled());
                } else {
                    return std::string{kHiddenDataPlaceholder};
                }
        }
        HAILS_COMPILER_UNREACHABLE;
    }

    friend bool operator==(const Value& lhs, const Value& rhs) {
        const BSONValue* l = lhs.getPlain();
        const BSONValue* r = rhs.getPlain();
        return l && r && *l == *r;
    }

    friend std::ostream& operator<<(std::ostream& os, const Value& v) {
        return os << v.toString();
    }

private:
    std::variant<BSONValue, LabeledType, PolicyLabeledType> _value;
};

}  // namespace lbson
}  // namespace hails
