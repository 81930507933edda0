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

#include <cstdint>
#include <type_traits>
#include <utility>

#include "hails/lio/label.h"

namespace hails {
namespace lio {

/** Privilege type for computations that hold no privileges. */
struct NoPrivs {};

/** State type for computations that carry no user state. */
struct NoState {};

/**
 * The context of a labeled computation: its current label, its clearance (the upper bound on the
 * current label), the privileges it holds and its user state.
 *
 * Effectful actions run through rtioTCB, in program order.
 */
template <Label L, typename P = NoPrivs, typename S = NoState>
class LIO {
public:
    using LabelType = L;
    using PrivsType = P;
    using StateType = S;

    LIO(L label, L clearance, P privileges = P{}, S state = S{})
        : _label(std::move(label)),
          _clearance(std::move(clearance)),
          _privileges(std::move(privileges)),
          _state(std::move(state)) {}

    LIO(const LIO&) = delete;
    LIO& operator=(const LIO&) = delete;

    const L& getLabel() const {
        return _label;
    }

    const L& getClearance() const {
        return _clearance;
    }

    const P& getPrivileges() const {
        return _privileges;
    }

    S& getState() {
        return _state;
    }

    const S& getState() const {
        return _state;
    }

    /**
     * Runs 'action' as an unchecked effectful step of this computation and returns its result.
     */
    template <typename F>
    std::invoke_result_t<F> rtioTCB(F&& action) {
        ++_ioActions;
        return std::forward<F>(action)();
    }

    /** Number of actions run through rtioTCB so far. */
    uint64_t ioActionCount() const {
        return _ioActions;
    }

private:
    L _label;
    L _clearance;
    P _privileges;
    S _state;
    uint64_t _ioActions = 0;
};

}  // namespace lio
}  // namespace hails
