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

/**
 * Compiler-specific attribute macros.
 *
 * HAILS_COMPILER_COLD_FUNCTION marks functions on rarely-taken error paths so the optimizer can
 * move them out of line.
 *
 * HAILS_COMPILER_NORETURN marks functions that never return (they throw or terminate).
 *
 * HAILS_likely(x) / HAILS_unlikely(x) are branch prediction hints.
 */

#pragma once

#ifdef __clang__
#define HAILS_COMPILER_COLD_FUNCTION
#define HAILS_COMPILER_NORETURN __attribute__((__noreturn__))
#else
#define HAILS_COMPILER_COLD_FUNCTION __attribute__((__cold__))
#define HAILS_COMPILER_NORETURN __attribute__((__noreturn__, __cold__))
#endif

#define HAILS_likely(x) static_cast<bool>(__builtin_expect(static_cast<bool>(x), 1))
#define HAILS_unlikely(x) static_cast<bool>(__builtin_expect(static_cast<bool>(x), 0))

#define HAILS_COMPILER_ALWAYS_INLINE [[gnu::always_inline]]

#define HAILS_COMPILER_UNREACHABLE __builtin_unreachable()
