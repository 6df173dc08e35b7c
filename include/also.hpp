/*
Copyright 2024 Dmitry Sviridkin

Permission is hereby granted, free of charge, to any person obtaining a copy of
this software and associated documentation files (the “Software”), to deal in
the Software without restriction, including without limitation the rights to
use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of
the Software, and to permit persons to whom the Software is furnished to do so,
subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS
FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR
COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER
IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/

#pragma once

#include "concepts.hpp"

#include <functional>
#include <type_traits>
#include <utility>

namespace apply_also {

// Calls f with a const reference to the value and gives the value back.
// Whatever f returns is dropped.
//
// For an lvalue the result is a reference to the very same object.
// For an rvalue the value is moved into the result, never copied. const
// rvalues are rejected, they cannot be moved from.
template <class T, class F>
    requires Inspection<F, T>
constexpr T also(T&& value, F&& f) noexcept(
    std::is_nothrow_invocable_v<F, ConstView<T>> &&
    std::is_nothrow_constructible_v<T, T&&>) {
    std::invoke(std::forward<F>(f), std::as_const(value));
    return std::forward<T>(value);
}

// Calls f with a mutable reference to the value and gives the (possibly
// modified) value back.
//
//   auto map = apply_also::also_mut(std::map<std::string, std::string>{},
//                                   [](auto& it) { it["hello"] = "world"; });
template <class T, class F>
    requires Mutation<F, T>
constexpr T also_mut(T&& value, F&& f) noexcept(
    std::is_nothrow_invocable_v<F, MutView<T>> &&
    std::is_nothrow_constructible_v<T, T&&>) {
    std::invoke(std::forward<F>(f), value);
    return std::forward<T>(value);
}

} // namespace apply_also
