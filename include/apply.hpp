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

// Passes the value to f and returns whatever f returns.
// Rvalues are moved into f, lvalues are passed as lvalues.
// A reference returned into a consumed value dangles once the full
// expression ends; references to anything else are returned as is.
//
//   auto x = apply_also::apply(256, [](int it) { return it * 2; }); // 512
template <class T, class F>
    requires Transform<F, T>
constexpr decltype(auto)
apply(T&& value, F&& f) noexcept(std::is_nothrow_invocable_v<F, T>) {
    return std::invoke(std::forward<F>(f), std::forward<T>(value));
}

// Same as apply, but f only gets a const reference to the value.
// A consumed value is destroyed at the end of the full expression, after f
// has returned, so the same rule about returned references applies.
//
//   auto n = apply_also::apply_ref(std::vector{1, 2, 3},
//                                  [](const auto& v) { return v.size(); });
template <class T, class F>
    requires RefTransform<F, T>
constexpr decltype(auto) apply_ref(T&& value, F&& f) noexcept(
    std::is_nothrow_invocable_v<F, ConstView<T>>) {
    return std::invoke(std::forward<F>(f), std::as_const(value));
}

} // namespace apply_also
