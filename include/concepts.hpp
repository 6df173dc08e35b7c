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

#include <type_traits>

namespace apply_also {

// Value category of the argument is part of the contract: rvalues are
// consumed, lvalues are lent to the call and stay with the caller.
template <class T>
concept IsConsumed = !std::is_lvalue_reference_v<T>;

template <class T>
using ConstView = std::add_lvalue_reference_t<
    std::add_const_t<std::remove_reference_t<T>>>;

template <class T>
using MutView = std::add_lvalue_reference_t<std::remove_reference_t<T>>;

// F can take the value itself, with its original value category
template <class F, class T>
concept Transform = std::is_invocable_v<F, T>;

// F can take a read-only view of the value
template <class F, class T>
concept RefTransform = std::is_invocable_v<F, ConstView<T>>;

// A consumed const value could only be copied into the result, so it is
// refused along with callables that cannot take a const view.
template <class F, class T>
concept Inspection =
    !(IsConsumed<T> && std::is_const_v<std::remove_reference_t<T>>) &&
    std::is_invocable_v<F, ConstView<T>>;

// const objects cannot be lent mutably. The constness check goes first so
// that a generic callable is never instantiated with a const argument.
template <class F, class T>
concept Mutation = !std::is_const_v<std::remove_reference_t<T>> &&
                   std::is_invocable_v<F, MutView<T>>;

} // namespace apply_also
