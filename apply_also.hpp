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

#include <functional>
#include <type_traits>
#include <utility>

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

// Adaptors returned by the single argument overloads of the combinators.
// `value | adaptor` is the same call as `combinator(value, fn)`:
//
//   auto count = std::vector<std::string>{}
//              | apply_also::also_mut([](auto& v) { v.push_back("hello"); })
//              | apply_also::also([](const auto& v) { std::cout << v.size(); })
//              | apply_also::apply_ref([](const auto& v) { return v.size(); });
//
// An adaptor passed as an rvalue gives its function away, one kept in a
// variable may be piped into any number of values.

template <class F>
struct Applier final {
    F fn;
};

template <class F>
struct RefApplier final {
    F fn;
};

template <class F>
struct Inspector final {
    F fn;
};

template <class F>
struct Mutator final {
    F fn;
};

template <class F>
Applier(F) -> Applier<F>;
template <class F>
RefApplier(F) -> RefApplier<F>;
template <class F>
Inspector(F) -> Inspector<F>;
template <class F>
Mutator(F) -> Mutator<F>;

template <class A>
constexpr bool IsApplier = false;
template <class F>
constexpr bool IsApplier<Applier<F>> = true;

template <class A>
constexpr bool IsRefApplier = false;
template <class F>
constexpr bool IsRefApplier<RefApplier<F>> = true;

template <class A>
constexpr bool IsInspector = false;
template <class F>
constexpr bool IsInspector<Inspector<F>> = true;

template <class A>
constexpr bool IsMutator = false;
template <class F>
constexpr bool IsMutator<Mutator<F>> = true;

// Type of the wrapped function as seen through an adaptor of the given
// value category: moved out of rvalues, const from const adaptors.
template <class A>
using AdaptorFn = decltype((std::declval<A>().fn));

template <class F>
constexpr auto apply(F&& f) noexcept(
    std::is_nothrow_constructible_v<std::decay_t<F>, F>) {
    return Applier<std::decay_t<F>>{std::forward<F>(f)};
}

template <class F>
constexpr auto apply_ref(F&& f) noexcept(
    std::is_nothrow_constructible_v<std::decay_t<F>, F>) {
    return RefApplier<std::decay_t<F>>{std::forward<F>(f)};
}

template <class F>
constexpr auto also(F&& f) noexcept(
    std::is_nothrow_constructible_v<std::decay_t<F>, F>) {
    return Inspector<std::decay_t<F>>{std::forward<F>(f)};
}

template <class F>
constexpr auto also_mut(F&& f) noexcept(
    std::is_nothrow_constructible_v<std::decay_t<F>, F>) {
    return Mutator<std::decay_t<F>>{std::forward<F>(f)};
}

template <class T, class A>
    requires IsApplier<std::remove_cvref_t<A>> && Transform<AdaptorFn<A>, T>
constexpr decltype(auto) operator|(T&& value, A&& adaptor) noexcept(
    noexcept(apply_also::apply(std::forward<T>(value),
                               std::forward<A>(adaptor).fn))) {
    return apply_also::apply(std::forward<T>(value),
                             std::forward<A>(adaptor).fn);
}

template <class T, class A>
    requires IsRefApplier<std::remove_cvref_t<A>> &&
             RefTransform<AdaptorFn<A>, T>
constexpr decltype(auto) operator|(T&& value, A&& adaptor) noexcept(
    noexcept(apply_also::apply_ref(std::forward<T>(value),
                                   std::forward<A>(adaptor).fn))) {
    return apply_also::apply_ref(std::forward<T>(value),
                                 std::forward<A>(adaptor).fn);
}

template <class T, class A>
    requires IsInspector<std::remove_cvref_t<A>> &&
             Inspection<AdaptorFn<A>, T>
constexpr T operator|(T&& value, A&& adaptor) noexcept(
    noexcept(apply_also::also(std::forward<T>(value),
                              std::forward<A>(adaptor).fn))) {
    return apply_also::also(std::forward<T>(value),
                            std::forward<A>(adaptor).fn);
}

template <class T, class A>
    requires IsMutator<std::remove_cvref_t<A>> && Mutation<AdaptorFn<A>, T>
constexpr T operator|(T&& value, A&& adaptor) noexcept(
    noexcept(apply_also::also_mut(std::forward<T>(value),
                                  std::forward<A>(adaptor).fn))) {
    return apply_also::also_mut(std::forward<T>(value),
                                std::forward<A>(adaptor).fn);
}

} // namespace apply_also
