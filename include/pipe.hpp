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

#include "also.hpp"
#include "apply.hpp"
#include "concepts.hpp"

#include <type_traits>
#include <utility>

namespace apply_also {

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
