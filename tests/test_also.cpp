#include "also.hpp"

#include <gtest/gtest.h>

#include "tracked.hpp"

#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

void inspect_vector(const std::vector<int>&) {}

struct Print {
    std::ostream* out;
    void operator()(const int& x) const { *out << x; }
};

struct NothrowInspect {
    void operator()(const std::string&) const noexcept {}
};

struct Increment {
    void operator()(int& x) const { ++x; }
};

struct ThrowingMove {
    ThrowingMove() = default;
    ThrowingMove(const ThrowingMove&) = default;
    ThrowingMove(ThrowingMove&&) noexcept(false) {}
};

struct InspectThrowingMove {
    void operator()(const ThrowingMove&) const noexcept {}
};

template <class T, class F>
concept CanAlsoMut = requires(T&& value, F&& f) {
    apply_also::also_mut(std::forward<T>(value), std::forward<F>(f));
};

template <class T, class F>
concept CanAlso = requires(T&& value, F&& f) {
    apply_also::also(std::forward<T>(value), std::forward<F>(f));
};

} // namespace

static_assert(apply_also::also(3, [](const int&) {}) == 3);
static_assert(apply_also::also_mut(1, [](int& x) { x += 1; }) == 2);

static_assert(std::is_same_v<decltype(apply_also::also(std::string{},
                                                       NothrowInspect{})),
                             std::string>);
static_assert(std::is_same_v<decltype(apply_also::also(
                                 std::declval<std::string&>(), NothrowInspect{})),
                             std::string&>);
static_assert(std::is_same_v<decltype(apply_also::also_mut(
                                 std::declval<int&>(), Increment{})),
                             int&>);

static_assert(noexcept(apply_also::also(std::string{}, NothrowInspect{})));
static_assert(!noexcept(apply_also::also(ThrowingMove{}, InspectThrowingMove{})));
static_assert(noexcept(apply_also::also(std::declval<ThrowingMove&>(),
                                        InspectThrowingMove{})));
static_assert(!noexcept(apply_also::also_mut(1, Increment{})));

static_assert(CanAlsoMut<int, Increment>);
static_assert(CanAlsoMut<int&, Increment>);
static_assert(!CanAlsoMut<const int&, Increment>);
static_assert(!CanAlsoMut<const int, Increment>);
static_assert(CanAlso<const int&, Print>);
static_assert(!CanAlso<int, void (*)(int&)>);
static_assert(!CanAlso<const Tracked, void (*)(const Tracked&)>);
static_assert(!CanAlso<const Tracked&&, void (*)(const Tracked&)>);
static_assert(CanAlso<const Tracked&, void (*)(const Tracked&)>);
static_assert(!CanAlsoMut<const Tracked&&, void (*)(Tracked&)>);

TEST(Also, ReturnsOriginalValue) {
    std::ostringstream out;
    auto x = apply_also::also(3, Print{&out});
    EXPECT_EQ(x, 3);
    EXPECT_EQ(out.str(), "3");
}

TEST(Also, InvokesExactlyOnce) {
    int calls = 0;
    auto v = apply_also::also(std::vector<int>{1, 2},
                              [&](const std::vector<int>&) { ++calls; });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(v, (std::vector<int>{1, 2}));
}

TEST(Also, LvalueKeepsIdentity) {
    std::string s = "hello";
    std::string& same = apply_also::also(s, [](const std::string&) {});
    EXPECT_EQ(&same, &s);
    EXPECT_EQ(s, "hello");
}

TEST(Also, ReceivesConstView) {
    bool saw_const = false;
    std::string s = "hello";
    apply_also::also(s, [&](auto& it) {
        saw_const = std::is_const_v<std::remove_reference_t<decltype(it)>>;
    });
    EXPECT_TRUE(saw_const);
}

TEST(Also, DropsFunctionResult) {
    EXPECT_EQ(apply_also::also(5, [](const int& x) { return x * 100; }), 5);
}

TEST(Also, FunctionPointer) {
    auto v = apply_also::also(std::vector<int>{}, inspect_vector);
    EXPECT_TRUE(v.empty());
}

TEST(Also, MoveOnlyValue) {
    int seen = 0;
    auto p = apply_also::also(std::make_unique<int>(7),
                              [&](const std::unique_ptr<int>& it) { seen = *it; });
    ASSERT_TRUE(p);
    EXPECT_EQ(*p, 7);
    EXPECT_EQ(seen, 7);
}

TEST(Also, DoesNotCopy) {
    int copies = 0;
    auto moved = apply_also::also(Tracked{1, &copies}, [](const Tracked&) {});
    EXPECT_EQ(moved.value, 1);

    Tracked lvalue{2, &copies};
    apply_also::also(lvalue, [](const Tracked&) {});
    EXPECT_EQ(lvalue.value, 2);
    EXPECT_EQ(copies, 0);
}

TEST(Also, ConstLvalueStaysBorrowed) {
    int copies = 0;
    const Tracked fixed{4, &copies};
    const Tracked& same = apply_also::also(fixed, [](const Tracked&) {});
    EXPECT_EQ(&same, &fixed);
    EXPECT_EQ(copies, 0);
}

TEST(Also, PropagatesExceptions) {
    EXPECT_THROW(apply_also::also(std::string{},
                                  [](const std::string& s) { s.at(0); }),
                 std::out_of_range);
}

TEST(AlsoMut, BuildsVector) {
    auto x = apply_also::also_mut(std::vector<std::string>{}, [](auto& it) {
        it.push_back("hello");
        it.push_back("world");
    });
    EXPECT_EQ(x, (std::vector<std::string>{"hello", "world"}));
}

TEST(AlsoMut, BuildsMap) {
    auto map = apply_also::also_mut(std::map<std::string, std::string>{},
                                    [](auto& it) { it.emplace("hello", "world"); });
    ASSERT_EQ(map.count("hello"), 1u);
    EXPECT_EQ(map.at("hello"), "world");
}

TEST(AlsoMut, MutatesLvalueInPlace) {
    std::vector<int> v{1};
    std::vector<int>& same =
        apply_also::also_mut(v, [](std::vector<int>& it) { it.push_back(2); });
    EXPECT_EQ(&same, &v);
    EXPECT_EQ(v, (std::vector<int>{1, 2}));
}

TEST(AlsoMut, InvokesExactlyOnce) {
    int calls = 0;
    auto x = apply_also::also_mut(10, [&](int& it) {
        ++calls;
        it *= 2;
    });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(x, 20);
}

TEST(AlsoMut, DoesNotCopy) {
    int copies = 0;
    auto moved = apply_also::also_mut(Tracked{1, &copies},
                                      [](Tracked& t) { t.value = 8; });
    EXPECT_EQ(moved.value, 8);
    EXPECT_EQ(copies, 0);
}

TEST(AlsoMut, ExceptionKeepsPartialMutation) {
    std::vector<int> v;
    EXPECT_THROW(apply_also::also_mut(v,
                                      [](std::vector<int>& it) {
                                          it.push_back(1);
                                          throw std::runtime_error("stop");
                                      }),
                 std::runtime_error);
    EXPECT_EQ(v, (std::vector<int>{1}));
}

TEST(AlsoMut, Reentrant) {
    auto outer = apply_also::also_mut(std::vector<std::vector<int>>{},
                                      [](auto& it) {
                                          it.push_back(apply_also::also_mut(
                                              std::vector<int>{},
                                              [](auto& inner) {
                                                  inner.push_back(1);
                                              }));
                                      });
    ASSERT_EQ(outer.size(), 1u);
    EXPECT_EQ(outer.front(), (std::vector<int>{1}));
}
