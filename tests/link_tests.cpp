#include <catch2/catch_test_macros.hpp>

#include "chain_test_support.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace {

constexpr auto constant_chain = terminal{ 1 }.append(2U).append(3.0);
static_assert(constant_chain.len() == 3, "link length is usable in constant expressions");
static_assert(constant_chain.get() == 3.0);
static_assert(constant_chain.parent.get() == 2U);
static_assert(constant_chain.parent.parent.get() == 1);

static_assert(std::is_same_v<decltype(constant_chain), const objchain::link<double, objchain::link<unsigned, terminal<int>>>>);
static_assert(std::is_same_v<objchain::link<double, terminal<int>>::parent_type, terminal<int>>);
static_assert(std::is_same_v<objchain::link<double, terminal<int>>::inner_type, double>);

// Links are only ever produced by append.
static_assert(!std::is_constructible_v<objchain::link<int, terminal<int>>, int, terminal<int>>);
static_assert(!std::is_default_constructible_v<objchain::link<int, terminal<int>>>);

// append stores payloads by value.
static_assert(std::is_same_v<decltype(std::declval<terminal<int>>().append(std::declval<const std::string &>())),
  objchain::link<std::string, terminal<int>>>);

template<typename Chain, typename Item> constexpr auto grows_by_one(Chain chain, Item item) -> bool {
    const auto before = chain.len();
    return std::move(chain).append(item).len() == before + 1;
}

static_assert(grows_by_one(terminal{ 0 }, 'x'));
static_assert(grows_by_one(terminal{ 0 }.append(1).append(2).append(3), 4L));

}// namespace

TEST_CASE("append increases the length by exactly one", "[link]") {
    auto c1 = terminal{ std::uint8_t{ 0 } };
    auto c2 = std::move(c1).append(std::uint16_t{ 1 });
    auto c3 = std::move(c2).append(std::uint32_t{ 2 });

    REQUIRE(c3.len() == 3);
    REQUIRE(c3.parent.len() == 2);
    REQUIRE(c3.parent.parent.len() == 1);
}

TEST_CASE("append applied k times adds k to the length", "[link]") {
    const auto start = terminal{ A{} }.append(B{});
    const auto grown = start.append(1).append(2).append(3).append(4).append(5);

    REQUIRE(start.len() == 2);
    REQUIRE(grown.len() == start.len() + 5);
}

TEST_CASE("get returns the most recently appended payload", "[link]") {
    const auto chain = terminal{ std::uint8_t{ 1 } }.append(std::uint16_t{ 2 }).append(std::uint32_t{ 3 });

    REQUIRE(chain.get() == 3U);
    REQUIRE(&chain.get() == &chain.object);
    REQUIRE(chain.parent.get() == 2U);
    REQUIRE(chain.parent.parent.get() == 1U);
}

TEST_CASE("get_mut only touches the element's own payload", "[link]") {
    auto chain = terminal{ 10 }.append(20).append(30);

    chain.get_mut() = 31;
    chain.parent.get_mut() += 1;

    REQUIRE(chain.get() == 31);
    REQUIRE(chain.parent.get() == 21);
    REQUIRE(chain.parent.parent.get() == 10);
    REQUIRE(chain.len() == 3);
}

TEST_CASE("append preserves earlier payloads", "[link]") {
    auto c1 = terminal{ std::string("gps") }.append(std::string("imu"));
    const std::string before = c1.get();

    auto c2 = std::move(c1).append(std::string("baro"));

    REQUIRE(c2.parent.get() == before);
    REQUIRE(c2.parent.parent.get() == "gps");
    REQUIRE(c2.get() == "baro");
}

TEST_CASE("append on an rvalue moves the chain", "[link]") {
    int copies = 0;
    int moves = 0;
    auto chain = terminal<copy_counter>(copy_counter(&copies, &moves));
    copies = 0;
    moves = 0;

    auto grown = std::move(chain).append(5);

    REQUIRE(grown.len() == 2);
    REQUIRE(copies == 0);
    REQUIRE(moves == 1);
}

TEST_CASE("append on an lvalue copies the chain", "[link]") {
    int copies = 0;
    int moves = 0;
    const auto chain = terminal<copy_counter>(copy_counter(&copies, &moves));
    copies = 0;
    moves = 0;

    const auto grown = chain.append(5);

    REQUIRE(grown.len() == 2);
    REQUIRE(chain.len() == 1);
    REQUIRE(copies == 1);
    REQUIRE(moves == 0);
}

TEST_CASE("chains of move-only payloads grow by moving", "[link]") {
    auto chain = terminal{ sensor_handle{ std::make_unique<int>(1) } }.append(sensor_handle{ std::make_unique<int>(2) });
    auto grown = std::move(chain).append(sensor_handle{ std::make_unique<int>(3) });

    static_assert(!std::is_copy_constructible_v<decltype(grown)>);
    REQUIRE(grown.len() == 3);
    REQUIRE(*grown.get().reading == 3);
    REQUIRE(*grown.parent.get().reading == 2);
    REQUIRE(*grown.parent.parent.get().reading == 1);
}

TEST_CASE("links are plain nested storage", "[link]") {
    using chain_type = objchain::link<std::uint32_t, objchain::link<std::uint32_t, terminal<std::uint32_t>>>;

    STATIC_REQUIRE(std::is_trivially_copyable_v<chain_type>);
    STATIC_REQUIRE(sizeof(chain_type) == 3 * sizeof(std::uint32_t));
}
