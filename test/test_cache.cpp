#include <doctest/doctest.h>
#include <koi/koi.hpp>

TEST_CASE("Cache: starts zeroed") {
    koi::color_cache cache;
    for (const auto& slot : cache.slots()) {
        CHECK(slot == koi::pixel{0, 0, 0, 0});
    }

    // The transparent default is already a hit for its own slot
    CHECK(cache.contains({0, 0, 0, 0}));
    CHECK_FALSE(cache.contains(koi::START_PIXEL));
}

TEST_CASE("Cache: store and lookup") {
    koi::color_cache cache;
    const koi::pixel px{10, 10, 10, 255};

    const auto index = cache.store(px);
    CHECK(index == 11);
    CHECK(cache.lookup(index) == px);
    CHECK(cache.contains(px));

    SUBCASE("Collision evicts") {
        // r + 64 moves the hash sum by 192, a multiple of 64
        const koi::pixel other{74, 10, 10, 255};
        REQUIRE(koi::pixel_hash(other) == index);
        cache.store(other);
        CHECK(cache.lookup(index) == other);
        CHECK_FALSE(cache.contains(px));
    }

    SUBCASE("Clear") {
        cache.clear();
        CHECK_FALSE(cache.contains(px));
    }
}

TEST_CASE("Cache: equality") {
    koi::color_cache a;
    koi::color_cache b;
    CHECK(a == b);

    a.store({1, 2, 3, 4});
    CHECK_FALSE(a == b);

    b.store({1, 2, 3, 4});
    CHECK(a == b);
}
