#include <doctest/doctest.h>
#include <koi/koi.hpp>

#include <array>
#include <cstddef>
#include <initializer_list>

TEST_CASE("Ops: every leading byte has exactly one owner") {
    std::array<int, koi::OP_KIND_COUNT> counts{};
    for (int b = 0; b < 256; ++b) {
        const auto kind = koi::classify(static_cast<std::uint8_t>(b));
        ++counts[static_cast<std::size_t>(kind)];
    }

    CHECK(counts[static_cast<std::size_t>(koi::op_kind::index)] == 64);
    CHECK(counts[static_cast<std::size_t>(koi::op_kind::diff)] == 64);
    CHECK(counts[static_cast<std::size_t>(koi::op_kind::luma)] == 64);
    CHECK(counts[static_cast<std::size_t>(koi::op_kind::run)] == 16);
    CHECK(counts[static_cast<std::size_t>(koi::op_kind::alpha_diff)] == 32);
    CHECK(counts[static_cast<std::size_t>(koi::op_kind::gray)] == 1);
    CHECK(counts[static_cast<std::size_t>(koi::op_kind::gray_alpha)] == 1);
    CHECK(counts[static_cast<std::size_t>(koi::op_kind::rgb)] == 1);
    CHECK(counts[static_cast<std::size_t>(koi::op_kind::rgba)] == 1);
    CHECK(counts[static_cast<std::size_t>(koi::op_kind::unassigned)] == 12);
}

TEST_CASE("Ops: range boundaries") {
    CHECK(koi::classify(0x00) == koi::op_kind::index);
    CHECK(koi::classify(0x3F) == koi::op_kind::index);
    CHECK(koi::classify(0x40) == koi::op_kind::diff);
    CHECK(koi::classify(0x7F) == koi::op_kind::diff);
    CHECK(koi::classify(0x80) == koi::op_kind::luma);
    CHECK(koi::classify(0xBF) == koi::op_kind::luma);
    CHECK(koi::classify(0xC0) == koi::op_kind::run);
    CHECK(koi::classify(0xCF) == koi::op_kind::run);
    CHECK(koi::classify(0xD0) == koi::op_kind::alpha_diff);
    CHECK(koi::classify(0xEF) == koi::op_kind::alpha_diff);
    CHECK(koi::classify(0xF0) == koi::op_kind::unassigned);
    CHECK(koi::classify(0xFB) == koi::op_kind::unassigned);
    CHECK(koi::classify(0xFC) == koi::op_kind::gray);
    CHECK(koi::classify(0xFD) == koi::op_kind::gray_alpha);
    CHECK(koi::classify(0xFE) == koi::op_kind::rgb);
    CHECK(koi::classify(0xFF) == koi::op_kind::rgba);
}

TEST_CASE("Ops: coarse difference") {
    SUBCASE("Edges of the range are representable") {
        CHECK(koi::encode_diff({-2, -2, -2, 0}) == std::uint8_t{0x40});
        CHECK(koi::encode_diff({1, 1, 1, 0}) == std::uint8_t{0x7F});
        CHECK(koi::encode_diff({0, 0, 0, 0}) == std::uint8_t{0x6A});
    }

    SUBCASE("One past the edge is not") {
        CHECK_FALSE(koi::encode_diff({2, 0, 0, 0}).has_value());
        CHECK_FALSE(koi::encode_diff({0, -3, 0, 0}).has_value());
        CHECK_FALSE(koi::encode_diff({0, 0, 2, 0}).has_value());
    }

    SUBCASE("Alpha must be unchanged") {
        CHECK_FALSE(koi::encode_diff({0, 0, 0, 1}).has_value());
    }

    SUBCASE("Decodes back with wraparound") {
        const koi::pixel prev{0, 128, 255, 40};
        const auto op = koi::encode_diff({-2, 0, 1, 0});
        REQUIRE(op.has_value());
        CHECK(koi::classify(*op) == koi::op_kind::diff);
        CHECK(koi::apply_diff(prev, *op) == koi::pixel{254, 128, 0, 40});
    }
}

TEST_CASE("Ops: luma difference") {
    SUBCASE("Green range edges") {
        auto lo = koi::encode_luma({-32, -32, -32, 0});
        REQUIRE(lo.has_value());
        CHECK((*lo)[0] == 0x80);
        CHECK((*lo)[1] == 0x88);

        auto hi = koi::encode_luma({31, 31, 31, 0});
        REQUIRE(hi.has_value());
        CHECK((*hi)[0] == 0xBF);
        CHECK((*hi)[1] == 0x88);

        CHECK_FALSE(koi::encode_luma({32, 32, 32, 0}).has_value());
        CHECK_FALSE(koi::encode_luma({-33, -33, -33, 0}).has_value());
    }

    SUBCASE("Red and blue relative to green") {
        auto edge = koi::encode_luma({7, 0, -8, 0});
        REQUIRE(edge.has_value());
        CHECK((*edge)[0] == 0xA0);
        CHECK((*edge)[1] == 0xF0);

        CHECK_FALSE(koi::encode_luma({8, 0, 0, 0}).has_value());
        CHECK_FALSE(koi::encode_luma({0, 0, -9, 0}).has_value());
    }

    SUBCASE("Alpha must be unchanged") {
        CHECK_FALSE(koi::encode_luma({0, 0, 0, -1}).has_value());
    }

    SUBCASE("Decodes back with wraparound") {
        const koi::pixel prev{250, 2, 5, 255};
        const koi::pixel_delta d{20, 25, 30, 0};
        const auto luma = koi::encode_luma(d);
        REQUIRE(luma.has_value());
        CHECK(koi::classify((*luma)[0]) == koi::op_kind::luma);
        CHECK(koi::apply_luma(prev, (*luma)[0], (*luma)[1]) == koi::pixel{14, 27, 35, 255});
    }
}

TEST_CASE("Ops: alpha-only difference") {
    const koi::pixel prev{9, 8, 7, 200};

    SUBCASE("Representable deltas") {
        for (int da : {-16, -1, 1, 15}) {
            const koi::pixel curr{9, 8, 7, static_cast<std::uint8_t>(200 + da)};
            const auto op = koi::encode_alpha_diff(curr, prev);
            REQUIRE(op.has_value());
            CHECK(koi::classify(*op) == koi::op_kind::alpha_diff);
            CHECK(koi::apply_alpha_diff(prev, *op) == curr);
        }
        CHECK(koi::encode_alpha_diff({9, 8, 7, 184}, prev) == std::uint8_t{0xD0});
        CHECK(koi::encode_alpha_diff({9, 8, 7, 215}, prev) == std::uint8_t{0xEF});
    }

    SUBCASE("Rejected cases") {
        CHECK_FALSE(koi::encode_alpha_diff(prev, prev).has_value());
        CHECK_FALSE(koi::encode_alpha_diff({9, 8, 7, 216}, prev).has_value());
        CHECK_FALSE(koi::encode_alpha_diff({9, 8, 7, 183}, prev).has_value());
        CHECK_FALSE(koi::encode_alpha_diff({9, 8, 6, 201}, prev).has_value());
    }

    SUBCASE("Wraps around 255") {
        const koi::pixel opaque{0, 0, 0, 250};
        const koi::pixel wrapped{0, 0, 0, 4};
        const auto op = koi::encode_alpha_diff(wrapped, opaque);
        REQUIRE(op.has_value());
        CHECK(koi::apply_alpha_diff(opaque, *op) == wrapped);
    }
}

TEST_CASE("Ops: payload sizes") {
    CHECK(koi::payload_size(koi::op_kind::index) == 0);
    CHECK(koi::payload_size(koi::op_kind::diff) == 0);
    CHECK(koi::payload_size(koi::op_kind::alpha_diff) == 0);
    CHECK(koi::payload_size(koi::op_kind::luma) == 1);
    CHECK(koi::payload_size(koi::op_kind::gray) == 1);
    CHECK(koi::payload_size(koi::op_kind::gray_alpha) == 2);
    CHECK(koi::payload_size(koi::op_kind::rgb) == 3);
    CHECK(koi::payload_size(koi::op_kind::rgba) == 4);
}
