#include <catch2/catch.hpp>
#include "fr_search/domain_splitter.hpp"
#include <stdexcept>

using namespace fr_search;

namespace {

BigInt total_of(const std::vector<PolyDomain>& parts) {
    BigInt total = 0;
    for (const auto& p : parts) {
        total += p.total_size();
    }
    return total;
}

}  // namespace

// ============================================================================
// split_range
// ============================================================================

TEST_CASE("split_range gives the first chunks one extra value", "[split]") {
    SECTION("uneven") {
        auto chunks = split_range(CoefRange{0, 9}, 3);
        REQUIRE(chunks == std::vector<CoefRange>{{0, 3}, {4, 6}, {7, 9}});
    }

    SECTION("even") {
        auto chunks = split_range(CoefRange{-2, 1}, 2);
        REQUIRE(chunks == std::vector<CoefRange>{{-2, -1}, {0, 1}});
    }

    SECTION("one part per value") {
        auto chunks = split_range(CoefRange{5, 7}, 3);
        REQUIRE(chunks == std::vector<CoefRange>{{5, 5}, {6, 6}, {7, 7}});
    }

    SECTION("invalid part counts") {
        REQUIRE_THROWS_AS(split_range(CoefRange{0, 2}, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(split_range(CoefRange{0, 2}, 4), std::invalid_argument);
    }
}

// ============================================================================
// split_domain
// ============================================================================

TEST_CASE("collect_axis_metadata lists a axes before b axes", "[split]") {
    PolyDomain d(1, CoefRange{-3, 3}, 0, CoefRange{-5, 5});
    auto axes = collect_axis_metadata(d);
    REQUIRE(axes.size() == 3);
    REQUIRE(axes[0].series == SeriesId::A);
    REQUIRE(axes[0].index == 0);
    REQUIRE(axes[0].size == 7);
    REQUIRE(axes[1].series == SeriesId::A);
    REQUIRE(axes[1].range == CoefRange{1, 3});
    REQUIRE(axes[1].size == 3);
    REQUIRE(axes[2].series == SeriesId::B);
    REQUIRE(axes[2].size == 11);
}

TEST_CASE("split_domain cuts the biggest axis", "[split]") {
    PolyDomain d(1, CoefRange{-3, 3}, 0, CoefRange{-5, 5});

    SECTION("four parts") {
        auto parts = split_domain(d, 4);
        REQUIRE(parts.size() == 4);
        REQUIRE(parts[0].axis_ranges(SeriesId::B)[0] == CoefRange{-5, -3});
        REQUIRE(parts[1].axis_ranges(SeriesId::B)[0] == CoefRange{-2, 0});
        REQUIRE(parts[2].axis_ranges(SeriesId::B)[0] == CoefRange{1, 3});
        REQUIRE(parts[3].axis_ranges(SeriesId::B)[0] == CoefRange{4, 5});
        for (const auto& p : parts) {
            REQUIRE(p.axis_ranges(SeriesId::A) == d.axis_ranges(SeriesId::A));
        }
        REQUIRE(total_of(parts) == d.total_size());
        REQUIRE(parts[3].total_size() == 42);
    }

    SECTION("one part") {
        auto parts = split_domain(d, 1);
        REQUIRE(parts.size() == 1);
        REQUIRE(parts[0] == d);
    }

    SECTION("more parts than the biggest axis") {
        auto parts = split_domain(d, 20);
        REQUIRE(parts.size() == 20);
        REQUIRE(total_of(parts) == d.total_size());

        // b を 1 点ずつに切った後、先頭 9 個は a の最初の軸でさらに 2 分割
        REQUIRE(parts[0].axis_ranges(SeriesId::B)[0] == CoefRange{-5, -5});
        REQUIRE(parts[0].axis_ranges(SeriesId::A)[0] == CoefRange{-3, 0});
        REQUIRE(parts[1].axis_ranges(SeriesId::B)[0] == CoefRange{-5, -5});
        REQUIRE(parts[1].axis_ranges(SeriesId::A)[0] == CoefRange{1, 3});
        REQUIRE(parts[19].axis_ranges(SeriesId::B)[0] == CoefRange{5, 5});
        REQUIRE(parts[19].axis_ranges(SeriesId::A)[0] == CoefRange{-3, 3});
    }

    SECTION("checkpoint prefix is carried to every part") {
        PolyDomain prefixed(1, CoefRange{-3, 3}, 0, CoefRange{-5, 5}, true, "w_");
        for (const auto& p : split_domain(prefixed, 3)) {
            REQUIRE(p.checkpoint_prefix() == "w_");
        }
    }

    SECTION("zero parts") {
        REQUIRE_THROWS_AS(split_domain(d, 0), std::invalid_argument);
    }
}

TEST_CASE("split_domain ties and tiny domains", "[split]") {
    SECTION("ties go to the first axis") {
        PolyDomain d({CoefRange{0, 3}}, {CoefRange{0, 3}});
        auto parts = split_domain(d, 2);
        REQUIRE(parts.size() == 2);
        REQUIRE(parts[0].axis_ranges(SeriesId::A)[0] == CoefRange{0, 1});
        REQUIRE(parts[1].axis_ranges(SeriesId::A)[0] == CoefRange{2, 3});
        REQUIRE(parts[0].axis_ranges(SeriesId::B)[0] == CoefRange{0, 3});
    }

    SECTION("single point domain cannot be split further") {
        PolyDomain d({CoefRange{1, 1}}, {CoefRange{2, 2}});
        auto parts = split_domain(d, 4);
        REQUIRE(parts.size() == 1);
        REQUIRE(parts[0] == d);
    }

    SECTION("domain smaller than the worker count") {
        PolyDomain d({CoefRange{1, 2}}, {CoefRange{0, 0}});
        auto parts = split_domain(d, 5);
        REQUIRE(parts.size() == 2);
        REQUIRE(total_of(parts) == 2);
    }
}
