// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "fixed_point.h"
#include "tile_types.h"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using namespace turboplot;

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("Fixed: construction from integers and doubles", "[fixed][construction]") {
    REQUIRE(Fixed::from_int(3).raw() == 3 * Fixed::kOne);
    REQUIRE(Fixed::from_int(-2).raw() == -2 * Fixed::kOne);
    REQUIRE(Fixed::from_double(0.5).raw() == Fixed::kOne / 2);
    REQUIRE(Fixed::from_double(-0.25).raw() == -Fixed::kOne / 4);
    REQUIRE(Fixed().raw() == 0);

    SECTION("to_double is exact for dyadic values") {
        REQUIRE(Fixed::from_double(1234.375).to_double() == 1234.375);
    }

    SECTION("NaN maps to zero") {
        REQUIRE(Fixed::from_double(std::nan("")) == Fixed());
    }

    SECTION("out of range doubles saturate") {
        REQUIRE(Fixed::from_double(1e30) == Fixed::max_value());
        REQUIRE(Fixed::from_double(-1e30) == Fixed::min_value());
        REQUIRE(Fixed::from_int(std::numeric_limits<int64_t>::max()) == Fixed::max_value());
    }
}

// ============================================================================
// Rounding
// ============================================================================

TEST_CASE("Fixed: floor and ceil", "[fixed][rounding]") {
    REQUIRE(Fixed::from_double(2.25).floor_to_int() == 2);
    REQUIRE(Fixed::from_double(2.25).ceil_to_int() == 3);
    REQUIRE(Fixed::from_double(-1.5).floor_to_int() == -2);
    REQUIRE(Fixed::from_double(-1.5).ceil_to_int() == -1);
    REQUIRE(Fixed::from_int(7).floor_to_int() == 7);
    REQUIRE(Fixed::from_int(7).ceil_to_int() == 7);
    REQUIRE(Fixed::from_double(-0.75).floor() == Fixed::from_int(-1));
    REQUIRE(Fixed::from_double(-0.75).ceil() == Fixed());
}

TEST_CASE("Fixed: multiplication floors, division truncates", "[fixed][arithmetic]") {
    SECTION("products are exact when representable") {
        REQUIRE(Fixed::from_double(1.5) * Fixed::from_int(4) == Fixed::from_int(6));
        REQUIRE(Fixed::from_double(-0.5) * Fixed::from_double(0.5) == Fixed::from_double(-0.25));
    }

    SECTION("sub-unit products round toward negative infinity") {
        REQUIRE(Fixed::from_raw(1) * Fixed::from_raw(1) == Fixed());
        REQUIRE(Fixed::from_raw(-1) * Fixed::from_raw(1) == Fixed::from_raw(-1));
    }

    SECTION("quotients") {
        REQUIRE(Fixed::from_int(7) / Fixed::from_int(2) == Fixed::from_double(3.5));
        REQUIRE(Fixed::from_int(-7) / Fixed::from_int(2) == Fixed::from_double(-3.5));
        REQUIRE(Fixed::from_raw(-1) / Fixed::from_int(2) == Fixed());
        REQUIRE(Fixed::from_raw(1) / Fixed::from_int(2) == Fixed());
    }

    SECTION("integer multiplication") {
        REQUIRE(Fixed::from_double(0.25) * int64_t{8} == Fixed::from_int(2));
        REQUIRE(int64_t{-3} * Fixed::from_int(5) == Fixed::from_int(-15));
    }
}

TEST_CASE("Fixed: nearest-rounding product and quotient", "[fixed][arithmetic]") {
    SECTION("exact results are unchanged") {
        REQUIRE(mul_nearest(Fixed::from_double(1.5), Fixed::from_int(4)) == Fixed::from_int(6));
        REQUIRE(div_nearest(Fixed::from_int(7), Fixed::from_int(2)) == Fixed::from_double(3.5));
    }

    SECTION("products round half away from zero") {
        REQUIRE(mul_nearest(Fixed::from_raw(3), Fixed::from_double(0.5)) == Fixed::from_raw(2));
        REQUIRE(mul_nearest(Fixed::from_raw(-3), Fixed::from_double(0.5)) == Fixed::from_raw(-2));
        REQUIRE(mul_nearest(Fixed::from_raw(5), Fixed::from_double(0.25)) == Fixed::from_raw(1));
        REQUIRE(mul_nearest(Fixed::from_raw(1), Fixed::from_raw(1)) == Fixed());
    }

    SECTION("quotients round half away from zero") {
        REQUIRE(div_nearest(Fixed::from_raw(1), Fixed::from_int(2)) == Fixed::from_raw(1));
        REQUIRE(div_nearest(Fixed::from_raw(-1), Fixed::from_int(2)) == Fixed::from_raw(-1));
        REQUIRE(div_nearest(Fixed::from_raw(1), Fixed::from_int(3)) == Fixed());
        REQUIRE(div_nearest(Fixed::from_raw(2), Fixed::from_int(3)) == Fixed::from_raw(1));
        REQUIRE(div_nearest(Fixed::from_raw(2), Fixed::from_int(-3)) == Fixed::from_raw(-1));
    }
}

TEST_CASE("Fixed: saturation at the int64 bounds", "[fixed][arithmetic]") {
    REQUIRE(Fixed::max_value() + Fixed::epsilon() == Fixed::max_value());
    REQUIRE(Fixed::min_value() - Fixed::epsilon() == Fixed::min_value());
    REQUIRE(Fixed::max_value() * Fixed::from_int(2) == Fixed::max_value());
    REQUIRE(Fixed::max_value() * Fixed::from_int(-2) == Fixed::min_value());
    REQUIRE(-Fixed::min_value() == Fixed::max_value());
    REQUIRE(Fixed::from_int(1) / Fixed::epsilon() == Fixed::max_value());
}

TEST_CASE("Fixed: comparison and clamp", "[fixed]") {
    const Fixed lo = Fixed::from_int(1);
    const Fixed hi = Fixed::from_int(10);
    REQUIRE(lo < hi);
    REQUIRE(hi >= lo);
    REQUIRE(Fixed::from_int(0).clamp(lo, hi) == lo);
    REQUIRE(Fixed::from_int(50).clamp(lo, hi) == hi);
    REQUIRE(Fixed::from_int(5).clamp(lo, hi) == Fixed::from_int(5));
    REQUIRE(Fixed::from_int(-3).abs() == Fixed::from_int(3));
}

// ============================================================================
// Hashing
// ============================================================================

TEST_CASE("Fixed: equal tile identities hash equally", "[fixed][hash]") {
    TileProperties a;
    a.owner_id = 2;
    a.scale = {Fixed::from_double(12.5), Fixed::from_double(3.0)};
    a.offset = Fixed::from_double(-0.5);
    a.index = 17;
    a.size = TileSize(64, 480);

    TileProperties b = a;
    REQUIRE(a == b);
    REQUIRE(std::hash<TileProperties>{}(a) == std::hash<TileProperties>{}(b));

    b.offset += Fixed::epsilon();
    REQUIRE(a != b);
}
