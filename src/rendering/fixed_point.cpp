// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "fixed_point.h"

#include "turboplot_assert.h"

namespace turboplot {

namespace {

// n / d rounded to nearest, ties away from zero
__int128 round_quotient(__int128 n, __int128 d) {
    __int128 q = n / d;
    __int128 r = n % d;
    __int128 abs_r = r < 0 ? -r : r;
    __int128 abs_d = d < 0 ? -d : d;
    if (2 * abs_r >= abs_d) {
        q += ((n < 0) == (d < 0)) ? 1 : -1;
    }
    return q;
}

} // namespace

Fixed operator/(Fixed a, Fixed b) {
    TURBOPLOT_ASSERT(b.raw_ != 0, "fixed-point division by zero (dividend raw={})", a.raw_);
    __int128 n = static_cast<__int128>(a.raw_) * Fixed::kOne;
    return Fixed::from_raw(Fixed::saturate(n / b.raw_));
}

Fixed mul_nearest(Fixed a, Fixed b) {
    __int128 p = static_cast<__int128>(a.raw_) * b.raw_;
    return Fixed::from_raw(Fixed::saturate(round_quotient(p, Fixed::kOne)));
}

Fixed div_nearest(Fixed a, Fixed b) {
    TURBOPLOT_ASSERT(b.raw_ != 0, "fixed-point division by zero (dividend raw={})", a.raw_);
    __int128 n = static_cast<__int128>(a.raw_) * Fixed::kOne;
    return Fixed::from_raw(Fixed::saturate(round_quotient(n, b.raw_)));
}

} // namespace turboplot
