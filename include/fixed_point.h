// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

/**
 * @file fixed_point.h
 * @brief Signed 40.24 fixed-point numbers for camera scales and offsets
 *
 * Scales span from one sample per pixel to hundreds of thousands of samples
 * per pixel. Floating point would give a different relative precision at each
 * zoom level, and tile identity requires bit-exact, hashable values, so every
 * value that ends up in a tile key is a scaled 64-bit integer.
 *
 * Arithmetic saturates at the int64 bounds instead of wrapping.
 */

namespace turboplot {

class Fixed {
  public:
    static constexpr int kFracBits = 24;
    static constexpr int64_t kOne = int64_t{1} << kFracBits;

    constexpr Fixed() = default;

    static constexpr Fixed from_raw(int64_t raw) {
        Fixed f;
        f.raw_ = raw;
        return f;
    }

    static constexpr Fixed from_int(int64_t value) {
        return from_raw(saturate(static_cast<__int128>(value) * kOne));
    }

    /// Round to nearest, saturating. NaN maps to zero.
    static Fixed from_double(double value) {
        if (std::isnan(value)) {
            return Fixed{};
        }
        double scaled = std::round(value * static_cast<double>(kOne));
        if (scaled >= 9.2233720368547758e18) {
            return max_value();
        }
        if (scaled <= -9.2233720368547758e18) {
            return min_value();
        }
        return from_raw(static_cast<int64_t>(scaled));
    }

    static constexpr Fixed max_value() {
        return from_raw(std::numeric_limits<int64_t>::max());
    }

    static constexpr Fixed min_value() {
        return from_raw(std::numeric_limits<int64_t>::min());
    }

    /// Smallest positive value (one fixed-point unit)
    static constexpr Fixed epsilon() {
        return from_raw(1);
    }

    constexpr int64_t raw() const {
        return raw_;
    }

    double to_double() const {
        return static_cast<double>(raw_) / static_cast<double>(kOne);
    }

    float to_float() const {
        return static_cast<float>(to_double());
    }

    /// Largest integer <= value (arithmetic shift floors for negatives)
    constexpr int64_t floor_to_int() const {
        return raw_ >> kFracBits;
    }

    constexpr int64_t ceil_to_int() const {
        int64_t f = floor_to_int();
        return (raw_ & (kOne - 1)) != 0 ? f + 1 : f;
    }

    constexpr Fixed floor() const {
        return from_int(floor_to_int());
    }

    constexpr Fixed ceil() const {
        return from_int(ceil_to_int());
    }

    constexpr Fixed abs() const {
        return raw_ < 0 ? -*this : *this;
    }

    // ==============================================
    // Arithmetic
    // ==============================================

    constexpr Fixed operator-() const {
        return raw_ == std::numeric_limits<int64_t>::min() ? max_value() : from_raw(-raw_);
    }

    friend constexpr Fixed operator+(Fixed a, Fixed b) {
        return from_raw(saturate(static_cast<__int128>(a.raw_) + b.raw_));
    }

    friend constexpr Fixed operator-(Fixed a, Fixed b) {
        return from_raw(saturate(static_cast<__int128>(a.raw_) - b.raw_));
    }

    /// Product rounded toward negative infinity
    friend constexpr Fixed operator*(Fixed a, Fixed b) {
        __int128 p = static_cast<__int128>(a.raw_) * b.raw_;
        return from_raw(saturate(p >> kFracBits));
    }

    /// Quotient truncated toward zero. Divisor must not be zero.
    friend Fixed operator/(Fixed a, Fixed b);

    /// Product rounded to nearest, ties away from zero
    friend Fixed mul_nearest(Fixed a, Fixed b);

    /// Quotient rounded to nearest, ties away from zero. Divisor must not be zero.
    friend Fixed div_nearest(Fixed a, Fixed b);

    friend constexpr Fixed operator*(Fixed a, int64_t b) {
        return from_raw(saturate(static_cast<__int128>(a.raw_) * b));
    }

    friend constexpr Fixed operator*(int64_t a, Fixed b) {
        return b * a;
    }

    Fixed& operator+=(Fixed o) {
        return *this = *this + o;
    }

    Fixed& operator-=(Fixed o) {
        return *this = *this - o;
    }

    Fixed& operator*=(Fixed o) {
        return *this = *this * o;
    }

    Fixed& operator/=(Fixed o) {
        return *this = *this / o;
    }

    // ==============================================
    // Comparison
    // ==============================================

    friend constexpr bool operator==(Fixed a, Fixed b) {
        return a.raw_ == b.raw_;
    }
    friend constexpr bool operator!=(Fixed a, Fixed b) {
        return a.raw_ != b.raw_;
    }
    friend constexpr bool operator<(Fixed a, Fixed b) {
        return a.raw_ < b.raw_;
    }
    friend constexpr bool operator<=(Fixed a, Fixed b) {
        return a.raw_ <= b.raw_;
    }
    friend constexpr bool operator>(Fixed a, Fixed b) {
        return a.raw_ > b.raw_;
    }
    friend constexpr bool operator>=(Fixed a, Fixed b) {
        return a.raw_ >= b.raw_;
    }

    constexpr Fixed clamp(Fixed lo, Fixed hi) const {
        return *this < lo ? lo : (hi < *this ? hi : *this);
    }

  private:
    static constexpr int64_t saturate(__int128 v) {
        if (v > std::numeric_limits<int64_t>::max()) {
            return std::numeric_limits<int64_t>::max();
        }
        if (v < std::numeric_limits<int64_t>::min()) {
            return std::numeric_limits<int64_t>::min();
        }
        return static_cast<int64_t>(v);
    }

    int64_t raw_ = 0;
};

/**
 * @brief Pair of fixed-point values, one per axis
 */
struct FixedVec2 {
    Fixed x;
    Fixed y;

    bool operator==(const FixedVec2& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const FixedVec2& other) const {
        return !(*this == other);
    }
};

inline void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace turboplot

namespace std {

template <> struct hash<turboplot::Fixed> {
    size_t operator()(turboplot::Fixed f) const noexcept {
        return std::hash<int64_t>{}(f.raw());
    }
};

template <> struct hash<turboplot::FixedVec2> {
    size_t operator()(const turboplot::FixedVec2& v) const noexcept {
        size_t seed = std::hash<turboplot::Fixed>{}(v.x);
        turboplot::hash_combine(seed, std::hash<turboplot::Fixed>{}(v.y));
        return seed;
    }
};

} // namespace std
