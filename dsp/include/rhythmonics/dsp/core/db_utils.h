// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - dB/Linear Conversion and Float Classification
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
//
// The NaN/Inf checks inspect the IEEE 754 bit pattern instead of calling
// std::isnan()/std::isinf(). Those calls are folded to `false` when a
// translation unit is compiled with -ffast-math, which would let a NaN ratio
// or speed slip through validation.
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>

namespace Rhythmonics {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for silence/zero gain in decibels (~24-bit dynamic range).
inline constexpr float kSilenceFloorDb = -144.0f;

/// Threshold below which values are flushed to zero (denormal prevention)
inline constexpr float kDenormalThreshold = 1e-15f;

namespace detail {

/// NaN: exponent all ones, mantissa non-zero.
[[nodiscard]] constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

[[nodiscard]] constexpr bool isNaN(double x) noexcept {
    const auto bits = std::bit_cast<std::uint64_t>(x);
    return ((bits & 0x7FF0000000000000ull) == 0x7FF0000000000000ull)
        && ((bits & 0x000FFFFFFFFFFFFFull) != 0);
}

/// Infinity: exponent all ones, mantissa zero.
[[nodiscard]] constexpr bool isInf(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7FFFFFFFu) == 0x7F800000u;
}

[[nodiscard]] constexpr bool isInf(double x) noexcept {
    const auto bits = std::bit_cast<std::uint64_t>(x);
    return (bits & 0x7FFFFFFFFFFFFFFFull) == 0x7FF0000000000000ull;
}

[[nodiscard]] constexpr bool isFinite(double x) noexcept {
    return !isNaN(x) && !isInf(x);
}

/// @return 0 if |x| < kDenormalThreshold, otherwise x
[[nodiscard]] inline float flushDenormal(float x) noexcept {
    return (std::abs(x) < kDenormalThreshold) ? 0.0f : x;
}

} // namespace detail

// ==============================================================================
// Functions
// ==============================================================================

/// Convert decibels to linear gain.
///
/// @param dB  Decibel value
/// @return    Linear gain multiplier (>= 0). NaN input returns 0.0f.
///
/// @example   dbToGain(0.0f)   -> 1.0f
/// @example   dbToGain(-6.02f) -> ~0.5f
[[nodiscard]] inline float dbToGain(float dB) noexcept {
    if (detail::isNaN(dB)) {
        return 0.0f;
    }
    return std::pow(10.0f, dB / 20.0f);
}

/// Convert linear gain to decibels.
///
/// @param gain  Linear gain value
/// @return      Decibel value, kSilenceFloorDb for zero/negative/NaN input
[[nodiscard]] inline float gainToDb(float gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0f) {
        return kSilenceFloorDb;
    }
    const float result = 20.0f * std::log10(gain);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

} // namespace DSP
} // namespace Rhythmonics
