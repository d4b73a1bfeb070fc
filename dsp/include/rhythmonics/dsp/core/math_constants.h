// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for the engine. Every component imports
// these instead of defining its own copy.
//
// Constants are inline constexpr so there is exactly one definition across
// all translation units.
// ==============================================================================

#pragma once

namespace Rhythmonics {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi in float precision
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr float kTwoPi = 2.0f * kPi;

/// Half Pi (quarter circle in radians)
/// Used by the equal-power crossfade law
inline constexpr float kHalfPi = kPi / 2.0f;

/// Pi in double precision, for phase-domain math that must not lose
/// resolution over long runs
inline constexpr double kPiD = 3.14159265358979323846;

/// Two times Pi in double precision
inline constexpr double kTwoPiD = 2.0 * kPiD;

} // namespace DSP
} // namespace Rhythmonics
