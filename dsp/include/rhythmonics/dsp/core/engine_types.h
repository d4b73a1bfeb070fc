// ==============================================================================
// Layer 0: Core Utility - Engine Type Definitions
// ==============================================================================
// Identifiers, limits, status codes and event records shared by every layer
// of the harmony engine.
//
// All types are trivially copyable so they can live in fixed-size arrays and
// cross the simulation/audio thread boundary inside snapshots.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace Rhythmonics::DSP {

// =============================================================================
// Limits
// =============================================================================

/// Number of oscillator slots in an ensemble arena
inline constexpr size_t kMaxOscillators = 16;

/// Largest accepted oscillator ratio
inline constexpr std::uint32_t kMaxRatio = 64;

/// Smallest polygon an oscillator is drawn on
inline constexpr std::uint32_t kMinPolygonSides = 3;

/// Bounce events recorded per oscillator per tick. Crossings beyond this are
/// counted but not individually timed (the batch is marked saturated).
inline constexpr size_t kMaxBounceEventsPerTick = 64;

// =============================================================================
// Oscillator Identifier
// =============================================================================

/// Stable oscillator handle. Never reused within one ensemble lifetime.
using OscillatorId = std::uint32_t;

/// Sentinel returned when no oscillator could be created
inline constexpr OscillatorId kInvalidOscillatorId = 0;

// =============================================================================
// EngineError
// =============================================================================

/// Status codes for configuration calls and runtime diagnostics.
///
/// Configuration errors leave engine state untouched. BufferUnderrun is only
/// ever reported through the diagnostics counters.
enum class EngineError : uint8_t {
    None = 0,             ///< Success
    InvalidRatio,         ///< Ratio not a finite positive integer <= kMaxRatio
    InvalidSpeed,         ///< Speed not finite, <= 0 or above the configured ceiling
    UnknownOscillatorId,  ///< Id does not name a live oscillator
    CapacityExceeded,     ///< Ensemble arena is full
    InvalidConfig,        ///< EngineConfig::isValid() failed
    BufferUnderrun        ///< Audio requested before the engine was prepared
};

inline constexpr int kEngineErrorCount = 7;

/// Get a stable name for an error code (logs, UI messages)
[[nodiscard]] inline constexpr const char* errorToString(EngineError error) noexcept {
    constexpr const char* kNames[] = {
        "None",
        "InvalidRatio",
        "InvalidSpeed",
        "UnknownOscillatorId",
        "CapacityExceeded",
        "InvalidConfig",
        "BufferUnderrun"
    };
    const auto index = static_cast<size_t>(error);
    return (index < static_cast<size_t>(kEngineErrorCount)) ? kNames[index] : "Unknown";
}

// =============================================================================
// Regime
// =============================================================================

/// How an oscillator's current frequency is perceived
enum class Regime : uint8_t {
    Rhythm = 0,   ///< Below the low threshold: separate percussive hits
    Transition,   ///< Between thresholds: hits crossfading into a tone
    Harmonic      ///< Above the high threshold: continuous pitch
};

inline constexpr int kRegimeCount = 3;

[[nodiscard]] inline constexpr const char* getRegimeName(Regime regime) noexcept {
    constexpr const char* kNames[] = {
        "Rhythm",
        "Transition",
        "Harmonic"
    };
    const auto index = static_cast<size_t>(regime);
    return (index < static_cast<size_t>(kRegimeCount)) ? kNames[index] : "Unknown";
}

// =============================================================================
// BounceEvent
// =============================================================================

/// One vertex crossing of an oscillator's ball within a tick.
struct BounceEvent {
    OscillatorId oscillatorId = kInvalidOscillatorId;
    double timestampWithinTick = 0.0;  ///< Time since tick start, (0, dt]
    std::uint32_t vertex = 0;          ///< Vertex struck, [0, sides)
    bool accent = false;               ///< True when vertex == 0
};

} // namespace Rhythmonics::DSP
