// ==============================================================================
// Layer 1: DSP Primitive - Parameter Smoothers
// ==============================================================================
// Real-time safe parameter interpolation for click-free level and blend
// changes:
// - LinearRamp: constant-rate approach to a target (voice fades)
// - BlockInterpolator: sample-by-sample linear interpolation from the value
//   at the end of the previous block to the target of the current block
//   (per-block control values such as frequency and regime blend)
//
// Dependencies: Layer 0 db_utils.h (NaN/Inf guards, denormal flush)
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/db_utils.h>

#include <cstddef>

namespace Rhythmonics {
namespace DSP {

// =============================================================================
// LinearRamp
// =============================================================================

/// @brief Constant-rate ramp toward a target value.
///
/// The rate is configured as the time a full 0 -> 1 move takes; shorter moves
/// finish proportionally sooner.
///
/// Use for: voice fade in/out, gates.
class LinearRamp {
public:
    LinearRamp() noexcept = default;

    explicit LinearRamp(float initialValue) noexcept
        : current_(initialValue)
        , target_(initialValue) {}

    /// @brief Configure the ramp rate.
    /// @param fullScaleMs Time for a 0 -> 1 move in milliseconds (0 = instant)
    /// @param sampleRate Sample rate in Hz
    void configure(float fullScaleMs, float sampleRate) noexcept {
        const float samples = fullScaleMs * 0.001f * sampleRate;
        step_ = (samples > 1.0f) ? (1.0f / samples) : 1.0f;
    }

    /// @brief Set the value to ramp toward. NaN resets the ramp to 0.
    void setTarget(float target) noexcept {
        if (detail::isNaN(target)) {
            current_ = 0.0f;
            target_ = 0.0f;
            return;
        }
        if (detail::isInf(target)) {
            target = (target > 0.0f) ? 1e10f : -1e10f;
        }
        target_ = target;
    }

    [[nodiscard]] float getTarget() const noexcept { return target_; }
    [[nodiscard]] float getCurrentValue() const noexcept { return current_; }

    /// @brief Advance one sample and return the ramped value.
    [[nodiscard]] float process() noexcept {
        if (current_ < target_) {
            current_ += step_;
            if (current_ > target_) {
                current_ = target_;
            }
        } else if (current_ > target_) {
            current_ -= step_;
            if (current_ < target_) {
                current_ = target_;
            }
        }
        current_ = detail::flushDenormal(current_);
        return current_;
    }

    [[nodiscard]] bool isComplete() const noexcept { return current_ == target_; }

    /// @brief Jump to a value with no ramp.
    void snapTo(float value) noexcept {
        if (detail::isNaN(value)) {
            value = 0.0f;
        }
        current_ = value;
        target_ = value;
    }

private:
    float step_ = 1.0f;
    float current_ = 0.0f;
    float target_ = 0.0f;
};

// =============================================================================
// BlockInterpolator
// =============================================================================

/// @brief Linear interpolation of a control value across one audio block.
///
/// Control values arrive once per block (or once per simulation frame).
/// Jumping to them at the block boundary produces a step in anything they
/// scale; spreading the change across the block keeps the output continuous.
///
/// @code
/// interp.beginBlock(newTarget, numSamples);
/// for (size_t i = 0; i < numSamples; ++i) {
///     float v = interp.next();
/// }
/// @endcode
class BlockInterpolator {
public:
    /// @brief Start a block heading to target over numSamples samples.
    void beginBlock(double target, size_t numSamples) noexcept {
        if (!detail::isFinite(target)) {
            target = current_;
        }
        start_ = current_;
        target_ = target;
        numSamples_ = (numSamples == 0) ? 1 : numSamples;
        index_ = 0;
    }

    /// @brief Value for the next sample. Reaches the target on the last
    ///        sample of the block.
    [[nodiscard]] double next() noexcept {
        if (index_ < numSamples_) {
            ++index_;
        }
        const double t = static_cast<double>(index_) / static_cast<double>(numSamples_);
        current_ = start_ + (target_ - start_) * t;
        return current_;
    }

    [[nodiscard]] double getCurrentValue() const noexcept { return current_; }

    void snapTo(double value) noexcept {
        current_ = value;
        start_ = value;
        target_ = value;
        index_ = numSamples_;
    }

private:
    double current_ = 0.0;
    double start_ = 0.0;
    double target_ = 0.0;
    size_t numSamples_ = 1;
    size_t index_ = 1;
};

} // namespace DSP
} // namespace Rhythmonics
