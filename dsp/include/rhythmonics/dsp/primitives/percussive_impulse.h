// ==============================================================================
// Layer 1: DSP Primitive - Percussive Impulse
// ==============================================================================
// Fixed-shape percussive hit for the rhythm regime: a raised-cosine onset
// followed by an exponential decay, placed at a fractional sample position.
//
//   level
//     1 |    .-.
//       |   /   `.
//       |  /      `-._
//     0 |_/           `--.____
//         ^attack^  decay tau
//
// The onset is smooth (no step), so a hit adds no discontinuity of its own;
// the spectrum is still broad enough to be heard as a click. Hits overlap in
// a small fixed pool. When the pool is full the quietest hit is replaced,
// which at the rates that use this primitive is one whose tail has already
// decayed below audibility.
//
// Dependencies: Layer 0 math_constants.h, db_utils.h
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/db_utils.h>
#include <rhythmonics/dsp/core/math_constants.h>

#include <array>
#include <cmath>
#include <cstddef>

namespace Rhythmonics {
namespace DSP {

/// @brief Pool of overlapping fixed-shape percussive hits.
///
/// @par Real-Time Safety
/// prepare() computes coefficients; trigger() and process() never allocate.
class PercussiveImpulse {
public:
    /// Overlapping hits kept alive at once
    static constexpr size_t kMaxHits = 8;

    /// A hit is retired once it has decayed this many time constants
    /// (e^-12, about -104 dB)
    static constexpr float kTailTimeConstants = 12.0f;

    PercussiveImpulse() noexcept = default;

    /// @brief Configure the hit shape. Clears active hits.
    /// @param attackMs Raised-cosine onset duration (0 = instant)
    /// @param decayMs Exponential decay time constant (> 0)
    /// @param sampleRate Sample rate in Hz
    void prepare(float attackMs, float decayMs, double sampleRate) noexcept {
        const float sr = (sampleRate > 0.0) ? static_cast<float>(sampleRate) : 44100.0f;
        attackSamples_ = (attackMs > 0.0f) ? attackMs * 0.001f * sr : 0.0f;
        decaySamples_ = (decayMs > 0.0f) ? decayMs * 0.001f * sr : 1.0f;
        decayCoeff_ = std::exp(-1.0f / decaySamples_);
        lifetimeSamples_ = attackSamples_ + kTailTimeConstants * decaySamples_;
        reset();
    }

    /// @brief Drop every hit immediately.
    void reset() noexcept {
        for (auto& hit : hits_) {
            hit = Hit{};
        }
    }

    /// @brief Start a hit.
    /// @param offsetSamples Fractional sample position of the onset relative
    ///        to the next process() call. Values in [-1, 0) place the onset
    ///        between the previous sample and the next one.
    /// @param gain Peak level of the hit
    void trigger(float offsetSamples, float gain) noexcept {
        if (!(gain > 0.0f)) {
            return;
        }
        Hit* slot = nullptr;
        for (auto& hit : hits_) {
            if (!hit.active) {
                slot = &hit;
                break;
            }
            // Pending hits (not yet started) are never stolen
            if (hit.age >= 0.0f && (slot == nullptr || hit.level < slot->level)) {
                slot = &hit;
            }
        }
        if (slot == nullptr) {
            return;
        }
        slot->active = true;
        slot->decaying = false;
        slot->age = -((offsetSamples > -1.0f) ? offsetSamples : -1.0f);
        slot->gain = gain;
        slot->level = 0.0f;
    }

    /// @brief Render one sample of the summed active hits.
    [[nodiscard]] float process() noexcept {
        float sum = 0.0f;
        for (auto& hit : hits_) {
            if (!hit.active) {
                continue;
            }
            sum += hit.gain * advanceHit(hit);
        }
        return detail::flushDenormal(sum);
    }

    /// @brief True if any hit is still sounding or pending.
    [[nodiscard]] bool isActive() const noexcept {
        for (const auto& hit : hits_) {
            if (hit.active) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] size_t activeHitCount() const noexcept {
        size_t count = 0;
        for (const auto& hit : hits_) {
            count += hit.active ? 1 : 0;
        }
        return count;
    }

    [[nodiscard]] float getAttackSamples() const noexcept { return attackSamples_; }
    [[nodiscard]] float getDecaySamples() const noexcept { return decaySamples_; }

private:
    struct Hit {
        float age = 0.0f;    ///< Samples since onset (negative before onset)
        float gain = 0.0f;
        float level = 0.0f;  ///< Envelope value at the last rendered sample
        bool active = false;
        bool decaying = false;
    };

    /// @return Envelope (0..1) at the hit's current age, then ages it a sample
    float advanceHit(Hit& hit) noexcept {
        const float age = hit.age;
        hit.age += 1.0f;

        if (age < 0.0f) {
            hit.level = 0.0f;
            return 0.0f;
        }
        if (age < attackSamples_) {
            hit.level = 0.5f * (1.0f - std::cos(kPi * age / attackSamples_));
            return hit.level;
        }
        if (!hit.decaying) {
            hit.decaying = true;
            hit.level = std::exp(-(age - attackSamples_) / decaySamples_);
        } else {
            hit.level *= decayCoeff_;
        }
        if (age >= lifetimeSamples_) {
            hit.active = false;
            hit.level = 0.0f;
        }
        return hit.level;
    }

    std::array<Hit, kMaxHits> hits_{};
    float attackSamples_ = 44.1f;
    float decaySamples_ = 352.8f;
    float decayCoeff_ = 0.997169f;
    float lifetimeSamples_ = 44.1f + kTailTimeConstants * 352.8f;
};

} // namespace DSP
} // namespace Rhythmonics
