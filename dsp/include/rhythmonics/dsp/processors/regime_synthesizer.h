// ==============================================================================
// Layer 2: Processor - Regime Synthesizer
// ==============================================================================
// Audio voice for one oscillator. Turns bounce events and the oscillator's
// continuous phase into sound, moving between two renderings of the same
// periodic motion:
//
//   Rhythm      f <  low   every bounce fires a percussive hit
//   Transition  low..high  equal-power crossfade, blend linear in log(f)
//   Harmonic    f >  high  continuous tone read straight from the phase
//
// Each voice runs its own phase accumulator at the audio rate, seeded from
// the simulation snapshot, and detects its bounces with BounceDetector one
// sample at a time. The hit onsets are therefore sample accurate, and the
// tone phase and the hit times are the same accumulator, so the rhythm heard
// below the threshold and the pitch heard above it are one motion.
//
// Continuity: frequency and blend are interpolated per sample from their
// previous block values, the level fades in and out instead of switching,
// and a re-seeded phase is only applied while the voice is silent. A voice
// is never stepped in amplitude.
//
// Phase lock: a locked target carries the simulation's phase and how long
// ago it held. At each block the voice compares its own position with that
// phase carried forward at the target frequency, and trims its frequency by
// a bounded amount to close the gap. A gap too large to steer in time is
// closed by a quick fade out and a re-seed at the simulation's position.
// Differences between the display clock and the audio clock therefore only
// shift the sound transiently.
//
// Dependencies: Layer 0 crossfade_utils.h, engine_config.h, engine_types.h,
//               phase_utils.h
//               Layer 1 bounce_detector.h, percussive_impulse.h,
//               phase_tone.h, smoother.h
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/crossfade_utils.h>
#include <rhythmonics/dsp/core/engine_config.h>
#include <rhythmonics/dsp/core/engine_types.h>
#include <rhythmonics/dsp/core/phase_utils.h>
#include <rhythmonics/dsp/primitives/bounce_detector.h>
#include <rhythmonics/dsp/primitives/percussive_impulse.h>
#include <rhythmonics/dsp/primitives/phase_tone.h>
#include <rhythmonics/dsp/primitives/smoother.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Rhythmonics {
namespace DSP {

// =============================================================================
// Regime classification
// =============================================================================

/// @brief Regime and crossfade position for a frequency
struct RegimeState {
    Regime regime = Regime::Rhythm;
    float blend = 0.0f;  ///< 0 = all percussion, 1 = all tone
};

/// @brief Classify a frequency against the regime thresholds.
/// @param frequency Effective frequency in Hz
/// @param lowHz Upper edge of Rhythm
/// @param highHz Lower edge of Harmonic
[[nodiscard]] inline RegimeState classifyRegime(double frequency, double lowHz,
                                                double highHz) noexcept {
    RegimeState state;
    state.blend = logDomainBlend(frequency, lowHz, highHz);
    if (frequency < lowHz) {
        state.regime = Regime::Rhythm;
    } else if (frequency > highHz) {
        state.regime = Regime::Harmonic;
    } else {
        state.regime = Regime::Transition;
    }
    return state;
}

// =============================================================================
// VoiceTarget
// =============================================================================

/// @brief What the simulation wants a voice to do for the next block.
struct VoiceTarget {
    double effectiveFrequency = 0.0;  ///< Bounces per wall-clock second
    double phase = 0.0;               ///< Oscillator phase when committed
    std::uint32_t vertex = 0;         ///< Oscillator vertex when committed
    std::uint32_t sides = kMinPolygonSides;
    std::uint32_t epoch = 0;          ///< Changes whenever the phase is re-seeded
    OscillatorId id = kInvalidOscillatorId;
    bool present = false;             ///< Slot holds a live oscillator
    bool active = false;              ///< Oscillator is switched on
    bool phaseLocked = false;         ///< Keep following phase after the first seed
    double phaseAgeSeconds = 0.0;     ///< Seconds from when phase held to the block start
};

// =============================================================================
// RegimeSynthesizer
// =============================================================================

/// @brief Per-oscillator rhythm/tone voice.
///
/// @par Thread Safety
/// Audio thread only.
///
/// @par Real-Time Safety
/// process() does not allocate, lock or throw.
///
/// @code
/// RegimeSynthesizer voice;
/// voice.prepare(config, 48000.0);
/// VoiceTarget target{ .effectiveFrequency = 3.0, .present = true, .active = true };
/// voice.process(target, buffer, numSamples);
/// @endcode
class RegimeSynthesizer {
public:
    /// Fade used when a voice must fall silent quickly (removal, re-seed)
    static constexpr float kQuickFadeMs = 20.0f;

    /// Percussion gain below which no new hits are started
    static constexpr float kMinPercussionGain = 1e-4f;

    /// Frequency trim per second of timing error while phase locked
    static constexpr double kPhaseLockGain = 4.0;

    /// Largest relative frequency trim (about half a semitone)
    static constexpr double kMaxFrequencyTrim = 0.03;

    /// Timing error beyond which a locked voice re-seeds instead of steering
    static constexpr double kResyncErrorSeconds = 0.04;

    RegimeSynthesizer() noexcept = default;

    /// @brief Configure for a sample rate. Resets all voice state.
    void prepare(const EngineConfig& config, double sampleRate) noexcept {
        sampleRate_ = (sampleRate > 0.0) ? sampleRate : 44100.0;
        lowThreshold_ = config.lowThresholdHz;
        highThreshold_ = config.highThresholdHz;
        accentGain_ = config.accentGain;
        fadeInMs_ = config.voiceFadeMs;

        impulse_.prepare(config.impulseAttackMs, config.impulseDecayMs, sampleRate_);
        tone_.configure(config.toneWaveform, config.pulseWidthSamples, config.maxPulseDuty,
                        sampleRate_);
        level_.configure(fadeInMs_, static_cast<float>(sampleRate_));
        reset();
    }

    /// @brief Silence the voice now and forget its phase.
    /// The next present target re-seeds and fades in.
    void reset() noexcept {
        impulse_.reset();
        level_.snapTo(0.0f);
        frequency_.snapTo(0.0);
        blend_.snapTo(0.0);
        accumulator_.reset();
        synced_ = false;
        epoch_ = 0;
        percussionGain_ = 1.0f;
        toneGain_ = 0.0f;
        frequencyTrim_ = 0.0;
        bounceCount_ = 0;
    }

    /// @brief Render one block, overwriting output.
    /// @param target Latest simulation state for this voice's slot
    /// @param output Destination buffer
    /// @param numSamples Samples to render
    void process(const VoiceTarget& target, float* output, size_t numSamples) noexcept {
        if (output == nullptr || numSamples == 0) {
            return;
        }
        beginBlock(target, numSamples);

        const bool silentBlock = level_.isComplete() && level_.getCurrentValue() == 0.0f
            && !impulse_.isActive();
        if (silentBlock) {
            // Phase stops while silent; the next wake-up re-seeds it
            synced_ = false;
            for (size_t i = 0; i < numSamples; ++i) {
                output[i] = 0.0f;
            }
            return;
        }

        for (size_t i = 0; i < numSamples; ++i) {
            const double frequency = frequency_.next();
            const auto blend = static_cast<float>(blend_.next());
            const double increment = frequency / sampleRate_;
            equalPowerGains(blend, percussionGain_, toneGain_);

            if (accumulator_.fraction + increment >= 1.0) {
                triggerHits(increment);
            }
            bounceCount_ += accumulator_.advance(increment);

            const float percussion = impulse_.process();
            const float tone = (toneGain_ > 0.0f)
                ? tone_.render(accumulator_.fraction, increment)
                : 0.0f;
            const float level = level_.process();
            output[i] = level * (percussionGain_ * percussion + toneGain_ * tone);
        }
    }

    // =========================================================================
    // Queries (values at the end of the last block)
    // =========================================================================

    [[nodiscard]] RegimeState getRegimeState() const noexcept {
        return classifyRegime(frequency_.getCurrentValue(), lowThreshold_, highThreshold_);
    }

    [[nodiscard]] double getFrequency() const noexcept { return frequency_.getCurrentValue(); }
    [[nodiscard]] double getPhase() const noexcept { return accumulator_.fraction; }
    [[nodiscard]] float getPercussionGain() const noexcept { return percussionGain_; }
    [[nodiscard]] float getToneGain() const noexcept { return toneGain_; }
    [[nodiscard]] float getLevel() const noexcept { return level_.getCurrentValue(); }
    [[nodiscard]] std::uint64_t getBounceCount() const noexcept { return bounceCount_; }
    [[nodiscard]] bool isSynced() const noexcept { return synced_; }

    /// Relative frequency trim applied by the phase lock in the last block
    [[nodiscard]] double getFrequencyTrim() const noexcept { return frequencyTrim_; }

    /// @brief Signed timing error against a locked target, in seconds.
    /// Positive when the simulation is ahead of the voice. Positions are
    /// compared modulo the side count, so the error is at most half a lap.
    /// 0 while frozen.
    [[nodiscard]] double phaseErrorSeconds(const VoiceTarget& target) const noexcept {
        if (!(target.effectiveFrequency > 0.0)) {
            return 0.0;
        }
        const double sides = static_cast<double>(sides_);
        const double own = static_cast<double>(accumulator_.cycles % sides_) + accumulator_.fraction;
        double error = expectedPosition(target) - own;
        error -= sides * std::floor(error / sides + 0.5);
        return error / target.effectiveFrequency;
    }

    /// @brief True while the voice contributes to the mix.
    [[nodiscard]] bool isSounding() const noexcept {
        return level_.getCurrentValue() > 0.0f || level_.getTarget() > 0.0f;
    }

private:
    /// Position the simulation has reached by the start of this block, in
    /// [0, sides): vertex plus phase, carried forward by the phase age.
    [[nodiscard]] static double expectedPosition(const VoiceTarget& target) noexcept {
        const double sides = static_cast<double>(
            (target.sides == 0) ? kMinPolygonSides : target.sides);
        double position = static_cast<double>(target.vertex) + target.phase;
        const double carried = target.effectiveFrequency * target.phaseAgeSeconds;
        if (detail::isFinite(carried)) {
            position += carried;
        }
        position -= sides * std::floor(position / sides);
        return std::clamp(position, 0.0, std::nextafter(sides, 0.0));
    }

    void beginBlock(const VoiceTarget& target, size_t numSamples) noexcept {
        const bool wanted = target.present && target.active;
        bool stale = !synced_ || target.epoch != epoch_ || target.id != id_;

        if (wanted && stale && level_.getCurrentValue() == 0.0f) {
            // Silent: safe to jump the phase and the control values
            sides_ = (target.sides == 0) ? kMinPolygonSides : target.sides;
            const double position = expectedPosition(target);
            const double vertex = std::floor(position);
            accumulator_.seed(position - vertex);
            accumulator_.cycles = static_cast<std::uint64_t>(vertex);
            id_ = target.id;
            epoch_ = target.epoch;
            synced_ = true;
            stale = false;
            impulse_.reset();
            frequency_.snapTo(target.effectiveFrequency);
            blend_.snapTo(classifyRegime(target.effectiveFrequency, lowThreshold_,
                                         highThreshold_).blend);
        }

        frequencyTrim_ = 0.0;
        if (wanted && !stale && target.phaseLocked) {
            const double error = phaseErrorSeconds(target);
            if (std::abs(error) > kResyncErrorSeconds) {
                synced_ = false;
                stale = true;
            } else {
                frequencyTrim_ = std::clamp(error * kPhaseLockGain,
                                            -kMaxFrequencyTrim, kMaxFrequencyTrim);
            }
        }

        const auto sr = static_cast<float>(sampleRate_);
        if (wanted && !stale) {
            level_.configure(fadeInMs_, sr);
            level_.setTarget(1.0f);
            frequency_.beginBlock(target.effectiveFrequency * (1.0 + frequencyTrim_), numSamples);
            blend_.beginBlock(classifyRegime(target.effectiveFrequency, lowThreshold_,
                                             highThreshold_).blend, numSamples);
        } else {
            // Fading out (or waiting to re-seed): hold the last frequency
            level_.configure(kQuickFadeMs, sr);
            level_.setTarget(0.0f);
            frequency_.beginBlock(frequency_.getCurrentValue(), numSamples);
            blend_.beginBlock(blend_.getCurrentValue(), numSamples);
        }
    }

    void triggerHits(double increment) noexcept {
        if (percussionGain_ < kMinPercussionGain) {
            return;
        }
        // One sample of phase motion; timestamps come back in samples
        BounceDetector::detect(accumulator_, increment, 1.0, id_, sides_, scratch_);
        for (const BounceEvent& event : scratch_.view()) {
            const float gain = event.accent ? accentGain_ : 1.0f;
            impulse_.trigger(static_cast<float>(event.timestampWithinTick) - 1.0f, gain);
        }
    }

    PercussiveImpulse impulse_;
    PhaseTone tone_;
    LinearRamp level_;
    BlockInterpolator frequency_;
    BlockInterpolator blend_;
    CycleAccumulator accumulator_{};
    BounceBatch scratch_{};

    double sampleRate_ = 44100.0;
    double lowThreshold_ = 15.0;
    double highThreshold_ = 40.0;
    float accentGain_ = 1.0f;
    float fadeInMs_ = 300.0f;
    float percussionGain_ = 1.0f;
    float toneGain_ = 0.0f;
    double frequencyTrim_ = 0.0;
    std::uint64_t bounceCount_ = 0;
    OscillatorId id_ = kInvalidOscillatorId;
    std::uint32_t sides_ = kMinPolygonSides;
    std::uint32_t epoch_ = 0;
    bool synced_ = false;
};

} // namespace DSP
} // namespace Rhythmonics
