// ==============================================================================
// Layer 2: Processor - Audio Mixer
// ==============================================================================
// Sums the per-oscillator voices into the mono output bus.
//
// Signal flow:
//   voices -> Sum -> Gain compensation 1/sqrt(N) * Master headroom
//   -> NaN/Inf Flush -> DC Blocker -> Clamp [-1, 1] -> Output
//
// N is the sum of the voices' fade levels rather than a voice count, so a
// voice fading in or out moves the compensation continuously; with every
// voice fully on it is exactly the number of active voices. The compensation
// is additionally one-pole smoothed per sample.
//
// Clamping is the last resort and is reported, never treated as an error.
//
// Dependencies: Layer 0 db_utils.h, engine_config.h
//               Layer 1 dc_blocker.h
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/db_utils.h>
#include <rhythmonics/dsp/core/engine_config.h>
#include <rhythmonics/dsp/primitives/dc_blocker.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Rhythmonics {
namespace DSP {

/// @brief Mono voice summing bus with headroom management and clip reporting.
///
/// @par Usage
/// @code
/// mixer.beginBlock(numSamples);
/// for (each voice) mixer.addVoice(voiceBuffer, numSamples, voiceLevel);
/// size_t clipped = mixer.finalize(output, numSamples);
/// @endcode
///
/// @par Real-Time Safety
/// prepare() allocates the bus. Everything else is allocation-free.
class AudioMixer {
public:
    /// Time constant of the gain compensation smoothing
    static constexpr float kCompensationSmoothingMs = 5.0f;

    AudioMixer() noexcept = default;

    /// @brief Allocate the bus and configure the output stage.
    /// @param config Engine configuration (headroom, DC cutoff)
    /// @param sampleRate Sample rate in Hz
    /// @param maxBlockSize Largest block passed to beginBlock()
    void prepare(const EngineConfig& config, double sampleRate, size_t maxBlockSize) {
        bus_.assign(maxBlockSize, 0.0f);
        masterGain_ = dbToGain(config.headroomDb);
        dcCutoffHz_ = config.dcBlockerCutoffHz;
        setSampleRate(sampleRate);
    }

    /// @brief Retune the sample-rate dependent stages without touching the
    ///        bus allocation. Clears filter state and statistics.
    void setSampleRate(double sampleRate) noexcept {
        dcBlocker_.prepare(sampleRate, dcCutoffHz_);
        const float samples = kCompensationSmoothingMs * 0.001f * static_cast<float>(sampleRate);
        smoothingCoeff_ = (samples > 1.0f) ? (1.0f - std::exp(-1.0f / samples)) : 1.0f;
        reset();
    }

    /// @brief Clear filter state, bus and clip statistics.
    void reset() noexcept {
        std::fill(bus_.begin(), bus_.end(), 0.0f);
        dcBlocker_.reset();
        compensation_ = 1.0f;
        levelSum_ = 0.0f;
        blockSize_ = 0;
        lastClippedSamples_ = 0;
        totalClippedSamples_ = 0;
    }

    [[nodiscard]] size_t getMaxBlockSize() const noexcept { return bus_.size(); }

    /// @brief Start a block: zero the bus.
    /// @param numSamples Samples in the block, clamped to getMaxBlockSize()
    /// @return Samples that will actually be mixed
    size_t beginBlock(size_t numSamples) noexcept {
        blockSize_ = std::min(numSamples, bus_.size());
        std::fill(bus_.begin(), bus_.begin() + static_cast<std::ptrdiff_t>(blockSize_), 0.0f);
        levelSum_ = 0.0f;
        return blockSize_;
    }

    /// @brief Add one voice to the bus.
    /// @param voice Voice samples (level already applied)
    /// @param numSamples Must not exceed the size passed to beginBlock()
    /// @param level Voice fade level (0..1) for gain compensation
    void addVoice(const float* voice, size_t numSamples, float level) noexcept {
        if (voice == nullptr) {
            return;
        }
        const size_t n = std::min(numSamples, blockSize_);
        for (size_t i = 0; i < n; ++i) {
            bus_[i] += voice[i];
        }
        if (level > 0.0f) {
            levelSum_ += level;
        }
    }

    /// @brief Apply the output stage and write the block.
    /// @param output Destination buffer
    /// @param numSamples Samples to write (at most the size passed to beginBlock())
    /// @return Samples that had to be clamped
    size_t finalize(float* output, size_t numSamples) noexcept {
        if (output == nullptr) {
            return 0;
        }
        const size_t n = std::min(numSamples, blockSize_);
        const float target = 1.0f / std::sqrt(std::max(1.0f, levelSum_));

        size_t clipped = 0;
        for (size_t i = 0; i < n; ++i) {
            compensation_ += smoothingCoeff_ * (target - compensation_);
            float mixed = bus_[i] * compensation_ * masterGain_;
            // Keep non-finite input out of the filter state
            if (detail::isNaN(mixed) || detail::isInf(mixed)) {
                mixed = 0.0f;
            }
            float sample = dcBlocker_.process(mixed);
            if (sample > 1.0f || sample < -1.0f) {
                sample = std::clamp(sample, -1.0f, 1.0f);
                ++clipped;
            }
            output[i] = sample;
        }
        lastClippedSamples_ = clipped;
        totalClippedSamples_ += clipped;
        return clipped;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] float getMasterGain() const noexcept { return masterGain_; }
    [[nodiscard]] float getGainCompensation() const noexcept { return compensation_; }
    [[nodiscard]] float getLevelSum() const noexcept { return levelSum_; }
    [[nodiscard]] size_t getLastClippedSamples() const noexcept { return lastClippedSamples_; }
    [[nodiscard]] std::uint64_t getTotalClippedSamples() const noexcept {
        return totalClippedSamples_;
    }

private:
    std::vector<float> bus_;
    DCBlocker dcBlocker_;
    float masterGain_ = 1.0f;
    float dcCutoffHz_ = 10.0f;
    float compensation_ = 1.0f;
    float smoothingCoeff_ = 1.0f;
    float levelSum_ = 0.0f;
    size_t blockSize_ = 0;
    size_t lastClippedSamples_ = 0;
    std::uint64_t totalClippedSamples_ = 0;
};

} // namespace DSP
} // namespace Rhythmonics
