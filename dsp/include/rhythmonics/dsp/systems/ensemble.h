// ==============================================================================
// Layer 3: System - Ensemble
// ==============================================================================
// The set of oscillators sharing one clock.
//
// Storage is a fixed arena of kMaxOscillators slots. An oscillator keeps its
// slot for its whole life (audio voices are bound to slots), while a
// separate order list holds the display order. Ids are handed out from a
// counter and never reused, so a stale id can never address a newer
// oscillator.
//
// Every oscillator is the ratio-th harmonic of one fundamental accumulator
// that runs alongside them. New and re-ratioed oscillators are seeded from
// it, so the ensemble stays phase aligned no matter when it was edited.
//
// Each seed bumps the slot's epoch; audio voices use it to know when to
// re-seed their own phase.
//
// Dependencies: Layer 0 engine_types.h, phase_utils.h
//               Layer 1 bounce_detector.h
//               Layer 2 oscillator.h
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/engine_types.h>
#include <rhythmonics/dsp/core/phase_utils.h>
#include <rhythmonics/dsp/primitives/bounce_detector.h>
#include <rhythmonics/dsp/processors/oscillator.h>

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Rhythmonics {
namespace DSP {

/// Ratios of the ensemble the application starts with (overtones 1..7)
inline constexpr std::uint32_t kDefaultEnsembleRatios[] = {1, 2, 3, 4, 5, 6, 7};

/// @brief Summary of one Ensemble::advance() call
struct EnsembleTick {
    std::uint64_t totalCrossings = 0;  ///< Bounces across all oscillators
    size_t saturatedOscillators = 0;   ///< Oscillators whose batch overflowed
};

/// @brief Fixed-capacity, id-addressed set of phase-locked oscillators.
///
/// @par Thread Safety
/// Single-threaded (simulation thread).
///
/// @par Real-Time Safety
/// No allocation anywhere; storage is inline.
class Ensemble {
public:
    Ensemble() noexcept = default;

    /// @brief Set the base frequency and empty the ensemble.
    void configure(double baseFrequencyHz) noexcept {
        baseFrequency_ = baseFrequencyHz;
        clear();
    }

    /// @brief Remove every oscillator and restart the fundamental at phase 0.
    /// Ids keep counting up.
    void clear() noexcept {
        for (auto& slot : slots_) {
            slot.used = false;
            slot.events.clear();
        }
        count_ = 0;
        fundamental_.reset();
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// @brief Check a requested ratio.
    /// @param ratio Requested ratio
    /// @param out Receives the integer ratio on success
    /// @return EngineError::InvalidRatio unless ratio is a finite integer
    ///         in [1, kMaxRatio]
    [[nodiscard]] static EngineError validateRatio(double ratio, std::uint32_t& out) noexcept {
        if (!detail::isFinite(ratio) || ratio < 1.0 || ratio > static_cast<double>(kMaxRatio)) {
            return EngineError::InvalidRatio;
        }
        if (std::floor(ratio) != ratio) {
            return EngineError::InvalidRatio;
        }
        out = static_cast<std::uint32_t>(ratio);
        return EngineError::None;
    }

    /// @brief Append an oscillator.
    /// @param ratio Frequency ratio (positive integer <= kMaxRatio)
    /// @param outId Receives the new id on success (may be null)
    /// @return InvalidRatio, CapacityExceeded, or None
    [[nodiscard]] EngineError addOscillator(double ratio, OscillatorId* outId = nullptr) noexcept {
        std::uint32_t validRatio = 0;
        if (const EngineError error = validateRatio(ratio, validRatio); error != EngineError::None) {
            return error;
        }
        if (count_ >= kMaxOscillators) {
            return EngineError::CapacityExceeded;
        }

        size_t slotIndex = 0;
        while (slots_[slotIndex].used) {
            ++slotIndex;
        }

        Slot& slot = slots_[slotIndex];
        const OscillatorId id = nextId_++;
        slot.oscillator.configure(id, validRatio, baseFrequency_,
                                  harmonicOf(fundamental_, validRatio));
        slot.events.clear();
        slot.epoch = nextEpoch_++;
        slot.used = true;
        order_[count_] = static_cast<std::uint8_t>(slotIndex);
        ++count_;

        if (outId != nullptr) {
            *outId = id;
        }
        return EngineError::None;
    }

    /// @brief Remove an oscillator. Later oscillators move up one place in
    ///        display order; their slots and ids are unchanged.
    [[nodiscard]] EngineError removeOscillator(OscillatorId id) noexcept {
        const int position = positionOf(id);
        if (position < 0) {
            return EngineError::UnknownOscillatorId;
        }
        Slot& slot = slots_[order_[static_cast<size_t>(position)]];
        slot.used = false;
        slot.events.clear();

        for (size_t i = static_cast<size_t>(position); i + 1 < count_; ++i) {
            order_[i] = order_[i + 1];
        }
        --count_;
        return EngineError::None;
    }

    /// @brief Change an oscillator's ratio and re-seed it from the fundamental.
    /// On error the previous ratio stays in effect.
    [[nodiscard]] EngineError setRatio(OscillatorId id, double ratio) noexcept {
        Slot* slot = findSlot(id);
        if (slot == nullptr) {
            return EngineError::UnknownOscillatorId;
        }
        std::uint32_t validRatio = 0;
        if (const EngineError error = validateRatio(ratio, validRatio); error != EngineError::None) {
            return error;
        }
        if (validRatio == slot->oscillator.getRatio()) {
            return EngineError::None;
        }
        slot->oscillator.setRatio(validRatio, harmonicOf(fundamental_, validRatio));
        slot->epoch = nextEpoch_++;
        return EngineError::None;
    }

    /// @brief Switch an oscillator on or off. It keeps advancing either way.
    [[nodiscard]] EngineError setActive(OscillatorId id, bool active) noexcept {
        Slot* slot = findSlot(id);
        if (slot == nullptr) {
            return EngineError::UnknownOscillatorId;
        }
        slot->oscillator.setActive(active);
        return EngineError::None;
    }

    /// @brief Restart the fundamental at phase 0 and re-seed every
    ///        oscillator from it. Ratios, ids and order are kept.
    void restartPhases() noexcept {
        fundamental_.reset();
        for (size_t i = 0; i < count_; ++i) {
            Slot& slot = slots_[order_[i]];
            const std::uint32_t ratio = slot.oscillator.getRatio();
            slot.oscillator.setRatio(ratio, harmonicOf(fundamental_, ratio));
            slot.events.clear();
            slot.epoch = nextEpoch_++;
        }
    }

    /// @brief Replace the contents with the default overtone ensemble.
    [[nodiscard]] EngineError addDefaultOscillators() noexcept {
        clear();
        for (const std::uint32_t ratio : kDefaultEnsembleRatios) {
            if (const EngineError error = addOscillator(static_cast<double>(ratio));
                error != EngineError::None) {
                return error;
            }
        }
        return EngineError::None;
    }

    // =========================================================================
    // Simulation
    // =========================================================================

    /// @brief Advance every oscillator by a slice of simulation time.
    ///
    /// Bounce events for the tick replace the previous tick's events; read
    /// them with eventsAt() or eventsFor().
    ///
    /// @param dtSimulation Simulation seconds (>= 0)
    EnsembleTick advance(double dtSimulation) noexcept {
        EnsembleTick tick;
        if (!detail::isFinite(dtSimulation) || dtSimulation < 0.0) {
            dtSimulation = 0.0;
        }
        fundamental_.advance(baseFrequency_ * dtSimulation);

        for (size_t i = 0; i < count_; ++i) {
            Slot& slot = slots_[order_[i]];
            const Oscillator::Advance result = slot.oscillator.advance(dtSimulation, slot.events);
            tick.totalCrossings += result.crossings;
            if (slot.events.saturated) {
                ++tick.saturatedOscillators;
            }
        }
        return tick;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] size_t count() const noexcept { return count_; }
    [[nodiscard]] static constexpr size_t capacity() noexcept { return kMaxOscillators; }
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }
    [[nodiscard]] bool full() const noexcept { return count_ >= kMaxOscillators; }

    [[nodiscard]] size_t activeCount() const noexcept {
        size_t active = 0;
        for (size_t i = 0; i < count_; ++i) {
            active += slots_[order_[i]].oscillator.isActive() ? 1 : 0;
        }
        return active;
    }

    [[nodiscard]] double getBaseFrequency() const noexcept { return baseFrequency_; }
    [[nodiscard]] const CycleAccumulator& getFundamental() const noexcept { return fundamental_; }

    /// @brief Oscillator at a display position (position < count()).
    [[nodiscard]] const Oscillator& oscillatorAt(size_t position) const noexcept {
        return slots_[order_[position]].oscillator;
    }

    /// @brief Arena slot of the oscillator at a display position.
    [[nodiscard]] size_t slotAt(size_t position) const noexcept { return order_[position]; }

    /// @brief Seed epoch of the oscillator at a display position.
    [[nodiscard]] std::uint32_t epochAt(size_t position) const noexcept {
        return slots_[order_[position]].epoch;
    }

    /// @brief Last tick's events of the oscillator at a display position.
    [[nodiscard]] const BounceBatch& eventsAt(size_t position) const noexcept {
        return slots_[order_[position]].events;
    }

    /// @return Display position of id, or -1 if unknown
    [[nodiscard]] int positionOf(OscillatorId id) const noexcept {
        if (id == kInvalidOscillatorId) {
            return -1;
        }
        for (size_t i = 0; i < count_; ++i) {
            if (slots_[order_[i]].oscillator.getId() == id) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    /// @return Oscillator with the id, or nullptr
    [[nodiscard]] const Oscillator* find(OscillatorId id) const noexcept {
        const int position = positionOf(id);
        return (position < 0) ? nullptr : &oscillatorAt(static_cast<size_t>(position));
    }

    /// @return Last tick's events for the id, or nullptr
    [[nodiscard]] const BounceBatch* eventsFor(OscillatorId id) const noexcept {
        const int position = positionOf(id);
        return (position < 0) ? nullptr : &eventsAt(static_cast<size_t>(position));
    }

private:
    struct Slot {
        Oscillator oscillator;
        BounceBatch events;
        std::uint32_t epoch = 0;
        bool used = false;
    };

    Slot* findSlot(OscillatorId id) noexcept {
        const int position = positionOf(id);
        return (position < 0) ? nullptr : &slots_[order_[static_cast<size_t>(position)]];
    }

    std::array<Slot, kMaxOscillators> slots_{};
    std::array<std::uint8_t, kMaxOscillators> order_{};
    CycleAccumulator fundamental_{};
    double baseFrequency_ = 1.0;
    size_t count_ = 0;
    OscillatorId nextId_ = 1;
    std::uint32_t nextEpoch_ = 1;
};

} // namespace DSP
} // namespace Rhythmonics
