// ==============================================================================
// Layer 3: System - Harmony Engine
// ==============================================================================

#include <rhythmonics/dsp/systems/harmony_engine.h>

#include <algorithm>
#include <cmath>

#ifndef RHYTHMONICS_ENGINE_DEBUG
#define RHYTHMONICS_ENGINE_DEBUG 0
#endif
#if RHYTHMONICS_ENGINE_DEBUG
#include <cstdarg>
#include <cstdio>
static inline void logEngine(const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    fprintf(stderr, "%s", buf);
}
#endif

namespace Rhythmonics {
namespace DSP {

// =============================================================================
// Lifecycle
// =============================================================================

EngineError HarmonyEngine::prepare(const EngineConfig& config) {
    if (!config.isValid()) {
        return record(EngineError::InvalidConfig, "prepare");
    }

    audioReady_.store(false, std::memory_order_release);

    config_ = config;
    clock_.configure(config_.maxFrameDeltaSeconds,
                     config_.maxFundamentalHz / config_.baseFrequencyHz);
    clock_.reset();
    clock_.setFrozen(false);
    (void)clock_.setSpeed(config_.initialSpeed);
    ensemble_.configure(config_.baseFrequencyHz);

    voiceBuffer_.assign(kMaxBlockSize, 0.0f);
    mixer_.prepare(config_, 48000.0, kMaxBlockSize);
    for (auto& target : targets_) {
        target = VoiceTarget{};
    }
    audioSampleRate_ = 0.0;
    audioSamples_ = 0;
    snapshotWall_ = 0.0;
    clockOffset_ = 0.0;
    clockLocked_ = false;
    audioSilenced_ = true;

    prepared_ = true;
    running_.store(true, std::memory_order_release);

    sequence_ = 0;
    commitSnapshot();
    exchange_.reset(published_);

    audioReady_.store(true, std::memory_order_release);

#if RHYTHMONICS_ENGINE_DEBUG
    logEngine("[RHYTHMONICS][ENGINE] prepare base=%.3fHz speed=%.3f thresholds=%.1f/%.1fHz\n",
              config_.baseFrequencyHz, config_.initialSpeed,
              config_.lowThresholdHz, config_.highThresholdHz);
#endif
    return EngineError::None;
}

void HarmonyEngine::reset() noexcept {
    if (!prepared_) {
        return;
    }
    clock_.reset();
    ensemble_.restartPhases();
    commitSnapshot();
}

void HarmonyEngine::start() noexcept {
    if (!prepared_) {
        return;
    }
    running_.store(true, std::memory_order_release);
    commitSnapshot();
}

void HarmonyEngine::stop() noexcept {
    running_.store(false, std::memory_order_release);
    if (prepared_) {
        commitSnapshot();
    }
}

// =============================================================================
// Simulation
// =============================================================================

void HarmonyEngine::onFrameTick(double dtWallClockSeconds) noexcept {
    if (!prepared_ || !running_.load(std::memory_order_acquire)) {
        return;
    }
    const double dtSimulation = clock_.tick(dtWallClockSeconds);
    const EnsembleTick tick = ensemble_.advance(dtSimulation);
    if (tick.saturatedOscillators > 0) {
        saturatedTicks_.fetch_add(1, std::memory_order_relaxed);
    }
    commitSnapshot();
}

void HarmonyEngine::commitSnapshot() noexcept {
    EnsembleSnapshot& snapshot = published_;
    const bool frozen = clock_.isFrozen();
    const double speed = clock_.getSpeed();
    const double motion = frozen ? 0.0 : speed;

    snapshot.count = ensemble_.count();
    for (size_t i = 0; i < snapshot.count; ++i) {
        const Oscillator& oscillator = ensemble_.oscillatorAt(i);
        OscillatorSnapshot& view = snapshot.oscillators[i];
        view.id = oscillator.getId();
        view.slot = static_cast<std::uint32_t>(ensemble_.slotAt(i));
        view.ratio = oscillator.getRatio();
        view.sides = oscillator.getSides();
        view.vertex = oscillator.getVertex();
        view.epoch = ensemble_.epochAt(i);
        view.bounceCount = oscillator.getBounceCount();
        view.phase = oscillator.getPhase();
        view.effectiveFrequency = oscillator.getEffectiveFrequency(motion);
        const RegimeState state = classifyRegime(view.effectiveFrequency,
                                                 config_.lowThresholdHz,
                                                 config_.highThresholdHz);
        view.regime = state.regime;
        view.blendFactor = state.blend;
        view.active = oscillator.isActive();
    }

    snapshot.speed = speed;
    snapshot.fundamentalHz = ensemble_.getBaseFrequency() * motion;
    snapshot.bpm = fundamentalHzToBpm(snapshot.fundamentalHz);
    snapshot.simulationSeconds = clock_.getElapsedSimulationSeconds();
    snapshot.wallSeconds = clock_.getElapsedWallSeconds();
    snapshot.sequence = ++sequence_;
    snapshot.frozen = frozen;
    snapshot.running = running_.load(std::memory_order_acquire);

    exchange_.publish(snapshot);
}

// =============================================================================
// Configuration
// =============================================================================

EngineError HarmonyEngine::record(EngineError error, const char* operation) noexcept {
    if (error != EngineError::None) {
        rejectedConfigCalls_.fetch_add(1, std::memory_order_relaxed);
#if RHYTHMONICS_ENGINE_DEBUG
        logEngine("[RHYTHMONICS][ENGINE] %s rejected: %s\n", operation, errorToString(error));
#else
        (void)operation;
#endif
    }
    return error;
}

EngineError HarmonyEngine::setSpeed(double speed) noexcept {
    const EngineError error = clock_.setSpeed(speed);
    if (error == EngineError::None && prepared_) {
        commitSnapshot();
    }
    return record(error, "setSpeed");
}

EngineError HarmonyEngine::setSliderPosition(double position) noexcept {
    if (detail::isNaN(position)) {
        return record(EngineError::InvalidSpeed, "setSliderPosition");
    }
    const double hz = sliderToFundamentalHz(position);
    if (hz <= 0.0) {
        setFrozen(true);
        return EngineError::None;
    }
    const EngineError error = clock_.setSpeed(hz / config_.baseFrequencyHz);
    if (error != EngineError::None) {
        return record(error, "setSliderPosition");
    }
    setFrozen(false);
    return EngineError::None;
}

void HarmonyEngine::setFrozen(bool frozen) noexcept {
    clock_.setFrozen(frozen);
    if (prepared_) {
        commitSnapshot();
    }
}

EngineError HarmonyEngine::addOscillator(double ratio, OscillatorId* outId) noexcept {
    const EngineError error = ensemble_.addOscillator(ratio, outId);
    if (error == EngineError::None && prepared_) {
        commitSnapshot();
    }
    return record(error, "addOscillator");
}

EngineError HarmonyEngine::removeOscillator(OscillatorId id) noexcept {
    const EngineError error = ensemble_.removeOscillator(id);
    if (error == EngineError::None && prepared_) {
        commitSnapshot();
    }
    return record(error, "removeOscillator");
}

EngineError HarmonyEngine::setRatio(OscillatorId id, double ratio) noexcept {
    const EngineError error = ensemble_.setRatio(id, ratio);
    if (error == EngineError::None && prepared_) {
        commitSnapshot();
    }
    return record(error, "setRatio");
}

EngineError HarmonyEngine::setActive(OscillatorId id, bool active) noexcept {
    const EngineError error = ensemble_.setActive(id, active);
    if (error == EngineError::None && prepared_) {
        commitSnapshot();
    }
    return record(error, "setActive");
}

EngineError HarmonyEngine::addDefaultOscillators() noexcept {
    const EngineError error = ensemble_.addDefaultOscillators();
    if (prepared_) {
        commitSnapshot();
    }
    return record(error, "addDefaultOscillators");
}

void HarmonyEngine::clearOscillators() noexcept {
    ensemble_.clear();
    if (prepared_) {
        commitSnapshot();
    }
}

// =============================================================================
// Audio
// =============================================================================

void HarmonyEngine::configureAudio(double sampleRate) noexcept {
    for (auto& voice : voices_) {
        voice.prepare(config_, sampleRate);
    }
    mixer_.setSampleRate(sampleRate);
    audioSampleRate_ = sampleRate;
    audioSamples_ = 0;
    clockLocked_ = false;
}

void HarmonyEngine::trackClock(double wallSeconds, double audioSeconds) noexcept {
    // Only snapshots that consumed frame time say anything about the offset;
    // going backwards means the simulation clock was reset
    const double observed = audioSeconds - wallSeconds;
    if (!clockLocked_ || wallSeconds < snapshotWall_) {
        clockOffset_ = observed;
        clockLocked_ = true;
    } else if (wallSeconds > snapshotWall_) {
        const double jump = observed - clockOffset_;
        if (std::abs(jump) > kClockResyncSeconds) {
            clockOffset_ = observed;
        } else {
            clockOffset_ += kClockSmoothing * jump;
        }
    }
    snapshotWall_ = wallSeconds;
}

void HarmonyEngine::fillAudioBuffer(float* buffer, size_t numSamples, double sampleRate) noexcept {
    if (buffer == nullptr || numSamples == 0) {
        return;
    }
    if (!audioReady_.load(std::memory_order_acquire)
        || !detail::isFinite(sampleRate) || sampleRate <= 0.0) {
        std::fill(buffer, buffer + numSamples, 0.0f);
        bufferUnderruns_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    if (!running_.load(std::memory_order_acquire)) {
        std::fill(buffer, buffer + numSamples, 0.0f);
        if (!audioSilenced_) {
            for (auto& voice : voices_) {
                voice.reset();
            }
            mixer_.reset();
            audioSamples_ = 0;
            clockLocked_ = false;
            audioSilenced_ = true;
        }
        return;
    }
    audioSilenced_ = false;

    if (sampleRate != audioSampleRate_) {
        configureAudio(sampleRate);
    }

    // Slots absent from the snapshot keep present = false and fade out
    if (exchange_.acquire()) {
        const EnsembleSnapshot& snapshot = exchange_.readSlot();
        trackClock(snapshot.wallSeconds, static_cast<double>(audioSamples_) / audioSampleRate_);
        for (auto& target : targets_) {
            target.present = false;
        }
        for (size_t i = 0; i < snapshot.count; ++i) {
            const OscillatorSnapshot& view = snapshot.oscillators[i];
            if (view.slot >= kMaxOscillators) {
                continue;
            }
            VoiceTarget& target = targets_[view.slot];
            target.effectiveFrequency = view.effectiveFrequency;
            target.phase = view.phase;
            target.vertex = view.vertex;
            target.sides = view.sides;
            target.epoch = view.epoch;
            target.id = view.id;
            target.present = true;
            target.active = view.active;
            target.phaseLocked = true;
        }
    }
    if (!clockLocked_) {
        trackClock(snapshotWall_, static_cast<double>(audioSamples_) / audioSampleRate_);
    }

    bool clippedAny = false;
    size_t offset = 0;
    while (offset < numSamples) {
        const size_t chunk = mixer_.beginBlock(std::min(numSamples - offset, kMaxBlockSize));
        // Age of the snapshot phase at this chunk, on the audio clock
        const double phaseAge = static_cast<double>(audioSamples_) / audioSampleRate_
            - clockOffset_ - snapshotWall_;
        for (size_t v = 0; v < kMaxOscillators; ++v) {
            RegimeSynthesizer& voice = voices_[v];
            if (!targets_[v].present && !voice.isSounding()) {
                continue;
            }
            targets_[v].phaseAgeSeconds = phaseAge;
            voice.process(targets_[v], voiceBuffer_.data(), chunk);
            mixer_.addVoice(voiceBuffer_.data(), chunk, voice.getLevel());
        }
        const size_t clipped = mixer_.finalize(buffer + offset, chunk);
        if (clipped > 0) {
            clippedSamples_.fetch_add(clipped, std::memory_order_relaxed);
            clippedAny = true;
        }
        offset += chunk;
        audioSamples_ += chunk;
    }
    if (clippedAny) {
        clippedBuffers_.fetch_add(1, std::memory_order_relaxed);
    }
}

// =============================================================================
// Diagnostics
// =============================================================================

EngineDiagnostics HarmonyEngine::diagnostics() const noexcept {
    EngineDiagnostics result;
    result.bufferUnderruns = bufferUnderruns_.load(std::memory_order_relaxed);
    result.clippedSamples = clippedSamples_.load(std::memory_order_relaxed);
    result.clippedBuffers = clippedBuffers_.load(std::memory_order_relaxed);
    result.saturatedTicks = saturatedTicks_.load(std::memory_order_relaxed);
    result.rejectedConfigCalls = rejectedConfigCalls_.load(std::memory_order_relaxed);
    return result;
}

void HarmonyEngine::resetDiagnostics() noexcept {
    bufferUnderruns_.store(0, std::memory_order_relaxed);
    clippedSamples_.store(0, std::memory_order_relaxed);
    clippedBuffers_.store(0, std::memory_order_relaxed);
    saturatedTicks_.store(0, std::memory_order_relaxed);
    rejectedConfigCalls_.store(0, std::memory_order_relaxed);
}

} // namespace DSP
} // namespace Rhythmonics
