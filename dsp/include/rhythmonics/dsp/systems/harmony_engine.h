// ==============================================================================
// Layer 3: System - Harmony Engine
// ==============================================================================
// The simulation + audio engine behind the Rhythmonics toy. Owns the clock,
// the ensemble, the snapshot handoff, one voice per ensemble slot and the
// output mixer.
//
// Threads:
//   simulation thread  onFrameTick() and every configuration call
//   audio thread       fillAudioBuffer()
//
// The two sides share nothing but a lock-free triple-buffered snapshot and a
// handful of atomics:
//
//   onFrameTick(dt) -> Clock.tick -> Ensemble.advance -> commit snapshot
//                                                            |
//   fillAudioBuffer <- AudioMixer <- RegimeSynthesizer[slot] <-'
//
// Configuration calls report failures as EngineError and leave state
// untouched. The audio path never fails: problems are counted in
// EngineDiagnostics and the buffer is filled with silence.
//
// Dependencies: Layer 0 engine_config.h, engine_types.h, speed_curve.h
//               Layer 1 simulation_clock.h, snapshot_exchange.h
//               Layer 2 audio_mixer.h, regime_synthesizer.h
//               Layer 3 ensemble.h
// ==============================================================================

#pragma once

#include <rhythmonics/dsp/core/engine_config.h>
#include <rhythmonics/dsp/core/engine_types.h>
#include <rhythmonics/dsp/core/speed_curve.h>
#include <rhythmonics/dsp/primitives/bounce_detector.h>
#include <rhythmonics/dsp/primitives/simulation_clock.h>
#include <rhythmonics/dsp/primitives/snapshot_exchange.h>
#include <rhythmonics/dsp/processors/audio_mixer.h>
#include <rhythmonics/dsp/processors/regime_synthesizer.h>
#include <rhythmonics/dsp/systems/ensemble.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Rhythmonics {
namespace DSP {

// =============================================================================
// Snapshot
// =============================================================================

/// @brief Render/audio view of one oscillator at the end of a tick.
struct OscillatorSnapshot {
    OscillatorId id = kInvalidOscillatorId;
    std::uint32_t slot = 0;      ///< Arena slot (voice index)
    std::uint32_t ratio = 1;
    std::uint32_t sides = kMinPolygonSides;
    std::uint32_t vertex = 0;    ///< Vertex the ball last left
    std::uint32_t epoch = 0;     ///< Changes whenever the phase was re-seeded
    std::uint64_t bounceCount = 0;
    double phase = 0.0;          ///< Progress along the current edge, [0, 1)
    double effectiveFrequency = 0.0;
    float blendFactor = 0.0f;    ///< 0 = percussion, 1 = tone
    Regime regime = Regime::Rhythm;
    bool active = true;
};

/// @brief Whole-ensemble state committed once per tick, in display order.
struct EnsembleSnapshot {
    std::array<OscillatorSnapshot, kMaxOscillators> oscillators{};
    size_t count = 0;
    double speed = 1.0;
    double fundamentalHz = 0.0;  ///< Base frequency * speed, 0 while frozen
    double bpm = 0.0;
    double simulationSeconds = 0.0;
    double wallSeconds = 0.0;    ///< Frame time consumed so far, after clamping
    std::uint64_t sequence = 0;  ///< Increments on every commit
    bool frozen = false;
    bool running = false;
};

// =============================================================================
// Diagnostics
// =============================================================================

/// @brief Counters of recovered runtime problems.
struct EngineDiagnostics {
    std::uint64_t bufferUnderruns = 0;     ///< Audio requested before prepare()
    std::uint64_t clippedSamples = 0;      ///< Samples clamped by the mixer
    std::uint64_t clippedBuffers = 0;      ///< Audio callbacks with any clamping
    std::uint64_t saturatedTicks = 0;      ///< Ticks where an event batch overflowed
    std::uint64_t rejectedConfigCalls = 0; ///< Configuration calls that returned an error
};

// =============================================================================
// HarmonyEngine
// =============================================================================

/// @brief External interface of the simulation and audio engine.
///
/// @par Usage
/// @code
/// HarmonyEngine engine;
/// if (engine.prepare(EngineConfig{}) != EngineError::None) { ... }
/// (void)engine.addDefaultOscillators();
///
/// // UI thread, every frame
/// engine.onFrameTick(frameSeconds);
/// const EnsembleSnapshot& view = engine.getSnapshot();
///
/// // Audio callback
/// engine.fillAudioBuffer(out, numFrames, 48000.0);
/// @endcode
class HarmonyEngine {
public:
    /// Largest block rendered in one pass; longer requests are chunked
    static constexpr size_t kMaxBlockSize = 1024;

    /// Jumps in the frame-to-audio clock offset larger than this (seconds)
    /// are taken at once; smaller ones are smoothed
    static constexpr double kClockResyncSeconds = 0.05;

    /// Share of each new offset observation folded into the estimate
    static constexpr double kClockSmoothing = 0.05;

    HarmonyEngine() noexcept = default;
    ~HarmonyEngine() = default;

    HarmonyEngine(const HarmonyEngine&) = delete;
    HarmonyEngine& operator=(const HarmonyEngine&) = delete;

    // =========================================================================
    // Lifecycle (simulation thread, audio stream stopped)
    // =========================================================================

    /// @brief Validate the configuration and allocate every buffer.
    ///
    /// Empties the ensemble and leaves the engine running. Not real-time
    /// safe; the audio stream must not be calling fillAudioBuffer().
    ///
    /// @return InvalidConfig (engine left unprepared) or None
    [[nodiscard]] EngineError prepare(const EngineConfig& config);

    /// @brief Restart simulation time and every phase at 0.
    /// Ensemble contents, speed and freeze state are kept.
    void reset() noexcept;

    /// @brief Resume ticking and audio. Voices fade back in from the
    ///        current snapshot.
    void start() noexcept;

    /// @brief Stop immediately: the next audio buffer is silent, pending hits
    ///        are dropped and ticks are ignored until start().
    void stop() noexcept;

    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }
    [[nodiscard]] bool isRunning() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    // =========================================================================
    // Simulation (simulation thread)
    // =========================================================================

    /// @brief Advance the simulation by one frame and publish a snapshot.
    /// Ignored before prepare() and while stopped.
    void onFrameTick(double dtWallClockSeconds) noexcept;

    /// @brief Latest committed snapshot.
    /// The reference stays valid until the next simulation-thread call.
    [[nodiscard]] const EnsembleSnapshot& getSnapshot() const noexcept { return published_; }

    /// @brief Bounce events of the most recent tick (for vertex flashes).
    /// @return nullptr if the id is unknown
    [[nodiscard]] const BounceBatch* lastTickEvents(OscillatorId id) const noexcept {
        return ensemble_.eventsFor(id);
    }

    // =========================================================================
    // Configuration (simulation thread)
    // =========================================================================

    /// @brief Set the global speed multiplier, effective from the next tick.
    /// @return InvalidSpeed if speed is not finite and positive, or if
    ///         baseFrequencyHz * speed exceeds EngineConfig::maxFundamentalHz
    [[nodiscard]] EngineError setSpeed(double speed) noexcept;

    /// @brief Set speed from the slider curve. The bottom dead zone freezes
    ///        the simulation without changing the stored speed.
    [[nodiscard]] EngineError setSliderPosition(double position) noexcept;

    void setFrozen(bool frozen) noexcept;

    [[nodiscard]] EngineError addOscillator(double ratio, OscillatorId* outId = nullptr) noexcept;
    [[nodiscard]] EngineError removeOscillator(OscillatorId id) noexcept;
    [[nodiscard]] EngineError setRatio(OscillatorId id, double ratio) noexcept;
    [[nodiscard]] EngineError setActive(OscillatorId id, bool active) noexcept;

    /// @brief Replace the ensemble with overtones 1..7.
    [[nodiscard]] EngineError addDefaultOscillators() noexcept;

    /// @brief Remove every oscillator.
    void clearOscillators() noexcept;

    [[nodiscard]] double getSpeed() const noexcept { return clock_.getSpeed(); }
    [[nodiscard]] bool isFrozen() const noexcept { return clock_.isFrozen(); }
    [[nodiscard]] const EngineConfig& getConfig() const noexcept { return config_; }
    [[nodiscard]] const Ensemble& getEnsemble() const noexcept { return ensemble_; }
    [[nodiscard]] const SimulationClock& getClock() const noexcept { return clock_; }

    // =========================================================================
    // Audio (audio thread)
    // =========================================================================

    /// @brief Render mono audio for the current snapshot.
    ///
    /// Safe to call concurrently with onFrameTick() and configuration calls.
    /// Never blocks, allocates or throws. Before prepare() the buffer is
    /// zero-filled and an underrun is counted.
    ///
    /// @param buffer Destination, numSamples floats
    /// @param numSamples Samples to render
    /// @param sampleRate Device sample rate in Hz
    void fillAudioBuffer(float* buffer, size_t numSamples, double sampleRate) noexcept;

    // =========================================================================
    // Diagnostics (any thread)
    // =========================================================================

    [[nodiscard]] EngineDiagnostics diagnostics() const noexcept;
    void resetDiagnostics() noexcept;

private:
    EngineError record(EngineError error, const char* operation) noexcept;
    void commitSnapshot() noexcept;
    void configureAudio(double sampleRate) noexcept;
    void trackClock(double wallSeconds, double audioSeconds) noexcept;

    // Simulation side
    EngineConfig config_{};
    SimulationClock clock_;
    Ensemble ensemble_;
    EnsembleSnapshot published_{};
    std::uint64_t sequence_ = 0;
    bool prepared_ = false;

    // Shared
    SnapshotExchange<EnsembleSnapshot> exchange_;
    std::atomic<bool> audioReady_{false};
    std::atomic<bool> running_{false};

    // Audio side
    std::array<RegimeSynthesizer, kMaxOscillators> voices_{};
    std::array<VoiceTarget, kMaxOscillators> targets_{};
    AudioMixer mixer_;
    std::vector<float> voiceBuffer_;
    double audioSampleRate_ = 0.0;
    std::uint64_t audioSamples_ = 0;  ///< Rendered since the clock lock was last lost
    double snapshotWall_ = 0.0;       ///< wallSeconds of the newest acquired snapshot
    double clockOffset_ = 0.0;        ///< Audio seconds minus frame seconds
    bool clockLocked_ = false;
    bool audioSilenced_ = true;

    // Diagnostics
    std::atomic<std::uint64_t> bufferUnderruns_{0};
    std::atomic<std::uint64_t> clippedSamples_{0};
    std::atomic<std::uint64_t> clippedBuffers_{0};
    std::atomic<std::uint64_t> saturatedTicks_{0};
    std::atomic<std::uint64_t> rejectedConfigCalls_{0};
};

} // namespace DSP
} // namespace Rhythmonics
