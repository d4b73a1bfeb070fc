// ==============================================================================
// Rhythmonics DSP Lint Stub - Strict analysis of all public headers
// ==============================================================================
// Gives clang-tidy and the compiler a .cpp translation unit that includes
// every public DSP header, so header-only code is checked on its own rather
// than only through the tests.
//
// This file is NOT part of the RhythmonicsDSP library itself; it is compiled
// as a separate OBJECT library target (dsp_lint_stub).
// ==============================================================================

// Layer 0: Core
#include <rhythmonics/dsp/core/crossfade_utils.h>
#include <rhythmonics/dsp/core/db_utils.h>
#include <rhythmonics/dsp/core/engine_config.h>
#include <rhythmonics/dsp/core/engine_types.h>
#include <rhythmonics/dsp/core/math_constants.h>
#include <rhythmonics/dsp/core/phase_utils.h>
#include <rhythmonics/dsp/core/polyblep.h>
#include <rhythmonics/dsp/core/speed_curve.h>

// Layer 1: Primitives
#include <rhythmonics/dsp/primitives/bounce_detector.h>
#include <rhythmonics/dsp/primitives/dc_blocker.h>
#include <rhythmonics/dsp/primitives/percussive_impulse.h>
#include <rhythmonics/dsp/primitives/phase_tone.h>
#include <rhythmonics/dsp/primitives/simulation_clock.h>
#include <rhythmonics/dsp/primitives/smoother.h>
#include <rhythmonics/dsp/primitives/snapshot_exchange.h>

// Layer 2: Processors
#include <rhythmonics/dsp/processors/audio_mixer.h>
#include <rhythmonics/dsp/processors/oscillator.h>
#include <rhythmonics/dsp/processors/regime_synthesizer.h>

// Layer 3: Systems
#include <rhythmonics/dsp/systems/ensemble.h>
#include <rhythmonics/dsp/systems/harmony_engine.h>
