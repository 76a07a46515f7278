#pragma once
#include <lapreplay/playback.hpp>
#include <lapreplay/trace.hpp>

namespace lapreplay {

// Per-trace stepping constants (fallback already resolved).
struct StepParams {
  double max_frame_dt_s = 0.1;
  double fallback_step_m = 0.7;
};

// Resolve ReplayParams against a trace. Median falls back to
// params.fallback_step_m when the trace has no positive spacing.
StepParams resolve_step_params(const LapTrace& trace, const ReplayParams& params);

// Median of the positive adjacent distance spacings, nullopt if there are none.
std::optional<double> median_sample_spacing(const LapTrace& trace);

// Advance playback by one rendered frame at wall time now_ms.
// Distance-based: speed[i] * dt / (distance[i+1] - distance[i]) samples per frame.
// Returns the state unchanged when not playing or when the trace has < 2 samples.
PlaybackState step(const PlaybackState& state, const LapTrace& trace,
                   double now_ms, const StepParams& params);

PlaybackPhase phase(const PlaybackState& state, const LapTrace& trace);

} // namespace lapreplay
