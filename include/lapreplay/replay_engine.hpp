#pragma once
#include <cstddef>
#include <cstdint>
#include <lapreplay/integrator.hpp>
#include <lapreplay/playback.hpp>
#include <lapreplay/trace.hpp>

namespace lapreplay {

// Replays one bound LapTrace. The trace is owned by the caller and must
// outlive the binding. Without a replayable trace (< 2 samples) the engine
// is inert: play() and seek() do nothing.
class ReplayEngine {
public:
  ReplayEngine() = default;
  explicit ReplayEngine(const LapTrace& trace, ReplayParams params = {});
  ReplayEngine(LapTrace&&, ReplayParams = {}) = delete;

  // Swap the trace; playback state starts over.
  void bind(const LapTrace& trace);
  void bind(LapTrace&&) = delete;
  void unbind();

  void set_params(const ReplayParams& params);
  const ReplayParams& params() const { return params_; }

  // Control surface
  void play();
  void pause();
  void toggle_play();
  void seek(std::int64_t target_index);
  bool set_speed(double multiplier);  // false: rejected, previous value kept
  void reset();

  // One rendered frame at wall time now_ms (milliseconds, any epoch).
  void tick(double now_ms);

  const PlaybackState& state() const { return state_; }
  PlaybackView view() const { return view_of(state_); }
  PlaybackPhase phase() const;

  const LapTrace* trace() const { return trace_; }
  std::size_t sample_count() const { return trace_ ? trace_->size() : 0; }
  bool replayable() const { return sample_count() >= 2; }

private:
  const LapTrace* trace_{nullptr};
  ReplayParams params_{};
  StepParams step_params_{};
  PlaybackState state_{};
};

} // namespace lapreplay
