#include <lapreplay/replay_engine.hpp>
#include <cmath>

namespace lapreplay {

ReplayEngine::ReplayEngine(const LapTrace& trace, ReplayParams params)
  : params_(params) {
  bind(trace);
}

void ReplayEngine::bind(const LapTrace& trace) {
  trace_ = &trace;
  step_params_ = resolve_step_params(trace, params_);
  state_ = PlaybackState{};
}

void ReplayEngine::unbind() {
  trace_ = nullptr;
  step_params_ = StepParams{};
  state_ = PlaybackState{};
}

void ReplayEngine::set_params(const ReplayParams& params) {
  params_ = params;
  if (trace_) step_params_ = resolve_step_params(*trace_, params_);
}

void ReplayEngine::play() {
  const std::size_t n = sample_count();
  if (n < 2) return;
  if (state_.current_index >= n - 1) {
    // Restart rather than play zero frames.
    state_.current_index = 0;
    state_.fractional_remainder = 0.0;
  }
  state_.is_playing = true;
  state_.last_frame_ms.reset();
}

void ReplayEngine::pause() {
  state_.is_playing = false;
}

void ReplayEngine::toggle_play() {
  if (state_.is_playing) pause();
  else play();
}

void ReplayEngine::seek(std::int64_t target_index) {
  const std::size_t n = sample_count();
  if (n < 2) return;
  const std::int64_t last = static_cast<std::int64_t>(n - 1);
  const std::int64_t clamped = target_index < 0 ? 0 : (target_index > last ? last : target_index);
  state_.current_index = static_cast<std::size_t>(clamped);
  state_.fractional_remainder = 0.0;
  state_.last_frame_ms.reset();
}

bool ReplayEngine::set_speed(double multiplier) {
  if (!std::isfinite(multiplier) || multiplier <= 0.0) return false;
  state_.speed_multiplier = multiplier;
  return true;
}

void ReplayEngine::reset() {
  state_ = PlaybackState{};
}

void ReplayEngine::tick(double now_ms) {
  if (!trace_) return;
  state_ = step(state_, *trace_, now_ms, step_params_);
}

PlaybackPhase ReplayEngine::phase() const {
  if (!trace_) return PlaybackPhase::Idle;
  return lapreplay::phase(state_, *trace_);
}

} // namespace lapreplay
