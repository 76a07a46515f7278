#include <lapreplay/integrator.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace lapreplay {

std::optional<double> median_sample_spacing(const LapTrace& trace) {
  const std::size_t n = trace.size();
  std::vector<double> gaps;
  gaps.reserve(n > 0 ? n - 1 : 0);
  for (std::size_t i = 1; i < n; ++i) {
    const double d = trace.distance_m[i] - trace.distance_m[i-1];
    if (d > 0.0) gaps.push_back(d);
  }
  if (gaps.empty()) return std::nullopt;

  const std::size_t mid = gaps.size() / 2;
  std::nth_element(gaps.begin(), gaps.begin() + mid, gaps.end());
  const double upper = gaps[mid];
  if (gaps.size() % 2 == 1) return upper;
  const double lower = *std::max_element(gaps.begin(), gaps.begin() + mid);
  return 0.5 * (lower + upper);
}

StepParams resolve_step_params(const LapTrace& trace, const ReplayParams& params) {
  StepParams sp;
  sp.max_frame_dt_s  = params.max_frame_dt_s > 0.0 ? params.max_frame_dt_s : 0.1;
  sp.fallback_step_m = params.fallback_step_m > 0.0 ? params.fallback_step_m : 0.7;
  if (params.fallback == FallbackSpacing::Median) {
    if (auto m = median_sample_spacing(trace)) sp.fallback_step_m = *m;
  }
  return sp;
}

PlaybackState step(const PlaybackState& state, const LapTrace& trace,
                   double now_ms, const StepParams& params) {
  const std::size_t n = trace.size();
  if (!state.is_playing || n < 2) return state;

  PlaybackState next = state;

  // First tick after (re)start only establishes the anchor.
  if (!next.last_frame_ms) {
    next.last_frame_ms = now_ms;
    return next;
  }

  double dt_s = (now_ms - *next.last_frame_ms) / 1000.0;
  next.last_frame_ms = now_ms;
  dt_s = std::clamp(dt_s, 0.0, params.max_frame_dt_s);

  const double dt_eff = dt_s * next.speed_multiplier;

  const std::size_t i = std::min(next.current_index, n - 1);
  const double speed_mps = trace.speed_mph[i] * kMphToMps;
  double covered_m = speed_mps * dt_eff;
  // A NaN or infinite speed sample advances nothing.
  if (!std::isfinite(covered_m)) covered_m = 0.0;

  const std::size_t i_next = std::min(i + 1, n - 1);
  double step_m = trace.distance_m[i_next] - trace.distance_m[i];
  if (!(step_m > 0.0)) step_m = params.fallback_step_m;

  next.fractional_remainder += covered_m / step_m;
  const double whole = std::floor(next.fractional_remainder);
  next.fractional_remainder -= whole;

  if (whole > 0.0) {
    const double room = static_cast<double>(n - 1 - i);
    if (whole >= room) {
      next.current_index = n - 1;
      next.is_playing = false;
      next.last_frame_ms.reset();
      next.fractional_remainder = 0.0;
      return next;
    }
    next.current_index = i + static_cast<std::size_t>(whole);
  }
  return next;
}

PlaybackPhase phase(const PlaybackState& state, const LapTrace& trace) {
  if (state.is_playing) return PlaybackPhase::Playing;
  const std::size_t n = trace.size();
  if (n >= 2 && state.current_index >= n - 1) return PlaybackPhase::Ended;
  return PlaybackPhase::Idle;
}

} // namespace lapreplay
