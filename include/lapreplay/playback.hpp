#pragma once
#include <cstddef>
#include <optional>

namespace lapreplay {

inline constexpr double kMphToMps = 0.44704;

// Where playback currently stands. Owned by one ReplayEngine.
struct PlaybackState {
  std::size_t current_index = 0;        // [0, N-1]
  double fractional_remainder = 0.0;    // [0, 1): sub-sample progress
  double speed_multiplier = 1.0;        // > 0
  bool is_playing = false;
  std::optional<double> last_frame_ms;  // empty: next tick only anchors
};

// What renderers get to see.
struct PlaybackView {
  std::size_t current_index = 0;
  bool is_playing = false;
  double speed_multiplier = 1.0;
};

inline PlaybackView view_of(const PlaybackState& s) {
  return PlaybackView{s.current_index, s.is_playing, s.speed_multiplier};
}

enum class PlaybackPhase { Idle, Playing, Ended };

enum class FallbackSpacing {
  Fixed,   // fallback_step_m as given
  Median   // median positive spacing of the bound trace
};

struct ReplayParams {
  double max_frame_dt_s = 0.1;          // clamp for stalled frame delivery
  FallbackSpacing fallback = FallbackSpacing::Fixed;
  double fallback_step_m = 0.7;         // typical GPS sample interval
};

} // namespace lapreplay
