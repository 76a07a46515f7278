#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <lapreplay/frame_driver.hpp>
#include <lapreplay/replay_engine.hpp>
#include <lapreplay/trace.hpp>
#include <lapreplay/track_geom.hpp>
#include <lapreplay/view_buffer.hpp>

namespace lapreplay {

// RAII raylib window replaying one lap of a session at a time.
// The window's frame loop is the host frame source for the FrameDriver.
class ViewerApp {
public:
  ViewerApp(const std::vector<LapTrace>& laps, std::size_t initial_lap);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void bind_lap_(std::size_t lap_idx);
  void process_input_();
  void pump_view_();
  // Rendering
  void render_frame_();
  void refit_projection_();
  void draw_track_();
  void draw_speed_gauge_(const TraceSample& cur);
  void draw_gforce_(const TraceSample& cur);
  void draw_controls_(const TraceSample& cur);
  void draw_hud_();

  // Layout rectangles (pixels), recomputed per frame
  struct Box { float x, y, w, h; };
  Box map_box_() const;
  Box gauge_box_() const;
  Box gforce_box_() const;
  Box scrubber_box_() const;

  // Session data (not owned)
  const std::vector<LapTrace>& laps_;
  std::size_t lap_idx_;

  // Engine, frame source and published view. Declaration order matters:
  // the driver references the other three.
  ReplayEngine engine_{};
  QueuedFrameScheduler scheduler_{};
  ViewBuffer views_{};
  FrameDriver driver_{engine_, scheduler_, &views_};

  PlaybackView view_{};
  std::uint64_t cursor_{0};

  // Derived display data for the bound lap
  TrackProjection proj_{};
  int proj_w_{0};
  int proj_h_{0};
  double min_speed_{0.0};
  double max_speed_{1.0};
  GTrail gtrail_{};
  bool scrubbing_{false};
};

} // namespace lapreplay
