#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

#include <lapreplay/viewer/app.hpp>
#include <lapreplay/format.hpp>

namespace lapreplay {

namespace {

// Speed presets offered on keys 1..4.
static constexpr double kSpeedPresets[] = {0.5, 1.0, 2.0, 4.0};
static constexpr std::int64_t kSeekStep = 50; // samples per Left/Right press

// --- Layout (keep in sync with draw_* helpers) ---
static constexpr float kPad        = 12.0f;
static constexpr float kControlsH  = 84.0f;
static constexpr float kMapShare   = 0.6f;
static constexpr float kGaugeShare = 0.45f;
static constexpr float kGMaxG      = 2.0f;   // outer ring of the g plot

static const Color kPanelBg   = Color{24, 24, 28, 255};
static const Color kPanelEdge = Color{60, 60, 70, 255};
static const Color kTextMain  = Color{225, 225, 232, 255};
static const Color kTextDim   = Color{150, 150, 162, 255};
static const Color kAccent    = Color{59, 130, 246, 255};

// green(120) -> yellow(60) -> red(0)
static Color speedColor(double speed, double lo, double hi) {
  const float t = static_cast<float>(speed_fraction(speed, lo, hi));
  return ColorFromHSV((1.0f - t) * 120.0f, 0.9f, 1.0f);
}

static Rectangle toRect(float x, float y, float w, float h) { return Rectangle{x, y, w, h}; }

static void drawPanel(float x, float y, float w, float h) {
  DrawRectangleRec(toRect(x, y, w, h), kPanelBg);
  DrawRectangleLinesEx(toRect(x, y, w, h), 1.0f, kPanelEdge);
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(const std::vector<LapTrace>& laps, std::size_t initial_lap)
  : laps_(laps), lap_idx_(initial_lap) {}

ViewerApp::Box ViewerApp::map_box_() const {
  const float W = static_cast<float>(GetScreenWidth());
  const float H = static_cast<float>(GetScreenHeight());
  return { kPad, kPad, (W - 3.0f * kPad) * kMapShare, H - kControlsH - 3.0f * kPad };
}

ViewerApp::Box ViewerApp::gauge_box_() const {
  const Box m = map_box_();
  const float W = static_cast<float>(GetScreenWidth());
  return { m.x + m.w + kPad, m.y, W - m.w - 3.0f * kPad, m.h * kGaugeShare };
}

ViewerApp::Box ViewerApp::gforce_box_() const {
  const Box g = gauge_box_();
  const Box m = map_box_();
  return { g.x, g.y + g.h + kPad, g.w, m.h - g.h - kPad };
}

ViewerApp::Box ViewerApp::scrubber_box_() const {
  const float W = static_cast<float>(GetScreenWidth());
  const float H = static_cast<float>(GetScreenHeight());
  return { 2.0f * kPad, H - kControlsH - kPad + 14.0f, W - 4.0f * kPad, 10.0f };
}

void ViewerApp::bind_lap_(std::size_t lap_idx) {
  if (laps_.empty()) return;
  lap_idx_ = lap_idx % laps_.size();
  const LapTrace& lap = laps_[lap_idx_];

  driver_.bind(lap);
  gtrail_.clear();
  proj_w_ = proj_h_ = 0; // force refit

  if (lap.speed_mph.empty()) {
    min_speed_ = 0.0;
    max_speed_ = 1.0;
  } else {
    const auto [lo, hi] = std::minmax_element(lap.speed_mph.begin(), lap.speed_mph.end());
    min_speed_ = *lo;
    max_speed_ = *hi > 0.0 ? *hi : 1.0;
  }

  if (lap.replayable()) {
    TraceLog(LOG_INFO, "REPLAY: bound lap %d (%zu samples, %s)",
             lap.lap_number, lap.size(),
             format_lap_time(lap_time_s(lap).value_or(-1.0)).c_str());
  } else {
    TraceLog(LOG_WARNING, "REPLAY: lap %d has %zu samples, replay disabled",
             lap.lap_number, lap.size());
  }
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
  InitWindow(W, H, "Lap Replay");
  SetTargetFPS(60);

  bind_lap_(lap_idx_);

  while (!WindowShouldClose()) {
    process_input_();
    scheduler_.run_frame(GetTime() * 1000.0);
    pump_view_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_SPACE)) driver_.toggle_play();
  if (IsKeyPressed(KEY_R))     driver_.reset();

  const int keys[] = {KEY_ONE, KEY_TWO, KEY_THREE, KEY_FOUR};
  for (int k = 0; k < 4; ++k) {
    if (IsKeyPressed(keys[k]) && !driver_.set_speed(kSpeedPresets[k])) {
      TraceLog(LOG_WARNING, "REPLAY: speed %.2f rejected", kSpeedPresets[k]);
    }
  }

  const auto idx = static_cast<std::int64_t>(view_.current_index);
  if (IsKeyPressed(KEY_LEFT))  driver_.seek(idx - kSeekStep);
  if (IsKeyPressed(KEY_RIGHT)) driver_.seek(idx + kSeekStep);
  if (IsKeyPressed(KEY_HOME))  driver_.seek(0);
  if (IsKeyPressed(KEY_END))   driver_.seek(static_cast<std::int64_t>(engine_.sample_count()));

  // Lap swap: the driver cancels the outstanding frame before rebinding.
  if (IsKeyPressed(KEY_N) && laps_.size() > 1) bind_lap_(lap_idx_ + 1);

  // Scrubber drag
  const Box sb = scrubber_box_();
  const Rectangle hit = toRect(sb.x, sb.y - 8.0f, sb.w, sb.h + 16.0f);
  const Vector2 mouse = GetMousePosition();
  if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT) && CheckCollisionPointRec(mouse, hit)) scrubbing_ = true;
  if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) scrubbing_ = false;
  if (scrubbing_ && IsMouseButtonDown(MOUSE_BUTTON_LEFT) && engine_.sample_count() > 1) {
    const float t = std::clamp((mouse.x - sb.x) / sb.w, 0.0f, 1.0f);
    const double last = static_cast<double>(engine_.sample_count() - 1);
    driver_.seek(static_cast<std::int64_t>(std::lround(t * last)));
  }
}

void ViewerApp::pump_view_() {
  const PlaybackView prev = view_;
  while (views_.try_consume_latest(cursor_, view_)) {}

  if (prev.is_playing && !view_.is_playing && engine_.phase() == PlaybackPhase::Ended) {
    TraceLog(LOG_INFO, "REPLAY: lap %d ended after %llu frames",
             engine_.trace() ? engine_.trace()->lap_number : 0,
             static_cast<unsigned long long>(driver_.frames_run()));
  }
}

void ViewerApp::refit_projection_() {
  const Box m = map_box_();
  const int w = static_cast<int>(m.w), h = static_cast<int>(m.h);
  if (w == proj_w_ && h == proj_h_) return;
  proj_w_ = w;
  proj_h_ = h;
  if (const LapTrace* t = engine_.trace()) proj_.fit(t->lat, t->lon, m.w, m.h, 20.0);
}

void ViewerApp::render_frame_() {
  refit_projection_();

  TraceSample cur{};
  if (const LapTrace* t = engine_.trace()) {
    cur = sample_at(*t, view_.current_index, engine_.state().fractional_remainder);
    const auto& pts = gtrail_.points();
    if (pts.empty() || pts.back().x != cur.lateral_g || pts.back().y != cur.longitudinal_g) {
      gtrail_.push(cur.lateral_g, cur.longitudinal_g);
    }
  }

  BeginDrawing();
  ClearBackground(Color{14, 14, 18, 255});

  draw_track_();
  draw_speed_gauge_(cur);
  draw_gforce_(cur);
  draw_controls_(cur);
  draw_hud_();

  EndDrawing();
}

void ViewerApp::draw_track_() {
  const Box m = map_box_();
  drawPanel(m.x, m.y, m.w, m.h);
  const LapTrace* t = engine_.trace();
  if (!t || !proj_.valid()) {
    DrawText("No lap data", int(m.x + 20), int(m.y + 20), 20, kTextDim);
    return;
  }
  if (!t->replayable()) {
    DrawText("Insufficient lap data for replay", int(m.x + 20), int(m.y + 20), 20, kTextDim);
    return;
  }

  const std::size_t n = std::min({t->lat.size(), t->lon.size(), t->size()});
  auto at = [&](std::size_t i) {
    const Vec2 p = proj_.project(t->lat[i], t->lon[i]);
    return Vector2{ m.x + float(p.x), m.y + float(p.y) };
  };

  // Outline
  for (std::size_t i = 1; i < n; ++i) {
    DrawLineEx(at(i-1), at(i), 4.0f, Color{70, 70, 80, 255});
  }
  // Speed-coloured trail up to the current sample
  const std::size_t upto = std::min(view_.current_index, n > 0 ? n - 1 : 0);
  for (std::size_t i = 1; i <= upto; ++i) {
    DrawLineEx(at(i-1), at(i), 3.0f, speedColor(t->speed_mph[i], min_speed_, max_speed_));
  }

  // Current position between samples
  if (n > 0) {
    const TraceSample s = sample_at(*t, view_.current_index, engine_.state().fractional_remainder);
    const Vec2 p = proj_.project(s.lat, s.lon);
    const Vector2 dot{ m.x + float(p.x), m.y + float(p.y) };
    DrawCircleV(dot, 11.0f, Fade(kAccent, 0.25f));
    DrawCircleV(dot, 6.0f, kAccent);
    DrawCircleV(dot, 2.5f, RAYWHITE);
  }
}

void ViewerApp::draw_speed_gauge_(const TraceSample& cur) {
  const Box g = gauge_box_();
  drawPanel(g.x, g.y, g.w, g.h);

  const Vector2 c{ g.x + g.w * 0.5f, g.y + g.h * 0.55f };
  const float r = std::max(10.0f, std::min(g.w, g.h) * 0.38f);
  const float start = 135.0f, sweep = 270.0f;
  const float t = static_cast<float>(speed_fraction(cur.speed_mph, 0.0, max_speed_));

  DrawRing(c, r - 10.0f, r, start, start + sweep, 64, Color{50, 50, 58, 255});
  DrawRing(c, r - 10.0f, r, start, start + sweep * t, 64,
           speedColor(cur.speed_mph, min_speed_, max_speed_));

  const char* value = TextFormat("%.0f", cur.speed_mph);
  const int fs = 40;
  DrawText(value, int(c.x) - MeasureText(value, fs) / 2, int(c.y) - fs / 2, fs, kTextMain);
  DrawText("mph", int(c.x) - MeasureText("mph", 16) / 2, int(c.y) + fs / 2 + 4, 16, kTextDim);
}

void ViewerApp::draw_gforce_(const TraceSample& cur) {
  const Box b = gforce_box_();
  drawPanel(b.x, b.y, b.w, b.h);

  const Vector2 c{ b.x + b.w * 0.5f, b.y + b.h * 0.5f };
  const float r = std::max(10.0f, std::min(b.w, b.h) * 0.42f);
  const float px_per_g = r / kGMaxG;

  DrawCircleLines(int(c.x), int(c.y), r, kPanelEdge);
  DrawCircleLines(int(c.x), int(c.y), px_per_g, kPanelEdge);
  DrawLine(int(c.x - r), int(c.y), int(c.x + r), int(c.y), kPanelEdge);
  DrawLine(int(c.x), int(c.y - r), int(c.x), int(c.y + r), kPanelEdge);

  // Lateral on x, longitudinal up (braking shows below centre).
  auto to_px = [&](double lat_g, double lon_g) {
    const double lx = std::clamp(lat_g, -double(kGMaxG), double(kGMaxG));
    const double ly = std::clamp(lon_g, -double(kGMaxG), double(kGMaxG));
    return Vector2{ c.x + float(lx) * px_per_g, c.y - float(ly) * px_per_g };
  };

  const auto& pts = gtrail_.points();
  const float k = pts.empty() ? 1.0f : 1.0f / float(pts.size());
  for (std::size_t i = 0; i < pts.size(); ++i) {
    DrawCircleV(to_px(pts[i].x, pts[i].y), 3.0f, Fade(kAccent, 0.1f + 0.6f * k * float(i)));
  }
  DrawCircleV(to_px(cur.lateral_g, cur.longitudinal_g), 6.0f, kAccent);

  DrawText(TextFormat("lat %+.2fg  lon %+.2fg", cur.lateral_g, cur.longitudinal_g),
           int(b.x + 10), int(b.y + b.h - 24), 16, kTextDim);
}

void ViewerApp::draw_controls_(const TraceSample& cur) {
  const float W = static_cast<float>(GetScreenWidth());
  const float H = static_cast<float>(GetScreenHeight());
  drawPanel(kPad, H - kControlsH - kPad, W - 2.0f * kPad, kControlsH);

  // Scrubber
  const Box sb = scrubber_box_();
  const std::size_t n = engine_.sample_count();
  const float progress = n > 1 ? float(view_.current_index) / float(n - 1) : 0.0f;
  DrawRectangleRec(toRect(sb.x, sb.y, sb.w, sb.h), Color{50, 50, 58, 255});
  DrawRectangleRec(toRect(sb.x, sb.y, sb.w * progress, sb.h), kAccent);
  DrawCircleV(Vector2{ sb.x + sb.w * progress, sb.y + sb.h * 0.5f }, 8.0f, RAYWHITE);

  // Readout: distance / total | lap time
  double total = 0.0;
  if (const LapTrace* t = engine_.trace(); t && !t->distance_m.empty()) total = t->distance_m.back();
  const std::string readout = format_distance(cur.distance_m) + " / " + format_distance(total)
                            + "  |  " + format_lap_time(cur.lap_time_s);
  const int row_y = int(sb.y + 26);
  DrawText(view_.is_playing ? "Playing" : "Paused", int(sb.x), row_y, 20,
           view_.is_playing ? kAccent : kTextDim);
  DrawText(readout.c_str(), int(W * 0.5f) - MeasureText(readout.c_str(), 20) / 2, row_y, 20, kTextMain);

  // Speed selector
  int x = int(sb.x + sb.w);
  for (int k = 3; k >= 0; --k) {
    const std::string label = format_multiplier(kSpeedPresets[k]);
    const int w = MeasureText(label.c_str(), 18) + 12;
    x -= w + 4;
    const bool active = std::fabs(view_.speed_multiplier - kSpeedPresets[k]) < 1e-9;
    DrawRectangleRec(toRect(float(x), float(row_y - 3), float(w), 24.0f),
                     active ? kAccent : Color{40, 40, 48, 255});
    DrawText(label.c_str(), x + 6, row_y, 18, active ? RAYWHITE : kTextDim);
  }
}

void ViewerApp::draw_hud_() {
  const Box m = map_box_();
  const LapTrace* t = engine_.trace();
  DrawText(TextFormat("Lap %d  (%zu/%zu)", t ? t->lap_number : 0, lap_idx_ + 1, laps_.size()),
           int(m.x + 12), int(m.y + 10), 20, kTextMain);
  DrawText("Space: Play/Pause | 1..4: 0.5x 1x 2x 4x | Left/Right: Seek | Home/End | N: Next lap | R: Reset",
           int(m.x + 12), int(m.y + m.h - 22), 14, kTextDim);
}

} // namespace lapreplay
