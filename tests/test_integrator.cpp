#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include <lapreplay/integrator.hpp>
#include <lapreplay/playback.hpp>
#include <lapreplay/trace.hpp>

using Catch::Approx;
using namespace lapreplay;

static LapTrace trace_from(std::vector<double> distance, double mph) {
  LapTrace t;
  t.distance_m = std::move(distance);
  t.speed_mph.assign(t.distance_m.size(), mph);
  return t;
}

static PlaybackState playing_at(std::size_t idx, std::optional<double> anchor) {
  PlaybackState s;
  s.current_index = idx;
  s.is_playing = true;
  s.last_frame_ms = anchor;
  return s;
}

TEST_CASE("step is a no-op while not playing") {
  const LapTrace t = trace_from({0, 1, 2, 3}, 50.0);
  PlaybackState s;
  s.current_index = 1;
  s.fractional_remainder = 0.25;
  s.last_frame_ms = 10.0;

  const PlaybackState out = step(s, t, 500.0, StepParams{});
  REQUIRE(out.current_index == 1);
  REQUIRE(out.fractional_remainder == 0.25);
  REQUIRE(out.last_frame_ms == 10.0);
}

TEST_CASE("step ignores traces shorter than two samples") {
  const LapTrace t = trace_from({0}, 50.0);
  const PlaybackState out = step(playing_at(0, 0.0), t, 100.0, StepParams{});
  REQUIRE(out.current_index == 0);
  REQUIRE(out.is_playing);
  REQUIRE(out.last_frame_ms == 0.0);
}

TEST_CASE("first tick only sets the anchor") {
  const LapTrace t = trace_from({0, 1, 2, 3}, 100.0);
  const PlaybackState out = step(playing_at(0, std::nullopt), t, 1234.0, StepParams{});
  REQUIRE(out.last_frame_ms == 1234.0);
  REQUIRE(out.current_index == 0);
  REQUIRE(out.fractional_remainder == 0.0);
}

TEST_CASE("backwards host clock does not move playback") {
  const LapTrace t = trace_from({0, 1, 2, 3}, 100.0);
  const PlaybackState out = step(playing_at(1, 500.0), t, 400.0, StepParams{});
  REQUIRE(out.current_index == 1);
  REQUIRE(out.fractional_remainder == 0.0);
  REQUIRE(out.last_frame_ms == 400.0);
}

TEST_CASE("advance uses local spacing at the current sample") {
  // 25 mph * 0.44704 = 11.176 m/s; 50 ms -> 0.5588 m
  const LapTrace t = trace_from({0, 0.5, 2.5, 3.0}, 25.0);

  SECTION("dense spacing advances one sample with remainder") {
    const PlaybackState out = step(playing_at(0, 0.0), t, 50.0, StepParams{});
    REQUIRE(out.current_index == 1);
    REQUIRE(out.fractional_remainder == Approx(0.5588 / 0.5 - 1.0).margin(1e-9));
  }

  SECTION("sparse spacing only accumulates") {
    const PlaybackState out = step(playing_at(1, 0.0), t, 50.0, StepParams{});
    REQUIRE(out.current_index == 1);
    REQUIRE(out.fractional_remainder == Approx(0.5588 / 2.0).margin(1e-9));
  }
}

TEST_CASE("zero spacing falls back to the configured step") {
  const LapTrace t = trace_from({0, 1, 1, 2, 3}, 25.0);

  StepParams wide;  wide.fallback_step_m = 2.0;
  StepParams fine;  fine.fallback_step_m = 0.5;

  const PlaybackState a = step(playing_at(1, 0.0), t, 50.0, wide);   // 0.5588 / 2.0
  const PlaybackState b = step(playing_at(1, 0.0), t, 50.0, fine);   // 0.5588 / 0.5

  REQUIRE(a.current_index == 1);
  REQUIRE(a.fractional_remainder == Approx(0.2794).margin(1e-9));
  REQUIRE(b.current_index == 2);
  REQUIRE(b.fractional_remainder == Approx(0.1176).margin(1e-9));
}

TEST_CASE("the last sample uses the fallback spacing and ends playback") {
  const LapTrace t = trace_from({0, 1, 2}, 25.0);
  // 0.1 s * 11.176 m/s over 0.7 m fallback -> 1.6 steps
  const PlaybackState out = step(playing_at(2, 0.0), t, 100.0, StepParams{});
  REQUIRE(out.current_index == 2);
  REQUIRE_FALSE(out.is_playing);
  REQUIRE_FALSE(out.last_frame_ms.has_value());
  REQUIRE(out.fractional_remainder == 0.0);
}

TEST_CASE("a non-finite speed sample does not poison the remainder") {
  LapTrace t = trace_from({0, 1, 2, 3}, 25.0);
  t.speed_mph[1] = std::numeric_limits<double>::quiet_NaN();

  const PlaybackState out = step(playing_at(1, 0.0), t, 50.0, StepParams{});
  REQUIRE(out.current_index == 1);
  REQUIRE(out.fractional_remainder == 0.0);
  REQUIRE(out.is_playing);

  // Moving past the bad sample resumes normal advance.
  const PlaybackState on = step(playing_at(2, 0.0), t, 50.0, StepParams{});
  REQUIRE(on.fractional_remainder == Approx(0.5588).margin(1e-9));
}

TEST_CASE("max_frame_dt_s bounds the per-tick elapsed time") {
  const LapTrace t = trace_from({0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10}, 25.0);
  StepParams p;
  p.max_frame_dt_s = 0.5;
  const PlaybackState out = step(playing_at(0, 0.0), t, 10000.0, p);   // 0.5 s * 11.176
  REQUIRE(out.current_index == 5);
  REQUIRE(out.fractional_remainder == Approx(0.588).margin(1e-9));
}

TEST_CASE("median_sample_spacing") {
  SECTION("odd number of positive gaps") {
    const LapTrace t = trace_from({0, 1, 1, 3, 4}, 1.0);   // gaps 1, 2, 1
    REQUIRE(median_sample_spacing(t).value() == Approx(1.0));
  }
  SECTION("even number of positive gaps averages the middle pair") {
    const LapTrace t = trace_from({0, 1, 3, 3.5, 6.5}, 1.0); // gaps 1, 2, 0.5, 3
    REQUIRE(median_sample_spacing(t).value() == Approx(1.5));
  }
  SECTION("no positive gaps") {
    const LapTrace t = trace_from({2, 2, 2}, 1.0);
    REQUIRE_FALSE(median_sample_spacing(t).has_value());
  }
}

TEST_CASE("resolve_step_params honours the fallback policy") {
  const LapTrace t = trace_from({0, 2, 2, 4, 6}, 1.0);      // gaps 2, 2, 2

  ReplayParams fixed;
  REQUIRE(resolve_step_params(t, fixed).fallback_step_m == Approx(0.7));
  REQUIRE(resolve_step_params(t, fixed).max_frame_dt_s == Approx(0.1));

  ReplayParams median;
  median.fallback = FallbackSpacing::Median;
  REQUIRE(resolve_step_params(t, median).fallback_step_m == Approx(2.0));

  const LapTrace flat = trace_from({5, 5, 5}, 1.0);
  REQUIRE(resolve_step_params(flat, median).fallback_step_m == Approx(0.7));

  ReplayParams bad;
  bad.fallback_step_m = 0.0;
  bad.max_frame_dt_s = -1.0;
  REQUIRE(resolve_step_params(t, bad).fallback_step_m == Approx(0.7));
  REQUIRE(resolve_step_params(t, bad).max_frame_dt_s == Approx(0.1));
}

TEST_CASE("phase reports idle, playing and ended") {
  const LapTrace t = trace_from({0, 1, 2}, 10.0);
  PlaybackState s;
  REQUIRE(phase(s, t) == PlaybackPhase::Idle);
  s.is_playing = true;
  REQUIRE(phase(s, t) == PlaybackPhase::Playing);
  s.is_playing = false;
  s.current_index = 2;
  REQUIRE(phase(s, t) == PlaybackPhase::Ended);
}
