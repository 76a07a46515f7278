#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace lapreplay {

// One recorded lap: index-aligned channels, read-only once loaded.
struct LapTrace {
  int lap_number = 0;
  std::vector<double> distance_m;      // cumulative, non-decreasing
  std::vector<double> speed_mph;
  std::vector<double> lat;
  std::vector<double> lon;
  std::vector<double> heading_deg;
  std::vector<double> lateral_g;
  std::vector<double> longitudinal_g;
  std::vector<double> lap_time_s;      // elapsed lap time per sample

  // Samples usable for stepping (distance and speed both present).
  std::size_t size() const {
    return distance_m.size() < speed_mph.size() ? distance_m.size() : speed_mph.size();
  }
  bool replayable() const { return size() >= 2; }
};

// Every channel at one (possibly fractional) position along the trace.
struct TraceSample {
  double distance_m = 0.0;
  double speed_mph = 0.0;
  double lat = 0.0;
  double lon = 0.0;
  double heading_deg = 0.0;
  double lateral_g = 0.0;
  double longitudinal_g = 0.0;
  double lap_time_s = 0.0;
};

// Interpolates between index and index+1 by fraction in [0,1).
// Channels that are shorter than the trace read as 0.
TraceSample sample_at(const LapTrace& trace, std::size_t index, double fraction = 0.0);

// Total lap time (last lap_time_s sample), or nullopt if the channel is empty.
std::optional<double> lap_time_s(const LapTrace& trace);

// Lap with the shortest lap time among replayable traces.
std::optional<std::size_t> best_lap_index(const std::vector<LapTrace>& traces);

// Stream-based CSV loader (test-friendly; no filesystem required).
// Columns: lap_number,distance_m,speed_mph,lat,lon,heading_deg,lateral_g,longitudinal_g,lap_time_s
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
// Rows are grouped per lap_number, laps ordered by first appearance.
std::vector<LapTrace> lap_traces_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<LapTrace>> load_lap_traces_csv(const std::string& path);

} // namespace lapreplay
