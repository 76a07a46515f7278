#include <lapreplay/trace.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>

namespace lapreplay {

namespace {

constexpr std::size_t kColumns = 9;

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  // Simple CSV: no quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < kColumns) return false;
  return cols[0] == "lap_number" || cols[0] == "lap";
}

std::optional<double> to_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
  return v;
}

struct Row {
  int lap = 0;
  double values[kColumns - 1]{};
};

std::optional<Row> parse_row(const std::vector<std::string>& cols) {
  if (cols.size() < kColumns) return std::nullopt;
  const auto lap = to_double(cols[0]);
  if (!lap || *lap != std::floor(*lap)) return std::nullopt;
  if (*lap < std::numeric_limits<int>::min() || *lap > std::numeric_limits<int>::max())
    return std::nullopt;
  Row r;
  r.lap = static_cast<int>(*lap);
  for (std::size_t k = 1; k < kColumns; ++k) {
    const auto v = to_double(cols[k]);
    if (!v) return std::nullopt;
    r.values[k - 1] = *v;
  }
  return r;
}

void append(LapTrace& t, const Row& r) {
  t.distance_m.push_back(r.values[0]);
  t.speed_mph.push_back(r.values[1]);
  t.lat.push_back(r.values[2]);
  t.lon.push_back(r.values[3]);
  t.heading_deg.push_back(r.values[4]);
  t.lateral_g.push_back(r.values[5]);
  t.longitudinal_g.push_back(r.values[6]);
  t.lap_time_s.push_back(r.values[7]);
}

double lerp(double a, double b, double t) { return a + (b - a) * t; }

double channel_at(const std::vector<double>& ch, std::size_t i0, std::size_t i1, double t) {
  if (i1 >= ch.size()) return i0 < ch.size() ? ch[i0] : 0.0;
  return lerp(ch[i0], ch[i1], t);
}

double norm_deg(double a) {
  a = std::fmod(a, 360.0);
  if (a < 0.0) a += 360.0;
  return a;
}

double lerp_heading_shortest(double a, double b, double t) {
  a = norm_deg(a);
  b = norm_deg(b);
  double d = b - a;
  if (d >  180.0) d -= 360.0;
  if (d < -180.0) d += 360.0;
  return norm_deg(a + d * t);
}

} // namespace

TraceSample sample_at(const LapTrace& trace, std::size_t index, double fraction) {
  TraceSample out{};
  const std::size_t n = trace.size();
  if (n == 0) return out;

  const std::size_t i0 = std::min(index, n - 1);
  const std::size_t i1 = std::min(i0 + 1, n - 1);
  const double t = std::clamp(fraction, 0.0, 1.0);

  out.distance_m     = channel_at(trace.distance_m, i0, i1, t);
  out.speed_mph      = channel_at(trace.speed_mph, i0, i1, t);
  out.lat            = channel_at(trace.lat, i0, i1, t);
  out.lon            = channel_at(trace.lon, i0, i1, t);
  out.lateral_g      = channel_at(trace.lateral_g, i0, i1, t);
  out.longitudinal_g = channel_at(trace.longitudinal_g, i0, i1, t);
  out.lap_time_s     = channel_at(trace.lap_time_s, i0, i1, t);

  const auto& h = trace.heading_deg;
  if (i1 < h.size())      out.heading_deg = lerp_heading_shortest(h[i0], h[i1], t);
  else if (i0 < h.size()) out.heading_deg = h[i0];
  return out;
}

std::optional<double> lap_time_s(const LapTrace& trace) {
  if (trace.lap_time_s.empty()) return std::nullopt;
  return trace.lap_time_s.back();
}

std::optional<std::size_t> best_lap_index(const std::vector<LapTrace>& traces) {
  std::optional<std::size_t> best;
  double best_time = 0.0;
  for (std::size_t i = 0; i < traces.size(); ++i) {
    if (!traces[i].replayable()) continue;
    const auto t = lap_time_s(traces[i]);
    if (!t) continue;
    if (!best || *t < best_time) {
      best = i;
      best_time = *t;
    }
  }
  return best;
}

std::vector<LapTrace> lap_traces_from_csv_stream(std::istream& in) {
  std::vector<LapTrace> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    const auto row = parse_row(cols);
    if (!row) continue;

    auto it = std::find_if(out.begin(), out.end(),
                           [&](const LapTrace& t){ return t.lap_number == row->lap; });
    if (it == out.end()) {
      out.push_back(LapTrace{});
      out.back().lap_number = row->lap;
      it = std::prev(out.end());
    }
    append(*it, *row);
  }
  return out;
}

std::optional<std::vector<LapTrace>> load_lap_traces_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return lap_traces_from_csv_stream(f);
}

} // namespace lapreplay
