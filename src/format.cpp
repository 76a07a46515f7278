#include <lapreplay/format.hpp>
#include <cmath>
#include <cstdio>

namespace lapreplay {

std::string format_distance(double metres) {
  if (!std::isfinite(metres)) return "--";
  char buf[32];
  if (metres >= 1000.0) std::snprintf(buf, sizeof(buf), "%.2f km", metres / 1000.0);
  else                  std::snprintf(buf, sizeof(buf), "%.0f m", std::round(metres));
  return buf;
}

std::string format_lap_time(double seconds) {
  // Upper bound keeps seconds * 10 inside long long.
  if (seconds < 0.0 || !std::isfinite(seconds) || seconds > 1e15) return "--";
  // Round to tenths first so 59.96 reads 1:00.0, not 0:60.0.
  const long long tenths = std::llround(seconds * 10.0);
  const long long minutes = tenths / 600;
  const long long rem = tenths % 600;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lld:%02lld.%lld", minutes, rem / 10, rem % 10);
  return buf;
}

std::string format_multiplier(double multiplier) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%gx", multiplier);
  return buf;
}

double speed_fraction(double speed, double min_speed, double max_speed) {
  const double range = max_speed - min_speed;
  if (!(range > 0.0)) return 0.0;
  const double t = (speed - min_speed) / range;
  return t < 0.0 ? 0.0 : (t > 1.0 ? 1.0 : t);
}

} // namespace lapreplay
