#pragma once
#include <string>

namespace lapreplay {

// "812 m" below one kilometre, "1.23 km" from there on. "--" for non-finite input.
std::string format_distance(double metres);

// Lap clock "m:ss.s", e.g. 65.3 -> "1:05.3". "--" for negative or non-finite input.
std::string format_lap_time(double seconds);

// Playback multiplier label, e.g. 0.5 -> "0.5x", 2 -> "2x".
std::string format_multiplier(double multiplier);

// Where speed sits inside [min_speed, max_speed], clamped to [0,1].
// An empty range maps everything to 0.
double speed_fraction(double speed, double min_speed, double max_speed);

} // namespace lapreplay
