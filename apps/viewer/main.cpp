#include <raylib.h>
#include <cstdlib>
#include <string>
#include <vector>
#include <lapreplay/trace.hpp>
#include <lapreplay/viewer/app.hpp>

using namespace lapreplay;

// Usage: lapreplay_viewer [trace.csv] [lap_number]
int main(int argc, char** argv) {
  const std::string path = argc > 1 ? argv[1] : "lap_trace.csv";

  auto laps = load_lap_traces_csv(path);
  if (!laps) {
    TraceLog(LOG_ERROR, "REPLAY: cannot open %s", path.c_str());
    return 1;
  }
  if (laps->empty()) {
    TraceLog(LOG_ERROR, "REPLAY: %s holds no valid rows", path.c_str());
    return 1;
  }
  TraceLog(LOG_INFO, "REPLAY: loaded %zu laps from %s", laps->size(), path.c_str());

  // Requested lap, else the fastest replayable one.
  std::size_t initial = best_lap_index(*laps).value_or(0);
  if (argc > 2) {
    const int wanted = std::atoi(argv[2]);
    bool found = false;
    for (std::size_t i = 0; i < laps->size(); ++i) {
      if ((*laps)[i].lap_number == wanted) { initial = i; found = true; break; }
    }
    if (!found) TraceLog(LOG_WARNING, "REPLAY: lap %d not in %s, using lap %d",
                         wanted, path.c_str(), (*laps)[initial].lap_number);
  }

  ViewerApp app(*laps, initial);
  return app.run();
}
