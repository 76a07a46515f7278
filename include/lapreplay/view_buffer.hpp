#pragma once
#include <atomic>
#include <cstdint>
#include <lapreplay/playback.hpp>

namespace lapreplay {

// Latest-only value slot: the writer overwrites, readers keep a cursor and
// only see a value when the sequence moved past it.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    data_ = v;
    seq_.fetch_add(1, std::memory_order_release);
  }

  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    const auto s = seq_.load(std::memory_order_acquire);
    if (s != cursor) {
      out = data_;
      cursor = s;
      return true;
    }
    return false;
  }

private:
  T data_{};
  std::atomic<std::uint64_t> seq_{0};
};

using ViewBuffer = LatestBuffer<PlaybackView>;

} // namespace lapreplay
