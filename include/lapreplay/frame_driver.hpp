#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>
#include <lapreplay/replay_engine.hpp>
#include <lapreplay/view_buffer.hpp>

namespace lapreplay {

using FrameCallback = std::function<void(double now_ms)>;
using FrameRequestId = std::uint64_t;

// Host animation-frame source. Ids are never 0.
class FrameScheduler {
public:
  virtual ~FrameScheduler() = default;
  virtual FrameRequestId request_frame(FrameCallback cb) = 0;
  virtual void cancel_frame(FrameRequestId id) = 0;
};

// Queue of pending frame callbacks, flushed once per host frame.
// Callbacks requested while a frame runs wait for the next frame.
class QueuedFrameScheduler : public FrameScheduler {
public:
  FrameRequestId request_frame(FrameCallback cb) override;
  void cancel_frame(FrameRequestId id) override;

  // Runs the callbacks pending at entry; returns how many ran.
  std::size_t run_frame(double now_ms);
  std::size_t pending() const { return queue_.size(); }

private:
  struct Entry {
    FrameRequestId id;
    FrameCallback cb;
  };
  std::vector<Entry> queue_;
  FrameRequestId next_id_{1};
};

// Drives a ReplayEngine from a FrameScheduler: while playing exactly one
// frame request is outstanding; pause, end of trace, rebind and destruction
// cancel it. Every control call and tick publishes the view.
class FrameDriver {
public:
  FrameDriver(ReplayEngine& engine, FrameScheduler& scheduler, ViewBuffer* out = nullptr);
  ~FrameDriver();
  FrameDriver(const FrameDriver&) = delete;
  FrameDriver& operator=(const FrameDriver&) = delete;

  void bind(const LapTrace& trace);
  void bind(LapTrace&&) = delete;

  void play();
  void pause();
  void toggle_play();
  void seek(std::int64_t target_index);
  bool set_speed(double multiplier);
  void reset();

  bool frame_pending() const { return pending_ != 0; }
  std::uint64_t frames_run() const { return frames_run_; }
  const ReplayEngine& engine() const { return engine_; }

private:
  void on_frame_(double now_ms);
  void sync_schedule_();
  void cancel_pending_();
  void publish_();

  ReplayEngine& engine_;
  FrameScheduler& scheduler_;
  ViewBuffer* out_;
  FrameRequestId pending_{0};
  std::uint64_t frames_run_{0};
};

} // namespace lapreplay
