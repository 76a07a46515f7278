#include <lapreplay/frame_driver.hpp>
#include <algorithm>
#include <utility>

namespace lapreplay {

// ---- QueuedFrameScheduler ----

FrameRequestId QueuedFrameScheduler::request_frame(FrameCallback cb) {
  const FrameRequestId id = next_id_++;
  queue_.push_back(Entry{id, std::move(cb)});
  return id;
}

void QueuedFrameScheduler::cancel_frame(FrameRequestId id) {
  queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                              [id](const Entry& e){ return e.id == id; }),
               queue_.end());
}

std::size_t QueuedFrameScheduler::run_frame(double now_ms) {
  // Only ids issued before this frame are due; later ones wait.
  const FrameRequestId due_below = next_id_;
  std::size_t ran = 0;
  for (;;) {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [due_below](const Entry& e){ return e.id < due_below; });
    if (it == queue_.end()) break;
    FrameCallback cb = std::move(it->cb);
    queue_.erase(it);
    cb(now_ms);
    ++ran;
  }
  return ran;
}

// ---- FrameDriver ----

FrameDriver::FrameDriver(ReplayEngine& engine, FrameScheduler& scheduler, ViewBuffer* out)
  : engine_(engine), scheduler_(scheduler), out_(out) {
  publish_();
  sync_schedule_();
}

FrameDriver::~FrameDriver() {
  cancel_pending_();
}

void FrameDriver::bind(const LapTrace& trace) {
  // A stale frame must never tick the new trace.
  cancel_pending_();
  engine_.bind(trace);
  publish_();
}

void FrameDriver::play() {
  engine_.play();
  publish_();
  sync_schedule_();
}

void FrameDriver::pause() {
  engine_.pause();
  publish_();
  sync_schedule_();
}

void FrameDriver::toggle_play() {
  engine_.toggle_play();
  publish_();
  sync_schedule_();
}

void FrameDriver::seek(std::int64_t target_index) {
  engine_.seek(target_index);
  publish_();
}

bool FrameDriver::set_speed(double multiplier) {
  const bool ok = engine_.set_speed(multiplier);
  if (ok) publish_();
  return ok;
}

void FrameDriver::reset() {
  engine_.reset();
  publish_();
  sync_schedule_();
}

void FrameDriver::on_frame_(double now_ms) {
  pending_ = 0;
  ++frames_run_;
  engine_.tick(now_ms);
  publish_();
  sync_schedule_();
}

void FrameDriver::sync_schedule_() {
  if (engine_.state().is_playing) {
    if (pending_ == 0) {
      pending_ = scheduler_.request_frame([this](double now_ms){ on_frame_(now_ms); });
    }
  } else {
    cancel_pending_();
  }
}

void FrameDriver::cancel_pending_() {
  if (pending_ != 0) {
    scheduler_.cancel_frame(pending_);
    pending_ = 0;
  }
}

void FrameDriver::publish_() {
  if (out_) out_->publish(engine_.view());
}

} // namespace lapreplay
