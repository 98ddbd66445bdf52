// scheduler.cpp
#include "scheduler.hpp"

#include "collab_errors.hpp"

#include <chrono>

namespace collab {

Timestamp SystemClock::now_ms() const {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

bool TimerHandle::cancel() {
  if (!scheduler_) {
    return false;
  }
  return scheduler_->cancel(id_);
}

bool TimerHandle::active() const { return scheduler_ != nullptr && scheduler_->is_pending(id_); }

TimerHandle Scheduler::schedule_after(uint64_t delay_ms, std::function<void()> fn) {
  return insert(clock_.now_ms() + static_cast<Timestamp>(delay_ms), 0, std::move(fn));
}

TimerHandle Scheduler::schedule_every(uint64_t interval_ms, std::function<void()> fn) {
  if (interval_ms == 0) {
    throw StateError("repeating timer needs a non-zero interval");
  }
  return insert(clock_.now_ms() + static_cast<Timestamp>(interval_ms), interval_ms, std::move(fn));
}

TimerHandle Scheduler::insert(Timestamp deadline, uint64_t interval_ms, std::function<void()> fn) {
  TimerId id = next_id_++;
  Key key{deadline, id};
  queue_.emplace(key, Timer{std::move(fn), interval_ms});
  index_.emplace(id, key);
  return TimerHandle(this, id);
}

bool Scheduler::cancel(TimerId id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  queue_.erase(it->second);
  index_.erase(it);
  return true;
}

bool Scheduler::is_pending(TimerId id) const { return index_.count(id) != 0; }

std::size_t Scheduler::run_due() {
  std::size_t fired = 0;
  while (!queue_.empty()) {
    auto it = queue_.begin();
    Timestamp now = clock_.now_ms();
    if (it->first.first > now) {
      break;
    }

    Key key = it->first;
    Timer timer = std::move(it->second);
    queue_.erase(it);
    index_.erase(key.second);

    std::function<void()> fn;
    if (timer.interval_ms > 0) {
      // Re-arm before running so the callback can cancel itself
      fn = timer.fn;
      Key next{key.first + static_cast<Timestamp>(timer.interval_ms), key.second};
      queue_.emplace(next, std::move(timer));
      index_.emplace(next.second, next);
    } else {
      fn = std::move(timer.fn);
    }

    ++fired;
    if (fn) {
      fn();
    }
  }
  return fired;
}

std::size_t Scheduler::advance(ManualClock &clock, uint64_t ms) {
  Timestamp target = clock.now_ms() + static_cast<Timestamp>(ms);
  std::size_t fired = 0;
  while (true) {
    auto deadline = next_deadline();
    if (!deadline || *deadline > target) {
      break;
    }
    if (*deadline > clock.now_ms()) {
      clock.set(*deadline);
    }
    fired += run_due();
  }
  clock.set(target);
  return fired;
}

std::optional<Timestamp> Scheduler::next_deadline() const {
  if (queue_.empty()) {
    return std::nullopt;
  }
  return queue_.begin()->first.first;
}

} // namespace collab
