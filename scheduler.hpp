// scheduler.hpp
#ifndef COLLAB_SCHEDULER_HPP
#define COLLAB_SCHEDULER_HPP

#include "collab_types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace collab {

/// Source of wall-clock time in epoch milliseconds.
class Clock {
public:
  virtual ~Clock() = default;
  virtual Timestamp now_ms() const = 0;
};

/// std::chrono::system_clock backed clock.
class SystemClock : public Clock {
public:
  Timestamp now_ms() const override;
};

/// Clock that only moves when told to. Used to drive virtual time in tests.
class ManualClock : public Clock {
public:
  explicit ManualClock(Timestamp start = 0) : now_(start) {}

  Timestamp now_ms() const override { return now_; }
  void set(Timestamp t) { now_ = t; }
  void advance(uint64_t ms) { now_ += static_cast<Timestamp>(ms); }

private:
  Timestamp now_;
};

using TimerId = uint64_t;

class Scheduler;

/// Handle returned by Scheduler. Copyable; cancelling twice is harmless.
class TimerHandle {
public:
  TimerHandle() = default;
  TimerHandle(Scheduler *scheduler, TimerId id) : scheduler_(scheduler), id_(id) {}

  /// Cancels the timer if it is still pending. Returns true if it was.
  bool cancel();

  /// True while the timer is scheduled (for repeating timers: until cancelled).
  bool active() const;

  TimerId id() const { return id_; }
  explicit operator bool() const { return active(); }

private:
  Scheduler *scheduler_ = nullptr;
  TimerId id_ = 0;
};

/// Timer queue over a Clock.
///
/// Nothing fires on its own: the owner of the event loop calls run_due()
/// (or advance() with a ManualClock in tests). Callbacks run on the caller's
/// thread, one at a time, in deadline order; ties fire in scheduling order.
/// A callback may schedule or cancel timers, including its own.
class Scheduler {
public:
  explicit Scheduler(Clock &clock) : clock_(clock) {}

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  /// Runs `fn` once, `delay_ms` after now.
  TimerHandle schedule_after(uint64_t delay_ms, std::function<void()> fn);

  /// Runs `fn` every `interval_ms`, first after one interval. Interval must be > 0.
  TimerHandle schedule_every(uint64_t interval_ms, std::function<void()> fn);

  bool cancel(TimerId id);
  bool is_pending(TimerId id) const;

  /// Fires every timer whose deadline is <= clock.now_ms(). Returns the number fired.
  std::size_t run_due();

  /// Moves `clock` forward by `ms`, firing timers at their own deadlines on the way.
  /// `clock` must be the clock this scheduler was built with.
  std::size_t advance(ManualClock &clock, uint64_t ms);

  std::optional<Timestamp> next_deadline() const;
  std::size_t pending_count() const { return queue_.size(); }

  Clock &clock() const { return clock_; }

private:
  struct Timer {
    std::function<void()> fn;
    uint64_t interval_ms; // 0 = one-shot
  };

  // (deadline, id) keeps deadline order with scheduling order for ties
  using Key = std::pair<Timestamp, TimerId>;

  TimerHandle insert(Timestamp deadline, uint64_t interval_ms, std::function<void()> fn);

  Clock &clock_;
  TimerId next_id_ = 1;
  std::map<Key, Timer> queue_;
  std::unordered_map<TimerId, Key> index_;
};

} // namespace collab

#endif // COLLAB_SCHEDULER_HPP
