#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

using TaskId = uint64_t;

/**
 * The UI thread's task queue. The owner pumps it once per frame with
 * RunPendingTasks(); posting and cancelling are safe from any thread, tasks
 * always run on the pumping thread.
 */
class TaskRunner
{
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using Task = std::function<void()>;
  using NowFunction = std::function<TimePoint()>;

  TaskRunner();
  // Clock injection for tests.
  explicit TaskRunner(NowFunction now);

  // Runs on the next pump.
  TaskId PostTask(Task task);
  TaskId PostDelayedTask(Task task, std::chrono::milliseconds delay);

  // Returns false if the task already ran or was never posted.
  bool Cancel(TaskId id);
  bool IsPending(TaskId id) const;

  // Runs every task due now, in due-time then posting order. Tasks posted
  // while pumping wait for the next pump. Returns the number of tasks run.
  size_t RunPendingTasks();

  size_t pending_count() const;
  TimePoint now() const { return now_(); }

private:
  struct Entry
  {
    TimePoint due;
    Task task;
  };

  NowFunction now_;
  mutable std::mutex mutex_;
  TaskId next_id_ = 1;
  std::map<TaskId, Entry> tasks_;
};

// Single-slot delayed task: scheduling again replaces the pending one.
class CoalescingTimer
{
public:
  CoalescingTimer(TaskRunner &runner, std::chrono::milliseconds delay);
  ~CoalescingTimer();

  CoalescingTimer(const CoalescingTimer &) = delete;
  CoalescingTimer &operator=(const CoalescingTimer &) = delete;

  void Schedule(std::function<void()> task);
  void Cancel();
  bool is_pending() const { return pending_ != 0; }

private:
  void Fire();

  TaskRunner &runner_;
  std::chrono::milliseconds delay_;
  TaskId pending_ = 0;
  std::function<void()> task_;
};

// Periodic task. Destroying or stopping it guarantees no further ticks, even
// when that happens from inside a tick.
class RepeatingTimer
{
public:
  explicit RepeatingTimer(TaskRunner &runner);
  ~RepeatingTimer();

  RepeatingTimer(const RepeatingTimer &) = delete;
  RepeatingTimer &operator=(const RepeatingTimer &) = delete;

  void Start(std::chrono::milliseconds initial_delay, std::chrono::milliseconds period, std::function<void()> tick);
  void Stop();
  bool is_running() const { return pending_ != 0; }

private:
  void Fire();

  TaskRunner &runner_;
  std::chrono::milliseconds period_{0};
  TaskId pending_ = 0;
  std::function<void()> tick_;
};
