#include "TaskRunner.h"
#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>
#include <vector>

TaskRunner::TaskRunner() : now_([]() { return Clock::now(); }) {}

TaskRunner::TaskRunner(NowFunction now) : now_(std::move(now)) {}

TaskId TaskRunner::PostTask(Task task)
{
  return PostDelayedTask(std::move(task), std::chrono::milliseconds(0));
}

TaskId TaskRunner::PostDelayedTask(Task task, std::chrono::milliseconds delay)
{
  TimePoint due = now_() + delay;
  std::lock_guard<std::mutex> lock(mutex_);
  TaskId id = next_id_++;
  tasks_[id] = Entry{due, std::move(task)};
  return id;
}

bool TaskRunner::Cancel(TaskId id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.erase(id) > 0;
}

bool TaskRunner::IsPending(TaskId id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.count(id) > 0;
}

size_t TaskRunner::pending_count() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

size_t TaskRunner::RunPendingTasks()
{
  TimePoint now = now_();

  // Snapshot what is due, so tasks posted from inside a task wait a turn
  std::vector<std::pair<TimePoint, TaskId>> due;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : tasks_)
    {
      if (entry.second.due <= now)
        due.emplace_back(entry.second.due, entry.first);
    }
  }
  std::sort(due.begin(), due.end());

  size_t ran = 0;
  for (const auto &item : due)
  {
    Task task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = tasks_.find(item.second);
      if (it == tasks_.end())
        continue; // cancelled by an earlier task
      task = std::move(it->second.task);
      tasks_.erase(it);
    }

    try
    {
      task();
    }
    catch (const std::exception &e)
    {
      std::cerr << "[TaskRunner] task " << item.second << " threw: " << e.what() << std::endl;
    }
    ++ran;
  }
  return ran;
}

CoalescingTimer::CoalescingTimer(TaskRunner &runner, std::chrono::milliseconds delay)
    : runner_(runner), delay_(delay)
{
}

CoalescingTimer::~CoalescingTimer()
{
  Cancel();
}

void CoalescingTimer::Schedule(std::function<void()> task)
{
  Cancel();
  task_ = std::move(task);
  pending_ = runner_.PostDelayedTask([this]() { Fire(); }, delay_);
}

void CoalescingTimer::Cancel()
{
  if (pending_)
  {
    runner_.Cancel(pending_);
    pending_ = 0;
  }
  task_ = nullptr;
}

void CoalescingTimer::Fire()
{
  pending_ = 0;
  auto task = std::move(task_);
  task_ = nullptr;
  if (task)
    task();
}

RepeatingTimer::RepeatingTimer(TaskRunner &runner) : runner_(runner) {}

RepeatingTimer::~RepeatingTimer()
{
  Stop();
}

void RepeatingTimer::Start(std::chrono::milliseconds initial_delay, std::chrono::milliseconds period,
                           std::function<void()> tick)
{
  Stop();
  period_ = period;
  tick_ = std::move(tick);
  pending_ = runner_.PostDelayedTask([this]() { Fire(); }, initial_delay);
}

void RepeatingTimer::Stop()
{
  if (pending_)
  {
    runner_.Cancel(pending_);
    pending_ = 0;
  }
}

void RepeatingTimer::Fire()
{
  // Re-arm before ticking: the tick may stop or destroy this timer, and the
  // destructor then cancels the next run.
  pending_ = runner_.PostDelayedTask([this]() { Fire(); }, period_);
  auto tick = tick_;
  if (tick)
    tick();
}
