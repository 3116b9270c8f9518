#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

// Runs work off the UI thread. Results come back through TaskRunner::PostTask.
class BackgroundExecutor
{
public:
  virtual ~BackgroundExecutor() = default;

  virtual void Submit(std::function<void()> work) = 0;
};

// A single worker thread draining a FIFO queue. Pending jobs still run on
// shutdown; the destructor joins the worker.
class ThreadExecutor : public BackgroundExecutor
{
public:
  ThreadExecutor();
  ~ThreadExecutor();

  ThreadExecutor(const ThreadExecutor &) = delete;
  ThreadExecutor &operator=(const ThreadExecutor &) = delete;

  void Submit(std::function<void()> work) override;
  void Shutdown();

private:
  void WorkerLoop();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool stopping_ = false;
  std::thread worker_;
};
