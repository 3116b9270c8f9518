#include "BackgroundExecutor.h"
#include <exception>
#include <iostream>
#include <utility>

ThreadExecutor::ThreadExecutor() : worker_(&ThreadExecutor::WorkerLoop, this) {}

ThreadExecutor::~ThreadExecutor()
{
  Shutdown();
}

void ThreadExecutor::Submit(std::function<void()> work)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_)
    {
      std::cerr << "[ThreadExecutor] job submitted after shutdown, dropped" << std::endl;
      return;
    }
    queue_.push_back(std::move(work));
  }
  cv_.notify_one();
}

void ThreadExecutor::Shutdown()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();
}

void ThreadExecutor::WorkerLoop()
{
  for (;;)
  {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty())
        return;
      job = std::move(queue_.front());
      queue_.pop_front();
    }

    try
    {
      job();
    }
    catch (const std::exception &e)
    {
      std::cerr << "[ThreadExecutor] job threw: " << e.what() << std::endl;
    }
  }
}
