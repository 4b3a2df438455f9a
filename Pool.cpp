#include "Pool.hpp"

#include <glog/logging.h>

Pool::Pool(unsigned workers)
{
  if (workers == 0)
    workers = 1;
  threads_.reserve(workers);
  for (auto i = 0u; i < workers; ++i)
    threads_.emplace_back(&Pool::work_, this);
}

Pool::~Pool()
{
  {
    std::lock_guard<std::mutex> lock(mtx_);
    running_ = false;
  }
  work_cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable())
      t.join();
  }
}

void Pool::submit(std::function<void()> task)
{
  CHECK(task);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    CHECK(running_);
    queue_.push_back(std::move(task));
  }
  work_cv_.notify_one();
}

void Pool::wait()
{
  std::unique_lock<std::mutex> lock(mtx_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && busy_ == 0; });
}

void Pool::work_()
{
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      work_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
      if (!running_ && queue_.empty())
        return;
      task = std::move(queue_.front());
      queue_.pop_front();
      ++busy_;
    }
    task();
    {
      std::lock_guard<std::mutex> lock(mtx_);
      --busy_;
    }
    idle_cv_.notify_all();
  }
}
