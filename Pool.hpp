#ifndef POOL_DOT_HPP
#define POOL_DOT_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace Config {
auto constexpr jobs = 4;
} // namespace Config

// A fixed set of worker threads draining a queue of tasks.  The
// destructor runs whatever is still queued, then joins.

class Pool {
public:
  explicit Pool(unsigned workers);
  ~Pool();

  Pool(Pool const&) = delete;
  Pool& operator=(Pool const&) = delete;

  void submit(std::function<void()> task);

  // Block until the queue is empty and no task is running.
  void wait();

  unsigned size() const { return static_cast<unsigned>(threads_.size()); }

private:
  void work_();

  std::mutex              mtx_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;

  std::deque<std::function<void()>> queue_;

  unsigned busy_{0};
  bool     running_{true};

  std::vector<std::thread> threads_;
};

#endif // POOL_DOT_HPP
