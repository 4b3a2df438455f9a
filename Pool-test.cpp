#include "Pool.hpp"

#include <atomic>
#include <chrono>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    Pool pool{4};
    CHECK_EQ(pool.size(), 4u);

    std::atomic<int> done{0};
    for (auto i = 0; i < 100; ++i)
      pool.submit([&done] { ++done; });
    pool.wait();
    CHECK_EQ(done.load(), 100);

    // Reusable after a wait.
    pool.submit([&done] { done += 10; });
    pool.wait();
    CHECK_EQ(done.load(), 110);
  }

  // Never more than the worker count at once.
  {
    Pool             pool{3};
    std::atomic<int> running{0};
    std::atomic<int> most{0};
    for (auto i = 0; i < 30; ++i) {
      pool.submit([&running, &most] {
        auto const now = ++running;
        auto       m   = most.load();
        while (now > m && !most.compare_exchange_weak(m, now))
          ;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --running;
      });
    }
    pool.wait();
    CHECK_LE(most.load(), 3);
    CHECK_GE(most.load(), 1);
  }

  // Zero means one; queued work still runs at destruction.
  std::atomic<int> late{0};
  {
    Pool pool{0};
    CHECK_EQ(pool.size(), 1u);
    for (auto i = 0; i < 5; ++i)
      pool.submit([&late] { ++late; });
  }
  CHECK_EQ(late.load(), 5);
}
