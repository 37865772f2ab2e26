#include <pipedag/thread_pool.hpp>

namespace pipedag {

ThreadPool::ThreadPool(unsigned n) {
  if (n == 0)
    n = std::thread::hardware_concurrency();
  if (n == 0)
    n = 1;
  for (unsigned i = 0; i < n; i++) {
    workers.emplace_back([this] {
      for (;;) {
        std::function<void()> job;
        {
          std::unique_lock<std::mutex> lk(m);
          cv.wait(lk, [&] { return stop || !q.empty(); });
          if (stop && q.empty())
            return;
          job = std::move(q.front());
          q.pop();
          ++active;
        }
        job();
        {
          std::lock_guard<std::mutex> lk(m);
          --active;
          if (q.empty() && active == 0)
            idle_cv.notify_all();
        }
      }
    });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lk(m);
    stop = true;
  }
  cv.notify_all();
  for (auto &t : workers)
    t.join();
}

void ThreadPool::submit(std::function<void()> fn) {
  {
    std::lock_guard<std::mutex> lk(m);
    q.emplace(std::move(fn));
  }
  cv.notify_one();
}

void ThreadPool::wait_idle() {
  std::unique_lock<std::mutex> lk(m);
  idle_cv.wait(lk, [&] { return q.empty() && active == 0; });
}

} // namespace pipedag
