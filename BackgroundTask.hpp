#pragma once

#include <atomic>
#include <functional>
#include <stop_token>
#include <thread>

// Runs at most one job at a time on a std::jthread. Starting a job joins the
// thread of the previous, finished one, so only a single thread is ever
// held no matter how many jobs run over the object's lifetime.
class BackgroundTask {
 public:
  using Job = std::function<void(std::stop_token)>;

  // False, and the job is dropped, while the previous job is still running.
  bool start(Job job);
  bool busy() const;
  void request_stop();
  // Blocks until the current job, if any, has returned.
  void wait();

 private:
  std::atomic<bool> m_busy = false;
  std::jthread m_thread;
};
