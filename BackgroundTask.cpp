#include "BackgroundTask.hpp"

#include <exception>
#include <format>
#include <utility>

#include "IOManager.hpp"

bool BackgroundTask::start(Job job) {
  bool expected = false;
  if (!m_busy.compare_exchange_strong(expected, true)) return false;

  // The previous job cleared m_busy as its last step, so this returns
  // almost at once.
  wait();

  m_thread = std::jthread(
      [this, job = std::move(job)](const std::stop_token& stoken) {
        try {
          job(stoken);
        } catch (const std::exception& e) {
          IOManager::log(
              std::format("CRITICAL ERROR in background job: {}", e.what()));
        }
        m_busy = false;
      });
  return true;
}

bool BackgroundTask::busy() const { return m_busy; }

void BackgroundTask::request_stop() { m_thread.request_stop(); }

void BackgroundTask::wait() {
  if (m_thread.joinable()) m_thread.join();
}
