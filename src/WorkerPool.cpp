#include "WorkerPool.hpp"

namespace hanzi {

WorkerPool::WorkerPool(size_t threadCount) {
  if (threadCount == 0) {
    threadCount = 1;
  }
  for (size_t i = 0; i < threadCount; ++i) {
    m_workers.emplace_back(&WorkerPool::threadLoop, this);
  }
}

WorkerPool::~WorkerPool() {
  if (!m_workers.empty()) {
    join();
  }
}

void WorkerPool::join() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stop = true;
  }
  m_notifier.notify_all();

  for (auto &thread : m_workers) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  m_workers.clear();
}

size_t WorkerPool::threadCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_workers.size();
}

void WorkerPool::threadLoop() {
  while (true) {
    Task task = nextTask();

    if (task) {
      task();
    } else if (m_stop) {
      // Queue drained and stop requested
      break;
    }
  }
}

WorkerPool::Task WorkerPool::nextTask() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_notifier.wait(lock, [this]() { return !m_tasks.empty() || m_stop; });

  if (m_tasks.empty()) {
    return {};
  }

  Task task = std::move(m_tasks.front());
  m_tasks.pop();
  return task;
}

} // namespace hanzi
