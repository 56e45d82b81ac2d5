#ifndef HANZI_WORKER_POOL_HPP
#define HANZI_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace hanzi {

/**
 * @brief Fixed-size pool of worker threads over a FIFO task queue
 *
 * Example usage:
 * @code
 * hanzi::WorkerPool pool(4);
 * auto future = pool.push([] { return recognizeSlice(); });
 * auto result = future.get();
 * pool.join();
 * @endcode
 *
 * join() lets the workers drain the queue before they exit. The destructor
 * joins if that has not happened yet.
 */
class WorkerPool {
public:
  explicit WorkerPool(size_t threadCount);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Queue a task
   * @return Future receiving the task's return value or exception
   */
  template <class Func> auto push(Func &&fn) {
    using ReturnType = std::invoke_result_t<std::decay_t<Func>>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::forward<Func>(fn));
    std::future<ReturnType> future = task->get_future();
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_tasks.emplace([task]() { (*task)(); });
    }
    m_notifier.notify_one();
    return future;
  }

  /**
   * @brief Finish every queued task and stop the workers
   */
  void join();

  size_t threadCount() const;

private:
  using Task = std::function<void()>;

  void threadLoop();
  Task nextTask();

  std::atomic<bool> m_stop{false};
  std::condition_variable m_notifier;
  mutable std::mutex m_mutex; ///< Protects m_workers and m_tasks
  std::vector<std::thread> m_workers;
  std::queue<Task> m_tasks;
};

} // namespace hanzi

#endif // HANZI_WORKER_POOL_HPP
