#include "EnginePool.hpp"
#include "WorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static int g_failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition) {
    g_failures++;
  }
}

namespace {

class CountingEngine : public hanzi::OCREngine {
public:
  explicit CountingEngine(int id) : m_id(id) {}

  hanzi::EngineErrorKind initialize(const std::string &,
                                    std::string &) override {
    return hanzi::EngineErrorKind::None;
  }

  hanzi::EngineOutcome recognize(const cv::Mat &,
                                 const std::string &) override {
    hanzi::EngineOutcome outcome;
    outcome.success = true;
    outcome.text = std::to_string(m_id);
    return outcome;
  }

private:
  int m_id;
};

} // anonymous namespace

int main() {
  std::cout << "=== Test WorkerPool and EnginePool ===" << std::endl
            << std::endl;

  {
    std::cout << "WorkerPool:" << std::endl;
    hanzi::WorkerPool pool(4);
    check(pool.threadCount() == 4, "four workers started");

    std::atomic<int> counter{0};
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 100; ++i) {
      futures.push_back(pool.push([&counter, i]() {
        counter++;
        return i * i;
      }));
    }

    bool valuesOk = true;
    for (int i = 0; i < 100; ++i) {
      valuesOk = valuesOk && futures[static_cast<size_t>(i)].get() == i * i;
    }
    check(valuesOk, "every future carries its task's result");
    check(counter == 100, "every task ran once");

    auto failing = pool.push([]() -> int {
      throw std::runtime_error("task failed");
    });
    bool rethrown = false;
    try {
      failing.get();
    } catch (const std::runtime_error &) {
      rethrown = true;
    }
    check(rethrown, "task exceptions reach the future");

    std::atomic<int> drained{0};
    for (int i = 0; i < 20; ++i) {
      pool.push([&drained]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        drained++;
      });
    }
    pool.join();
    check(drained == 20, "join() finishes queued tasks");
    check(pool.threadCount() == 0, "workers stopped after join()");
  }

  {
    std::cout << "EnginePool:" << std::endl;
    std::atomic<int> created{0};
    hanzi::EnginePool pool(2, [&created]() {
      return std::make_unique<CountingEngine>(++created);
    });

    check(pool.createdCount() == 0, "engines are created lazily");

    auto first = pool.acquire();
    auto second = pool.acquire();
    check(first && second && pool.createdCount() == 2,
          "two leases create two engines");
    check(first->recognize(cv::Mat(), "eng").text !=
              second->recognize(cv::Mat(), "eng").text,
          "leases hold distinct engines");

    auto waiting = std::async(std::launch::async, [&pool]() {
      auto lease = pool.acquire();
      return lease->recognize(cv::Mat(), "eng").text;
    });
    check(waiting.wait_for(std::chrono::milliseconds(100)) ==
              std::future_status::timeout,
          "third acquire blocks while both engines are lent");

    std::string firstId = first->recognize(cv::Mat(), "eng").text;
    {
      auto released = std::move(first);
    }
    check(waiting.wait_for(std::chrono::seconds(5)) ==
              std::future_status::ready,
          "returning a lease wakes a waiter");
    check(waiting.get() == firstId, "waiter receives the returned engine");
    check(pool.createdCount() == 2, "no engine beyond capacity");
  }

  std::cout << std::endl
            << (g_failures == 0 ? "All tests passed" : "Some tests FAILED")
            << std::endl;
  return g_failures == 0 ? 0 : 1;
}
