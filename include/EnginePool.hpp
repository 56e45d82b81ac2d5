#ifndef HANZI_ENGINE_POOL_HPP
#define HANZI_ENGINE_POOL_HPP

#include "OCREngine.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace hanzi {

/**
 * @brief Bounded set of OCR engine instances shared by worker threads
 *
 * Engines are created on demand by the factory, up to the pool capacity.
 * acquire() blocks while every engine is lent out. An engine is used by one
 * thread at a time, so engines need not be re-entrant.
 *
 * Example usage:
 * @code
 * hanzi::EnginePool pool(4, [&] { return std::make_unique<TesseractEngine>(config); });
 * {
 *     auto lease = pool.acquire();
 *     auto outcome = lease->recognize(image, "chi_sim+eng");
 * } // engine returned here
 * @endcode
 */
class EnginePool {
public:
  using Factory = std::function<std::unique_ptr<OCREngine>()>;

  /**
   * @brief An engine borrowed from the pool, returned on destruction
   */
  class Lease {
  public:
    Lease(EnginePool *pool, std::unique_ptr<OCREngine> engine);
    ~Lease();

    Lease(Lease &&other) noexcept;
    Lease &operator=(Lease &&other) noexcept;
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;

    OCREngine *operator->() const { return m_engine.get(); }
    OCREngine &operator*() const { return *m_engine; }
    explicit operator bool() const { return m_engine != nullptr; }

  private:
    void giveBack();

    EnginePool *m_pool;
    std::unique_ptr<OCREngine> m_engine;
  };

  /**
   * @brief Constructor
   * @param capacity Maximum number of engines (at least 1)
   * @param factory Creates one uninitialized engine
   */
  EnginePool(size_t capacity, Factory factory);

  EnginePool(const EnginePool &) = delete;
  EnginePool &operator=(const EnginePool &) = delete;

  /**
   * @brief Borrow an engine, waiting until one is free
   * @return Empty lease if the factory returned no engine
   */
  Lease acquire();

  size_t capacity() const { return m_capacity; }

  /// Engines created so far
  size_t createdCount() const;

private:
  void release(std::unique_ptr<OCREngine> engine);

  size_t m_capacity;
  Factory m_factory;
  mutable std::mutex m_mutex;
  std::condition_variable m_available;
  std::vector<std::unique_ptr<OCREngine>> m_idle;
  size_t m_created;
};

} // namespace hanzi

#endif // HANZI_ENGINE_POOL_HPP
