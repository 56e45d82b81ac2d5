#include "EnginePool.hpp"

#include <utility>

namespace hanzi {

EnginePool::Lease::Lease(EnginePool *pool, std::unique_ptr<OCREngine> engine)
    : m_pool(pool), m_engine(std::move(engine)) {}

EnginePool::Lease::~Lease() { giveBack(); }

EnginePool::Lease::Lease(Lease &&other) noexcept
    : m_pool(other.m_pool), m_engine(std::move(other.m_engine)) {
  other.m_pool = nullptr;
}

EnginePool::Lease &EnginePool::Lease::operator=(Lease &&other) noexcept {
  if (this != &other) {
    giveBack();
    m_pool = other.m_pool;
    m_engine = std::move(other.m_engine);
    other.m_pool = nullptr;
  }
  return *this;
}

void EnginePool::Lease::giveBack() {
  if (m_pool != nullptr && m_engine) {
    m_pool->release(std::move(m_engine));
  }
  m_pool = nullptr;
}

EnginePool::EnginePool(size_t capacity, Factory factory)
    : m_capacity(capacity > 0 ? capacity : 1), m_factory(std::move(factory)),
      m_created(0) {}

EnginePool::Lease EnginePool::acquire() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_available.wait(lock,
                   [this]() { return !m_idle.empty() || m_created < m_capacity; });

  if (!m_idle.empty()) {
    std::unique_ptr<OCREngine> engine = std::move(m_idle.back());
    m_idle.pop_back();
    return Lease(this, std::move(engine));
  }

  // Reserve the slot, then build the engine without holding the lock
  ++m_created;
  lock.unlock();

  std::unique_ptr<OCREngine> engine;
  try {
    engine = m_factory();
  } catch (...) {
    lock.lock();
    --m_created;
    m_available.notify_one();
    throw;
  }

  if (!engine) {
    lock.lock();
    --m_created;
    m_available.notify_one();
  }
  return Lease(this, std::move(engine));
}

size_t EnginePool::createdCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_created;
}

void EnginePool::release(std::unique_ptr<OCREngine> engine) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_idle.push_back(std::move(engine));
  }
  m_available.notify_one();
}

} // namespace hanzi
