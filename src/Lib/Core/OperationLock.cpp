#include <Plm/Core/OperationLock.hpp>

namespace plm::core::plugin {
  using namespace utils::types;

  fn OperationLock::acquire() -> void {
    UniqueLock lock(m_mutex);

    const u64 ticket = m_nextTicket++;

    m_released.wait(lock, [this, ticket] { return m_nowServing == ticket; });
  }

  fn OperationLock::acquireUntil(const std::chrono::steady_clock::time_point deadline) -> bool {
    UniqueLock lock(m_mutex);

    const u64 ticket = m_nextTicket++;

    if (m_released.wait_until(lock, deadline, [this, ticket] { return m_nowServing == ticket; }))
      return true;

    m_abandoned.insert(ticket);

    return false;
  }

  fn OperationLock::tryAcquire() -> bool {
    const LockGuard lock(m_mutex);

    if (m_nextTicket != m_nowServing)
      return false;

    ++m_nextTicket;
    return true;
  }

  fn OperationLock::release() -> void {
    {
      const LockGuard lock(m_mutex);
      ++m_nowServing;
      skipAbandoned();
    }

    m_released.notify_all();
  }

  fn OperationLock::skipAbandoned() -> void {
    while (!m_abandoned.empty() && *m_abandoned.begin() == m_nowServing) {
      m_abandoned.erase(m_abandoned.begin());
      ++m_nowServing;
    }
  }

  fn OperationLock::isHeld() const -> bool {
    const LockGuard lock(m_mutex);
    return m_nextTicket != m_nowServing;
  }
} // namespace plm::core::plugin
