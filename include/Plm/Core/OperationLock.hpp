#pragma once

#include <chrono>             // std::chrono::steady_clock
#include <condition_variable> // std::condition_variable
#include <set>                // std::set

#include "../Utils/Types.hpp"

namespace plm::core::plugin {
  /**
   * @enum ContentionPolicy
   * @brief What happens to a lifecycle operation on a plugin that is already busy.
   */
  enum class ContentionPolicy : utils::types::u8 {
    Queue,  ///< Wait, served in arrival order.
    Reject, ///< Fail immediately with InvalidState.
  };

  /**
   * @class OperationLock
   * @brief FIFO ticket lock guarding one plugin's lifecycle operations.
   *
   * Unlike std::mutex it may be released from a thread other than the one that
   * acquired it, which lets an abandoned install finish (and unlock) on its
   * worker thread after the caller has stopped waiting.
   */
  class OperationLock {
   public:
    OperationLock()                                    = default;
    OperationLock(const OperationLock&)                = delete;
    OperationLock(OperationLock&&)                     = delete;
    fn operator=(const OperationLock&)->OperationLock& = delete;
    fn operator=(OperationLock&&)->OperationLock&      = delete;
    ~OperationLock()                                   = default;

    fn acquire() -> void;

    /**
     * @brief Waits in the queue until the deadline at most.
     * @return false if the deadline passed first; the caller's place in the
     *         queue is given up and skipped when its turn comes.
     */
    [[nodiscard]] fn acquireUntil(std::chrono::steady_clock::time_point deadline) -> bool;

    /// Succeeds only if nobody holds the lock and nobody is queued for it.
    [[nodiscard]] fn tryAcquire() -> bool;

    fn release() -> void;

    [[nodiscard]] fn isHeld() const -> bool;

   private:
    // Advances past tickets whose owners stopped waiting. Requires m_mutex.
    fn skipAbandoned() -> void;

    mutable utils::types::Mutex m_mutex;
    std::condition_variable     m_released;
    utils::types::u64           m_nextTicket = 0;
    utils::types::u64           m_nowServing = 0;
    std::set<utils::types::u64> m_abandoned;
  };
} // namespace plm::core::plugin
