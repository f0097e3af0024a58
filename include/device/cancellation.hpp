#pragma once
/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for long-running device sequences.
 *
 * A CancellationSource owns the flag; tokens are cheap copies sharing it.
 * Operations poll `is_cancelled()` at their safe checkpoints only, so a
 * cancel request never interrupts a primitive command half-way.
 */

#include <atomic>
#include <memory>

namespace elworkbench::device
{

class CancellationToken
{
  public:
    /// A token that can never be cancelled.
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept
    {
        return m_flag && m_flag->load(std::memory_order_acquire);
    }

  private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : m_flag(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> m_flag;
};

class CancellationSource
{
  public:
    CancellationSource() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { m_flag->store(true, std::memory_order_release); }
    [[nodiscard]] bool is_cancelled() const noexcept { return m_flag->load(std::memory_order_acquire); }
    [[nodiscard]] CancellationToken token() const { return CancellationToken(m_flag); }

  private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace elworkbench::device
