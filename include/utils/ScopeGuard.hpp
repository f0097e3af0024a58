#ifndef ELWORKBENCH_SCOPE_GUARD_HPP
#define ELWORKBENCH_SCOPE_GUARD_HPP

#include <type_traits>
#include <utility>

namespace elworkbench::utils
{

/**
 * @brief Runs a callable when the guard leaves scope unless dismissed.
 *
 * Used for cleanup that must happen on every exit path: logger shutdown in
 * main(), turning an SMU output off when a measurement sequence aborts,
 * removing a temp file after a failed write.
 */
template <typename F>
class ScopeGuard
{
  public:
    explicit ScopeGuard(F &&f) : m_func(std::move(f)), m_active(true) {}

    ScopeGuard(ScopeGuard &&rhs) noexcept : m_func(std::move(rhs.m_func)), m_active(rhs.m_active)
    {
        rhs.dismiss();
    }

    ~ScopeGuard()
    {
        if (m_active)
            m_func();
    }

    void dismiss() noexcept { m_active = false; }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

  private:
    F m_func;
    bool m_active;
};

template <typename F>
ScopeGuard<std::decay_t<F>> make_scope_guard(F &&f)
{
    return ScopeGuard<std::decay_t<F>>(std::decay_t<F>(std::forward<F>(f)));
}

} // namespace elworkbench::utils

#endif // ELWORKBENCH_SCOPE_GUARD_HPP
