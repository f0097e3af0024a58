#pragma once

/*******************************************************************************
 * @file RecursionGuard.hpp
 * @brief Thread-local RAII marker used to refuse re-entrant calls on an object.
 *
 * JsonConfig pushes `this` while a user callback runs; a callback that calls
 * back into the same JsonConfig sees `is_recursing(this)` and is refused
 * instead of deadlocking on the instance's own mutex.
 ******************************************************************************/

#include <algorithm>
#include <vector>

namespace elworkbench::utils
{

inline thread_local std::vector<const void *> g_recursion_stack;

class RecursionGuard
{
  public:
    // May throw std::bad_alloc on push.
    explicit RecursionGuard(const void *key) : key_(key) { g_recursion_stack.push_back(key_); }

    ~RecursionGuard() noexcept
    {
        if (!g_recursion_stack.empty() && g_recursion_stack.back() == key_)
            g_recursion_stack.pop_back();
        else
            std::erase(g_recursion_stack, key_); // out-of-order destruction
    }

    RecursionGuard(const RecursionGuard &) = delete;
    RecursionGuard &operator=(const RecursionGuard &) = delete;
    RecursionGuard(RecursionGuard &&) = delete;
    RecursionGuard &operator=(RecursionGuard &&) = delete;

    [[nodiscard]] static bool is_recursing(const void *key) noexcept
    {
        return std::find(g_recursion_stack.crbegin(), g_recursion_stack.crend(), key) !=
               g_recursion_stack.crend();
    }

  private:
    const void *key_;
};

} // namespace elworkbench::utils
