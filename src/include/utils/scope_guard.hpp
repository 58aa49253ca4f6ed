/**
 * @file scope_guard.hpp
 * @brief ScopeGuard: run a cleanup action when the enclosing scope ends.
 *
 * The handshake code pairs every acquired OS resource with a guard and
 * dismisses it once ownership has moved elsewhere:
 *
 * @code
 * int fd = ::open(path, O_RDONLY | O_CLOEXEC);
 * auto close_fd = agentgate::basics::make_scope_guard([fd]() { ::close(fd); });
 * read_secret(fd); // may throw; fd is closed either way
 * @endcode
 *
 * The action runs at most once: on destruction, or earlier through invoke().
 * A std::exception escaping the action is written to stderr and dropped, so
 * a guard never throws out of a destructor. Guards are move-only and not
 * thread-safe.
 */
#pragma once

#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace agentgate::basics
{

template <typename Action>
requires std::invocable<Action &>
class ScopeGuard
{
    static_assert(!std::is_reference_v<Action>, "ScopeGuard stores its action by value");

  public:
    explicit ScopeGuard(Action action) noexcept(std::is_nothrow_move_constructible_v<Action>)
        : m_action(std::move(action))
    {
    }

    /// The moved-from guard is disarmed.
    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Action>)
        : m_action(std::move(other.m_action)), m_armed(std::exchange(other.m_armed, false))
    {
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    ~ScopeGuard() noexcept { invoke(); }

    /// True while the action is still pending.
    [[nodiscard]] explicit operator bool() const noexcept { return m_armed; }

    /// Cancels the action.
    void dismiss() noexcept { m_armed = false; }

    /// Runs the action now if it is still pending.
    void invoke() noexcept
    {
        if (!std::exchange(m_armed, false))
            return;
        try
        {
            std::invoke(m_action);
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "[ScopeGuard] cleanup action threw: %s\n", e.what());
        }
    }

  private:
    Action m_action;
    bool m_armed{true};
};

/// Builds a ScopeGuard holding a decayed copy of @p action.
template <typename F>
[[nodiscard]] ScopeGuard<std::decay_t<F>> make_scope_guard(F &&action)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(action));
}

} // namespace agentgate::basics
