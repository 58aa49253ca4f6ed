/**
 * @file result.hpp
 * @brief Result<T, E>: a success value or an expected failure reason.
 *
 * Handshake rejections, for example, are outcomes the caller handles in the
 * normal flow, so they come back as a Result instead of an exception. Transport
 * failures and broken invariants still throw.
 *
 * @code
 * HandshakeResult r = handler.run();
 * if (r.is_error())
 * {
 *     LOGGER_DEBUG("rejected: {}", to_string(r.error()));
 *     return;
 * }
 * ChannelPtr channel = std::move(r).content();
 * @endcode
 *
 * A Result is move-only and not thread-safe. Accessing the wrong side throws
 * std::logic_error.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace agentgate
{

template <typename T, typename E>
class Result
{
    static_assert(std::is_enum_v<E>, "Result error type must be an enum");

  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    [[nodiscard]] static Result error(E reason) { return Result(std::in_place_index<1>, reason); }

    /// Error state holding E{}; placeholder until a real outcome is assigned.
    Result() : m_data(std::in_place_index<1>, E{}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return m_data.index() == 1; }

    [[nodiscard]] T &content() &
    {
        require_ok();
        return std::get<0>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        require_ok();
        return std::get<0>(m_data);
    }

    /// Moves the value out of an expiring Result.
    [[nodiscard]] T &&content() &&
    {
        require_ok();
        return std::get<0>(std::move(m_data));
    }

    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() on a success value");
        }
        return std::get<1>(m_data);
    }

  private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V &&v) : m_data(tag, std::forward<V>(v))
    {
    }

    void require_ok() const
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() on an error value");
        }
    }

    // Index 0 is the value, index 1 the reason, so T == E stays unambiguous.
    std::variant<T, E> m_data;
};

} // namespace agentgate
