#pragma once
/**
 * @file socket.hpp
 * @brief Owning wrapper around a connected stream socket descriptor.
 *
 * A Socket is shared (std::shared_ptr) between the connection handler, the
 * established channel and the channel's close callback. close() is idempotent
 * and safe to call from any of them concurrently; it never throws.
 *
 * close() only shuts the connection down. The descriptor number stays
 * allocated until the last SocketPtr is gone, so a thread still inside
 * send_all() or shutdown() can never reach a descriptor the kernel has handed
 * to a newly accepted peer.
 *
 * A socket starts in its handshake. Exactly one of hand_over() (the channel
 * now owns it) and interrupt_handshake() (the listener is stopping) wins.
 */
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace agentgate::gate
{

class Socket
{
  public:
    /// Takes ownership of @p fd. @p peer is a human-readable remote address.
    Socket(int fd, std::string peer);
    ~Socket();

    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;

    /// Adopts an accepted descriptor and resolves its peer address.
    static std::shared_ptr<Socket> adopt(int fd);

    [[nodiscard]] int fd() const noexcept { return m_fd; }
    [[nodiscard]] bool is_closed() const noexcept { return m_closed.load(std::memory_order_acquire); }
    [[nodiscard]] const std::string &remote_address() const noexcept { return m_peer; }

    /**
     * @brief Receives up to @p len bytes. Blocks until data, EOF or error.
     * @return Bytes read; 0 on orderly EOF.
     * @throws IoError on failure, including an expired read deadline.
     */
    size_t recv_some(void *buf, size_t len);

    /**
     * @brief Sends all @p len bytes.
     * @throws IoError on failure (EPIPE is reported, not signalled).
     */
    void send_all(const void *buf, size_t len);

    /**
     * @brief Sets a receive deadline. A zero duration removes it.
     * @throws IoError if setsockopt fails.
     */
    void set_read_timeout(std::chrono::milliseconds timeout);

    /// Shuts down both directions without releasing the descriptor. Wakes blocked readers.
    void shutdown() noexcept;

    /// Shuts both directions down and marks the socket closed. Repeated calls are
    /// no-ops. The descriptor is released by the destructor.
    void close() noexcept;

    /// Marks the handshake finished and the socket owned by a channel.
    /// @return false if interrupt_handshake() got there first.
    [[nodiscard]] bool hand_over() noexcept;

    /// Shuts the socket down unless it was already handed to a channel.
    /// @return false if a channel owns the socket.
    bool interrupt_handshake() noexcept;

  private:
    enum class Phase : int
    {
        Handshake,
        Channel,
        Interrupted,
    };

    const int m_fd;
    std::string m_peer;
    std::atomic<bool> m_closed{false};
    std::atomic<Phase> m_phase{Phase::Handshake};
};

using SocketPtr = std::shared_ptr<Socket>;

} // namespace agentgate::gate
