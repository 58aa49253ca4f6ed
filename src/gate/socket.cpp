#include "socket.hpp"

#include "errors.hpp"

#include <fmt/format.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>

namespace agentgate::gate
{

namespace
{

std::string describe_peer(int fd)
{
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0)
    {
        return "unknown";
    }

    char host[INET6_ADDRSTRLEN] = {};
    if (addr.ss_family == AF_INET)
    {
        const auto *in = reinterpret_cast<const sockaddr_in *>(&addr);
        ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        return fmt::format("{}:{}", host, ntohs(in->sin_port));
    }
    if (addr.ss_family == AF_INET6)
    {
        const auto *in6 = reinterpret_cast<const sockaddr_in6 *>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        return fmt::format("[{}]:{}", host, ntohs(in6->sin6_port));
    }
    if (addr.ss_family == AF_UNIX)
    {
        return "local";
    }
    return "unknown";
}

} // namespace

Socket::Socket(int fd, std::string peer) : m_fd(fd), m_peer(std::move(peer)) {}

Socket::~Socket()
{
    if (m_fd >= 0)
    {
        static_cast<void>(::close(m_fd));
    }
}

std::shared_ptr<Socket> Socket::adopt(int fd)
{
    return std::make_shared<Socket>(fd, describe_peer(fd));
}

size_t Socket::recv_some(void *buf, size_t len)
{
    for (;;)
    {
        if (is_closed())
        {
            throw IoError(std::make_error_code(std::errc::bad_file_descriptor), "recv on closed socket");
        }
        ssize_t n = ::recv(m_fd, buf, len, 0);
        if (n >= 0)
        {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR)
        {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            throw IoError(std::make_error_code(std::errc::timed_out), "recv: read deadline expired");
        }
        throw IoError::from_errno("recv");
    }
}

void Socket::send_all(const void *buf, size_t len)
{
    const auto *p = static_cast<const char *>(buf);
    while (len > 0)
    {
        if (is_closed())
        {
            throw IoError(std::make_error_code(std::errc::bad_file_descriptor), "send on closed socket");
        }
        ssize_t n = ::send(m_fd, p, len, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw IoError::from_errno("send");
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
}

void Socket::set_read_timeout(std::chrono::milliseconds timeout)
{
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0)
    {
        throw IoError::from_errno("setsockopt(SO_RCVTIMEO)");
    }
}

void Socket::shutdown() noexcept
{
    if (m_fd >= 0)
    {
        static_cast<void>(::shutdown(m_fd, SHUT_RDWR));
    }
}

void Socket::close() noexcept
{
    if (!m_closed.exchange(true, std::memory_order_acq_rel))
    {
        shutdown();
    }
}

bool Socket::hand_over() noexcept
{
    Phase expected = Phase::Handshake;
    return m_phase.compare_exchange_strong(expected, Phase::Channel, std::memory_order_acq_rel);
}

bool Socket::interrupt_handshake() noexcept
{
    Phase expected = Phase::Handshake;
    if (!m_phase.compare_exchange_strong(expected, Phase::Interrupted, std::memory_order_acq_rel))
    {
        return expected == Phase::Interrupted;
    }
    shutdown();
    return true;
}

} // namespace agentgate::gate
