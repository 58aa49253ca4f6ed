#include "agent_listener.hpp"

#include "agentgate_service.hpp"
#include "byte_stream.hpp"
#include "errors.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace agentgate::gate
{

namespace
{
// Accept loop poll timeout
constexpr std::chrono::milliseconds kPollTimeout{100};
constexpr std::string_view kSelectorPrefix = "Protocol:";
} // namespace

AgentListener::AgentListener(Config cfg) : m_cfg(std::move(cfg)) {}

AgentListener::~AgentListener()
{
    stop();
    shutdown_connections();
}

void AgentListener::register_protocol(std::shared_ptr<AgentProtocol> protocol)
{
    if (!protocol)
    {
        throw std::invalid_argument("AgentListener: null protocol");
    }
    std::string name = protocol->name();
    if (!m_protocols.try_emplace(name, std::move(protocol)).second)
    {
        throw std::invalid_argument("AgentListener: protocol '" + name + "' already registered");
    }
}

void AgentListener::stop() noexcept
{
    m_stop_requested.store(true, std::memory_order_release);
}

size_t AgentListener::active_connections() const
{
    std::lock_guard<std::mutex> lock(m_conn_mutex);
    size_t n = 0;
    for (const auto &c : m_connections)
    {
        if (!c.finished->load(std::memory_order_acquire))
            ++n;
    }
    return n;
}

// ============================================================================
// Listening socket
// ============================================================================

int AgentListener::open_listen_socket()
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo *res = nullptr;
    const std::string port = std::to_string(m_cfg.port);
    const char *host = m_cfg.bind_address.empty() ? nullptr : m_cfg.bind_address.c_str();
    if (int rc = ::getaddrinfo(host, port.c_str(), &hints, &res); rc != 0)
    {
        throw std::runtime_error(fmt::format("AgentListener: cannot resolve '{}': {}",
                                             m_cfg.bind_address, ::gai_strerror(rc)));
    }
    auto free_res = basics::make_scope_guard([res]() { ::freeaddrinfo(res); });

    int last_errno = 0;
    for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
    {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd == -1)
        {
            last_errno = errno;
            continue;
        }
        int one = 1;
        static_cast<void>(::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, m_cfg.backlog) == 0)
        {
            return fd;
        }
        last_errno = errno;
        ::close(fd);
    }
    throw std::system_error(last_errno, std::generic_category(),
                            fmt::format("AgentListener: cannot listen on {}:{}",
                                        m_cfg.bind_address, m_cfg.port));
}

// ============================================================================
// run(): accept loop
// ============================================================================

void AgentListener::run()
{
    const int listen_fd = open_listen_socket();
    auto close_listen = basics::make_scope_guard([listen_fd]() { ::close(listen_fd); });

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(listen_fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0)
    {
        uint16_t port = 0;
        if (addr.ss_family == AF_INET)
            port = ntohs(reinterpret_cast<const sockaddr_in *>(&addr)->sin_port);
        else if (addr.ss_family == AF_INET6)
            port = ntohs(reinterpret_cast<const sockaddr_in6 *>(&addr)->sin6_port);
        m_bound_port.store(port, std::memory_order_release);
    }

    LOGGER_INFO("AgentListener: listening on {}:{}", m_cfg.bind_address, bound_port());
    if (m_cfg.on_ready)
    {
        m_cfg.on_ready(bound_port());
    }

    while (!m_stop_requested.load(std::memory_order_acquire))
    {
        reap_finished();

        pollfd pfd{listen_fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(kPollTimeout.count()));
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            LOGGER_ERROR("AgentListener: poll failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0 || (pfd.revents & POLLIN) == 0)
        {
            continue;
        }

        int fd = ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd == -1)
        {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED)
            {
                LOGGER_WARN("AgentListener: accept failed: {}", std::strerror(errno));
            }
            continue;
        }
        spawn(Socket::adopt(fd));
    }

    shutdown_connections();
    LOGGER_INFO("AgentListener: stopped.");
}

// ============================================================================
// Connection threads
// ============================================================================

void AgentListener::spawn(SocketPtr socket)
{
    auto finished = std::make_shared<std::atomic<bool>>(false);
    LOGGER_DEBUG("AgentListener: accepted connection from {}", socket->remote_address());

    std::function<void()> body = [this, socket, finished]()
    {
        dispatch(socket);
        finished->store(true, std::memory_order_release);
    };

    std::thread worker;
    try
    {
        worker = m_cfg.start_thread ? m_cfg.start_thread(std::move(body))
                                    : std::thread(std::move(body));
    }
    catch (const std::system_error &e)
    {
        LOGGER_WARN("AgentListener: no thread for connection from {} ({}); dropping it",
                    socket->remote_address(), e.what());
        socket->close();
        return;
    }

    std::lock_guard<std::mutex> lock(m_conn_mutex);
    m_connections.push_back(Connection{std::move(worker), std::move(socket), std::move(finished)});
}

void AgentListener::dispatch(const SocketPtr &socket)
{
    try
    {
        if (m_cfg.selector_timeout.count() > 0)
        {
            socket->set_read_timeout(m_cfg.selector_timeout);
        }
        SocketInputStream in(socket);
        const std::string selector = read_utf(in, "protocol selector");
        if (m_cfg.selector_timeout.count() > 0)
        {
            socket->set_read_timeout(std::chrono::milliseconds(0));
        }

        std::shared_ptr<AgentProtocol> protocol;
        if (selector.rfind(kSelectorPrefix, 0) == 0)
        {
            auto it = m_protocols.find(selector.substr(kSelectorPrefix.size()));
            if (it != m_protocols.end())
                protocol = it->second;
        }
        if (!protocol)
        {
            LOGGER_WARN("AgentListener: {} requested unknown protocol '{}'",
                        socket->remote_address(), format_tools::printable(selector));
            try
            {
                SocketOutputStream out(socket);
                write_line(out, "Unknown protocol:" + selector);
            }
            catch (const IoError &e)
            {
                LOGGER_DEBUG("AgentListener: could not answer {}: {}", socket->remote_address(),
                             e.what());
            }
            socket->close();
            return;
        }

        protocol->handle_connection(socket);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("AgentListener: connection from {} failed\n{}", socket->remote_address(),
                     format_exception_trace(e));
        socket->close();
    }
}

void AgentListener::reap_finished()
{
    std::list<Connection> done;
    {
        std::lock_guard<std::mutex> lock(m_conn_mutex);
        for (auto it = m_connections.begin(); it != m_connections.end();)
        {
            auto next = std::next(it);
            if (it->finished->load(std::memory_order_acquire))
            {
                done.splice(done.end(), m_connections, it);
            }
            it = next;
        }
    }
    for (auto &c : done)
    {
        c.thread.join();
    }
}

void AgentListener::shutdown_connections()
{
    std::list<Connection> all;
    {
        std::lock_guard<std::mutex> lock(m_conn_mutex);
        all.swap(m_connections);
    }
    for (auto &c : all)
    {
        if (!c.finished->load(std::memory_order_acquire))
        {
            c.socket->interrupt_handshake();
        }
    }
    for (auto &c : all)
    {
        if (c.thread.joinable())
            c.thread.join();
    }
    if (!all.empty())
    {
        LOGGER_DEBUG("AgentListener: joined {} connection thread(s)", all.size());
    }
}

} // namespace agentgate::gate
