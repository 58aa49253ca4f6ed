#pragma once
/**
 * @file agent_listener.hpp
 * @brief TCP listener that routes agent connections to an AgentProtocol.
 *
 * Every accepted socket first sends a length-prefixed selector
 * "Protocol:<name>". The listener hands the socket to the protocol registered
 * under <name> on a dedicated thread. An unknown selector is answered with
 * "Unknown protocol:<selector>" and the socket is closed.
 *
 * run() blocks; stop() may be called from any thread (including a signal
 * handler). On exit run() interrupts connections still in their handshake
 * and joins their threads. Sockets already handed to a channel
 * (Socket::hand_over) are not touched.
 */
#include "agent_protocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace agentgate::gate
{

class AgentListener
{
  public:
    struct Config
    {
        std::string bind_address{"0.0.0.0"};
        /// 0 binds an ephemeral port; see on_ready.
        uint16_t port{50000};
        int backlog{64};
        /// Deadline for reading the protocol selector; zero means wait forever.
        std::chrono::milliseconds selector_timeout{0};
        /// Called from run() once listening, with the bound port.
        std::function<void(uint16_t bound_port)> on_ready;
        /// Starts a connection thread; unset means std::thread. A std::system_error
        /// drops that one connection and the accept loop carries on.
        std::function<std::thread(std::function<void()>)> start_thread;
    };

    explicit AgentListener(Config cfg);
    ~AgentListener();

    AgentListener(const AgentListener &) = delete;
    AgentListener &operator=(const AgentListener &) = delete;

    /// @throws std::invalid_argument if a protocol with the same name is registered.
    void register_protocol(std::shared_ptr<AgentProtocol> protocol);

    /**
     * @brief Accept loop. Blocks until stop() is called.
     * Polls the listening socket with a 100ms timeout; checks the stop flag each cycle.
     * @throws std::system_error if the socket cannot be bound.
     */
    void run();

    /// Signals run() to exit. Thread-safe and async-signal-safe.
    void stop() noexcept;

    /// Port bound by run(); 0 before that.
    [[nodiscard]] uint16_t bound_port() const noexcept
    {
        return m_bound_port.load(std::memory_order_acquire);
    }

    /// Connections whose handler thread has not finished yet.
    [[nodiscard]] size_t active_connections() const;

  private:
    struct Connection
    {
        std::thread thread;
        SocketPtr socket;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    int open_listen_socket();
    void spawn(SocketPtr socket);
    void dispatch(const SocketPtr &socket);
    void reap_finished();
    void shutdown_connections();

    Config m_cfg;
    std::map<std::string, std::shared_ptr<AgentProtocol>> m_protocols;
    std::atomic<bool> m_stop_requested{false};
    std::atomic<uint16_t> m_bound_port{0};

    mutable std::mutex m_conn_mutex;
    std::list<Connection> m_connections;
};

} // namespace agentgate::gate
