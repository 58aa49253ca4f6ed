#pragma once
/**
 * @file agent_protocol.hpp
 * @brief Protocols an AgentListener can route an accepted socket to.
 */
#include "connection_handler.hpp"
#include "socket.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace agentgate::gate
{

class AgentProtocol
{
  public:
    virtual ~AgentProtocol() = default;

    /// Name clients select with "Protocol:<name>".
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Serves one connection on the calling thread.
     *
     * The protocol owns @p socket from here on. Failures are thrown for the
     * listener to log.
     */
    virtual void handle_connection(SocketPtr socket) = 0;
};

/**
 * @class AgentConnectProtocol
 * @brief Admits agents with the shared-secret handshake (see ConnectionHandler).
 */
class AgentConnectProtocol final : public AgentProtocol
{
  public:
    static constexpr std::string_view kName = "Agent-connect";

    explicit AgentConnectProtocol(ConnectionServices services);

    [[nodiscard]] std::string name() const override { return std::string(kName); }
    void handle_connection(SocketPtr socket) override;

    [[nodiscard]] const ConnectionServices &services() const noexcept { return m_services; }

  private:
    ConnectionServices m_services;
    std::atomic<uint64_t> m_next_id{1};
};

} // namespace agentgate::gate
