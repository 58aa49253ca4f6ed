#pragma once
/**
 * @file connection_handler.hpp
 * @brief Admission handshake for one accepted agent socket.
 *
 * Sequence, strictly in order on the calling thread:
 *  1. read secret; mismatch     -> "Unauthorized access"
 *  2. read agent name; unknown  -> "No such slave: <name>"
 *     slot online or reserved   -> "<name> is already connected to this master. Rejecting this connection."
 *  3. write "Welcome"
 *  4. open the agent log, write "Agent connected from <peer>"
 *  5. establish the channel and install it in the slot
 *
 * A rejection writes its line to the peer, logs one warning and closes the
 * socket; it is returned as a HandshakeRejection. Transport failures are
 * exceptions (IoError / AbortError) and also leave the socket closed.
 */
#include "agent_log_sink.hpp"
#include "byte_stream.hpp"
#include "channel.hpp"
#include "secret_store.hpp"
#include "socket.hpp"
#include "worker_registry.hpp"

#include "utils/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace agentgate::gate
{

inline constexpr std::string_view kGreetingSuccess = "Welcome";

enum class HandshakeRejection
{
    Unauthorized = 1,
    UnknownAgent,
    AlreadyConnected,
};

[[nodiscard]] const char *to_string(HandshakeRejection rejection) noexcept;

using HandshakeResult = Result<ChannelPtr, HandshakeRejection>;

/// Collaborators shared by every connection of one protocol instance.
struct ConnectionServices
{
    std::shared_ptr<WorkerRegistry> registry;
    std::shared_ptr<const SecretStore> secrets;
    std::shared_ptr<AgentLogSink> log_sink;
    std::shared_ptr<ChannelTransport> transport;
    /// Deadline for each handshake read; zero means wait forever.
    std::chrono::milliseconds read_timeout{0};
};

class ConnectionHandler
{
  public:
    /**
     * @param socket   The accepted connection. Closed by run() unless a channel takes it over.
     * @param context  Label for log entries, e.g. "Agent-connect #3 (10.0.0.5:41022)".
     */
    ConnectionHandler(SocketPtr socket, ConnectionServices services, std::string context);

    ConnectionHandler(const ConnectionHandler &) = delete;
    ConnectionHandler &operator=(const ConnectionHandler &) = delete;

    /**
     * @brief Runs the handshake. Call once.
     * @return The established channel, or the rejection sent to the peer.
     * @throws IoError    on a transport failure during the handshake or channel setup.
     * @throws AbortError if channel setup was aborted.
     */
    HandshakeResult run();

    /// The agent name the peer claimed; empty until it has been read.
    [[nodiscard]] const std::string &agent_name() const noexcept { return m_agent_name; }
    [[nodiscard]] const std::string &context() const noexcept { return m_context; }

  private:
    HandshakeResult reject(HandshakeRejection rejection, const std::string &message);
    ChannelPtr connect(const WorkerSlotPtr &slot, SlotReservation reservation);
    CloseCallback make_close_callback(const WorkerSlotPtr &slot) const;

    SocketPtr m_socket;
    ConnectionServices m_services;
    std::string m_context;

    std::unique_ptr<InputStream> m_in;
    std::unique_ptr<OutputStream> m_out;
    std::string m_agent_name;
};

} // namespace agentgate::gate
