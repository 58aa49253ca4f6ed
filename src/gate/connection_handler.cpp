#include "connection_handler.hpp"

#include "agentgate_service.hpp"
#include "errors.hpp"

namespace agentgate::gate
{

namespace
{

// Agent log output must not replace the exception being reported.
void log_best_effort(const LogStreamPtr &log, std::string_view line) noexcept
{
    try
    {
        log->write_line(line);
        log->flush();
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("[Handshake] agent log write failed: {}", e.what());
    }
}

} // namespace

const char *to_string(HandshakeRejection rejection) noexcept
{
    switch (rejection)
    {
    case HandshakeRejection::Unauthorized: return "Unauthorized";
    case HandshakeRejection::UnknownAgent: return "UnknownAgent";
    case HandshakeRejection::AlreadyConnected: return "AlreadyConnected";
    }
    return "Unknown";
}

ConnectionHandler::ConnectionHandler(SocketPtr socket, ConnectionServices services,
                                     std::string context)
    : m_socket(std::move(socket)), m_services(std::move(services)), m_context(std::move(context)),
      m_in(std::make_unique<SocketInputStream>(m_socket)),
      m_out(std::make_unique<SocketOutputStream>(m_socket))
{
}

HandshakeResult ConnectionHandler::run()
{
    // Every exit that does not hand the socket to a channel closes it.
    auto close_guard = basics::make_scope_guard([this]() { m_socket->close(); });

    if (m_services.read_timeout.count() > 0)
    {
        m_socket->set_read_timeout(m_services.read_timeout);
    }

    const std::string secret = read_utf(*m_in, "secret");
    if (!crypto::constant_time_equals(secret, m_services.secrets->current()))
    {
        return reject(HandshakeRejection::Unauthorized, "Unauthorized access");
    }

    m_agent_name = read_utf(*m_in, "agent name");
    WorkerSlotPtr slot = m_services.registry->lookup(m_agent_name);
    if (!slot)
    {
        return reject(HandshakeRejection::UnknownAgent, "No such slave: " + m_agent_name);
    }

    SlotReservation reservation = slot->try_reserve();
    if (!reservation)
    {
        return reject(HandshakeRejection::AlreadyConnected,
                      m_agent_name +
                          " is already connected to this master. Rejecting this connection.");
    }

    if (m_services.read_timeout.count() > 0)
    {
        m_socket->set_read_timeout(std::chrono::milliseconds(0));
    }
    write_line(*m_out, kGreetingSuccess);

    ChannelPtr channel = connect(slot, std::move(reservation));
    close_guard.dismiss();
    return HandshakeResult::ok(std::move(channel));
}

ChannelPtr ConnectionHandler::connect(const WorkerSlotPtr &slot, SlotReservation reservation)
{
    LogStreamPtr log = m_services.log_sink->open(m_agent_name);
    log_best_effort(log, fmt::format("Agent connected from {}", m_socket->remote_address()));

    ChannelPtr channel;
    try
    {
        channel = m_services.transport->establish(
            m_agent_name, std::make_unique<BufferedInputStream>(std::move(m_in)),
            std::make_unique<BufferedOutputStream>(std::move(m_out)), log,
            make_close_callback(slot));
    }
    catch (const AbortError &e)
    {
        log_best_effort(log, e.what());
        log_best_effort(log, "Failed to establish the connection with the agent");
        throw;
    }
    catch (const IoError &e)
    {
        log_best_effort(log, fmt::format("Failed to establish the connection with the agent {}\n{}",
                                         m_agent_name, format_exception_trace(e)));
        throw;
    }

    if (!m_socket->hand_over())
    {
        // The listener is stopping and interrupted this handshake.
        channel->close();
        throw IoError(std::make_error_code(std::errc::operation_canceled),
                      "handshake interrupted before the channel was registered");
    }

    if (!reservation.commit(channel))
    {
        LOGGER_WARN("[Handshake] {}: channel for '{}' terminated before it was registered",
                    m_context, m_agent_name);
    }
    else
    {
        LOGGER_INFO("[Handshake] {}: agent '{}' connected", m_context, m_agent_name);
    }
    return channel;
}

CloseCallback ConnectionHandler::make_close_callback(const WorkerSlotPtr &slot) const
{
    return [slot, socket = m_socket, context = m_context](Channel &channel,
                                                           std::exception_ptr cause)
    {
        if (cause)
        {
            LOGGER_WARN("{} for {} terminated\n{}", context, channel.name(),
                        format_exception_trace(cause));
        }
        else
        {
            LOGGER_INFO("[Handshake] agent '{}' disconnected", channel.name());
        }
        slot->clear_channel(&channel);
        socket->close();
    };
}

HandshakeResult ConnectionHandler::reject(HandshakeRejection rejection, const std::string &message)
{
    try
    {
        write_line(*m_out, message);
    }
    catch (const IoError &e)
    {
        LOGGER_DEBUG("[Handshake] {}: could not send rejection: {}", m_context, e.what());
    }
    LOGGER_WARN("{} is aborted: {}", m_context, format_tools::printable(message, 512));
    m_socket->close();
    return HandshakeResult::error(rejection);
}

} // namespace agentgate::gate
