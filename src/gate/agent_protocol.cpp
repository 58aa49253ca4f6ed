#include "agent_protocol.hpp"

#include "agentgate_service.hpp"

#include <stdexcept>

namespace agentgate::gate
{

AgentConnectProtocol::AgentConnectProtocol(ConnectionServices services)
    : m_services(std::move(services))
{
    if (!m_services.registry || !m_services.secrets || !m_services.log_sink ||
        !m_services.transport)
    {
        throw std::invalid_argument("AgentConnectProtocol: every service must be provided");
    }
}

void AgentConnectProtocol::handle_connection(SocketPtr socket)
{
    const uint64_t id = m_next_id.fetch_add(1, std::memory_order_relaxed);
    std::string context = fmt::format("{} #{} ({})", kName, id, socket->remote_address());

    ConnectionHandler handler(std::move(socket), m_services, std::move(context));
    HandshakeResult result = handler.run();
    if (result.is_error())
    {
        LOGGER_DEBUG("[{}] {} rejected: {}", kName, handler.context(), to_string(result.error()));
    }
}

} // namespace agentgate::gate
