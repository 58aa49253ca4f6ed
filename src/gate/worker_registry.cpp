#include "worker_registry.hpp"

#include "agentgate_service.hpp"

#include <stdexcept>

namespace agentgate::gate
{

// ============================================================================
// SlotReservation
// ============================================================================

SlotReservation::~SlotReservation()
{
    release();
}

SlotReservation &SlotReservation::operator=(SlotReservation &&other) noexcept
{
    if (this != &other)
    {
        release();
        m_slot = std::move(other.m_slot);
    }
    return *this;
}

bool SlotReservation::commit(ChannelPtr channel)
{
    if (!m_slot)
    {
        throw std::logic_error("SlotReservation::commit() on an empty reservation");
    }
    WorkerSlotPtr slot = std::move(m_slot);
    return slot->commit_reserved(std::move(channel));
}

void SlotReservation::release() noexcept
{
    if (m_slot)
    {
        m_slot->release_reservation();
        m_slot.reset();
    }
}

// ============================================================================
// WorkerSlot
// ============================================================================

ChannelPtr WorkerSlot::current_channel() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channel;
}

bool WorkerSlot::is_reserved() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reserved;
}

SlotReservation WorkerSlot::try_reserve()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_channel || m_reserved)
    {
        return SlotReservation();
    }
    m_reserved = true;
    return SlotReservation(shared_from_this());
}

bool WorkerSlot::assign_channel(ChannelPtr channel)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_channel || m_reserved)
    {
        return false;
    }
    m_channel = std::move(channel);
    return true;
}

bool WorkerSlot::clear_channel(const Channel *channel)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_channel || m_channel.get() != channel)
    {
        return false;
    }
    m_channel.reset();
    return true;
}

bool WorkerSlot::commit_reserved(ChannelPtr channel)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_reserved = false;
    // The close callback may already have run; it found nothing to clear, so
    // installing now would leave a dead channel in the slot forever.
    if (!channel || channel->is_closed())
    {
        return false;
    }
    m_channel = std::move(channel);
    return true;
}

void WorkerSlot::release_reservation() noexcept
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_reserved = false;
}

// ============================================================================
// WorkerRegistry
// ============================================================================

WorkerRegistry::WorkerRegistry(const std::vector<std::string> &names)
{
    for (const auto &name : names)
    {
        add(name);
    }
}

bool WorkerRegistry::is_valid_name(const std::string &name) noexcept
{
    if (name.empty() || name.size() > 255 || name == "." || name == "..")
    {
        return false;
    }
    for (char c : name)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x21 || uc > 0x7E || c == '/' || c == '\\')
        {
            return false;
        }
    }
    return true;
}

WorkerSlotPtr WorkerRegistry::lookup(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(name);
    return it == m_slots.end() ? nullptr : it->second;
}

WorkerSlotPtr WorkerRegistry::add(const std::string &name)
{
    if (!is_valid_name(name))
    {
        throw std::invalid_argument(
            fmt::format("Invalid agent name '{}'", format_tools::printable(name)));
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_slots.try_emplace(name, nullptr);
    if (inserted)
    {
        it->second = std::make_shared<WorkerSlot>(name);
        LOGGER_DEBUG("[Registry] added agent '{}'", name);
    }
    return it->second;
}

bool WorkerRegistry::remove(const std::string &name)
{
    WorkerSlotPtr slot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_slots.find(name);
        if (it == m_slots.end())
        {
            return false;
        }
        slot = std::move(it->second);
        m_slots.erase(it);
    }
    if (ChannelPtr channel = slot->current_channel())
    {
        channel->close();
    }
    LOGGER_DEBUG("[Registry] removed agent '{}'", name);
    return true;
}

std::vector<std::string> WorkerRegistry::names() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_slots.size());
    for (const auto &[name, slot] : m_slots)
    {
        out.push_back(name);
    }
    return out;
}

size_t WorkerRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.size();
}

void WorkerRegistry::close_all(std::chrono::milliseconds timeout)
{
    std::vector<ChannelPtr> online;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &[name, slot] : m_slots)
        {
            if (ChannelPtr channel = slot->current_channel())
            {
                online.push_back(std::move(channel));
            }
        }
    }

    for (const auto &channel : online)
    {
        channel->close();
    }
    for (const auto &channel : online)
    {
        if (!channel->wait_closed(timeout))
        {
            LOGGER_WARN("[Registry] channel of '{}' did not terminate within {} ms",
                        channel->name(), timeout.count());
        }
    }
    if (!online.empty())
    {
        LOGGER_INFO("[Registry] closed {} agent channel(s)", online.size());
    }
}

} // namespace agentgate::gate
