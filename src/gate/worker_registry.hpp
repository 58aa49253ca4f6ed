#pragma once
/**
 * @file worker_registry.hpp
 * @brief Known agents and the channel each one currently has.
 *
 * A WorkerSlot exists for every agent the controller knows about, online or
 * not. Its channel reference is null while the agent is offline. Admission of
 * a new connection for a slot is two locked steps:
 *
 *   1. try_reserve(): fails if the slot has a channel or another handshake
 *      already holds the reservation. Otherwise the slot is marked busy.
 *   2. SlotReservation::commit(channel): installs the channel and releases
 *      the reservation. Dropping an uncommitted reservation just releases it.
 *
 * So two concurrent handshakes for the same name can never both be admitted,
 * and a rejected attempt never touches the installed channel. clear_channel()
 * is the only transition back to null, and only for the channel installed.
 *
 * All methods are thread-safe.
 */
#include "channel.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentgate::gate
{

class WorkerSlot;
using WorkerSlotPtr = std::shared_ptr<WorkerSlot>;

/// Scoped claim on a slot for the duration of one handshake. Move-only.
class SlotReservation
{
  public:
    SlotReservation() = default;
    explicit SlotReservation(WorkerSlotPtr slot) : m_slot(std::move(slot)) {}
    ~SlotReservation();

    SlotReservation(SlotReservation &&other) noexcept : m_slot(std::move(other.m_slot)) {}
    SlotReservation &operator=(SlotReservation &&other) noexcept;
    SlotReservation(const SlotReservation &) = delete;
    SlotReservation &operator=(const SlotReservation &) = delete;

    explicit operator bool() const noexcept { return m_slot != nullptr; }

    /**
     * @brief Installs @p channel as the slot's channel and ends the reservation.
     * @return false if @p channel already terminated; the slot stays offline.
     */
    bool commit(ChannelPtr channel);

    /// Ends the reservation without installing anything.
    void release() noexcept;

  private:
    WorkerSlotPtr m_slot;
};

class WorkerSlot : public std::enable_shared_from_this<WorkerSlot>
{
  public:
    explicit WorkerSlot(std::string name) : m_name(std::move(name)) {}

    WorkerSlot(const WorkerSlot &) = delete;
    WorkerSlot &operator=(const WorkerSlot &) = delete;

    [[nodiscard]] const std::string &name() const noexcept { return m_name; }

    /// The channel of the online agent, or null.
    [[nodiscard]] ChannelPtr current_channel() const;

    /// True while a handshake holds the reservation.
    [[nodiscard]] bool is_reserved() const;

    /**
     * @brief Claims the slot for one handshake.
     * @return An empty reservation if the slot is online or already reserved.
     */
    [[nodiscard]] SlotReservation try_reserve();

    /**
     * @brief Compare-and-set of the channel from null.
     * @return false if the slot already has a channel or is reserved.
     */
    bool assign_channel(ChannelPtr channel);

    /**
     * @brief Resets the channel to null if it is still @p channel.
     * @return true if the slot was cleared.
     */
    bool clear_channel(const Channel *channel);

  private:
    friend class SlotReservation;

    bool commit_reserved(ChannelPtr channel);
    void release_reservation() noexcept;

    const std::string m_name;
    mutable std::mutex m_mutex;
    ChannelPtr m_channel;
    bool m_reserved = false;
};

/**
 * @class WorkerRegistry
 * @brief Name-to-slot map of every agent the controller accepts.
 */
class WorkerRegistry
{
  public:
    WorkerRegistry() = default;
    explicit WorkerRegistry(const std::vector<std::string> &names);

    [[nodiscard]] WorkerSlotPtr lookup(const std::string &name) const;

    /**
     * @brief Adds an agent.
     * @return The new slot, or the existing one if @p name is already known.
     * @throws std::invalid_argument if @p name is not a valid agent name.
     */
    WorkerSlotPtr add(const std::string &name);

    /**
     * @brief Forgets an agent. A connected agent is disconnected.
     * @return false if @p name was unknown.
     */
    bool remove(const std::string &name);

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] size_t size() const;

    /// Closes every online channel and waits up to @p timeout for each to terminate.
    void close_all(std::chrono::milliseconds timeout = std::chrono::seconds(5));

    /// Non-empty, at most 255 bytes, printable ASCII without '/' or '\\', not "." or "..".
    [[nodiscard]] static bool is_valid_name(const std::string &name) noexcept;

  private:
    mutable std::mutex m_mutex;
    std::map<std::string, WorkerSlotPtr> m_slots;
};

} // namespace agentgate::gate
