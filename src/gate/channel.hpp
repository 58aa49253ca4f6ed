#pragma once
/**
 * @file channel.hpp
 * @brief Bidirectional message channel built on an admitted agent socket.
 *
 * A ChannelTransport turns the post-handshake byte streams into a Channel.
 * The channel owns a reader thread that delivers inbound frames to the
 * transport's MessageHandler. When the reader stops (peer disconnect, I/O
 * error or Channel::close()) the CloseCallback fires exactly once on the
 * reader thread; its cause is null for an orderly close.
 *
 * StreamChannelTransport framing: 4-byte unsigned big-endian length, then the
 * payload. Both sides open with a preamble frame holding kChannelPreamble.
 */
#include "agent_log_sink.hpp"
#include "byte_stream.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace agentgate::gate
{

inline constexpr std::string_view kChannelPreamble = "<===[AGENTGATE CHANNEL]===>";
inline constexpr size_t kMaxFrameBytes = 16u * 1024u * 1024u;

class Channel;
using ChannelPtr = std::shared_ptr<Channel>;

/// Invoked once when a channel terminates. @p cause is null on orderly close.
using CloseCallback = std::function<void(Channel &channel, std::exception_ptr cause)>;

/// Invoked on the reader thread for every inbound frame.
using MessageHandler = std::function<void(Channel &channel, const std::string &payload)>;

class Channel
{
  public:
    virtual ~Channel() = default;

    [[nodiscard]] virtual const std::string &name() const noexcept = 0;

    /**
     * @brief Sends one message.
     * @throws IoError if the channel is closed or the transport fails.
     */
    virtual void send(std::string_view payload) = 0;

    /// Requests termination. Returns immediately; the close callback reports completion.
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual bool is_closed() const noexcept = 0;

    /// Blocks until the close callback has returned, or @p timeout elapses.
    virtual bool wait_closed(std::chrono::milliseconds timeout) = 0;
};

class ChannelTransport
{
  public:
    virtual ~ChannelTransport() = default;

    /**
     * @brief Builds a channel for agent @p name over the given streams.
     *
     * @p on_close is bound before the channel can observe termination, so it
     * covers the whole channel lifetime.
     *
     * @throws AbortError if the peer does not speak the channel protocol.
     * @throws IoError    if the transport fails while setting up.
     */
    virtual ChannelPtr establish(const std::string &name, std::unique_ptr<InputStream> in,
                                 std::unique_ptr<OutputStream> out, LogStreamPtr log,
                                 CloseCallback on_close) = 0;
};

// ============================================================================
// StreamChannel
// ============================================================================

class StreamChannel final : public Channel, public std::enable_shared_from_this<StreamChannel>
{
  public:
    StreamChannel(std::string name, std::unique_ptr<InputStream> in,
                  std::unique_ptr<OutputStream> out, LogStreamPtr log, CloseCallback on_close,
                  MessageHandler on_message);
    ~StreamChannel() override;

    StreamChannel(const StreamChannel &) = delete;
    StreamChannel &operator=(const StreamChannel &) = delete;

    [[nodiscard]] const std::string &name() const noexcept override { return m_name; }
    void send(std::string_view payload) override;
    void close() noexcept override;
    [[nodiscard]] bool is_closed() const noexcept override
    {
        return m_closed.load(std::memory_order_acquire);
    }
    bool wait_closed(std::chrono::milliseconds timeout) override;

    /// Exchanges preambles on the calling thread. Throws like ChannelTransport::establish.
    void handshake();

    /// Starts the detached reader thread. The thread keeps the channel alive until it exits.
    void start();

  private:
    void reader_loop() noexcept;
    void terminate(std::exception_ptr cause) noexcept;

    std::string m_name;
    std::unique_ptr<InputStream> m_in;
    std::unique_ptr<OutputStream> m_out;
    LogStreamPtr m_log;
    CloseCallback m_on_close;
    MessageHandler m_on_message;

    std::mutex m_send_mutex;
    std::atomic<bool> m_close_requested{false};
    std::atomic<bool> m_closed{false};

    std::mutex m_done_mutex;
    std::condition_variable m_done_cv;
    bool m_done = false;
};

class StreamChannelTransport final : public ChannelTransport
{
  public:
    explicit StreamChannelTransport(MessageHandler on_message = {})
        : m_on_message(std::move(on_message))
    {
    }

    ChannelPtr establish(const std::string &name, std::unique_ptr<InputStream> in,
                         std::unique_ptr<OutputStream> out, LogStreamPtr log,
                         CloseCallback on_close) override;

  private:
    MessageHandler m_on_message;
};

// ============================================================================
// Frame codec
// ============================================================================

/** @brief Writes one frame and flushes. @throws std::length_error above kMaxFrameBytes. */
void write_frame(OutputStream &out, std::string_view payload);

/**
 * @brief Reads one frame.
 * @param[out] payload Receives the frame body.
 * @return false on end of stream at a frame boundary.
 * @throws IoError on a truncated frame, an oversized length or transport failure.
 */
bool read_frame(InputStream &in, std::string &payload);

} // namespace agentgate::gate
