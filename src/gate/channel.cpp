#include "channel.hpp"

#include "agentgate_service.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <thread>

namespace agentgate::gate
{

// ============================================================================
// Frame codec
// ============================================================================

void write_frame(OutputStream &out, std::string_view payload)
{
    if (payload.size() > kMaxFrameBytes)
    {
        throw std::length_error(
            fmt::format("frame of {} bytes exceeds the {}-byte limit", payload.size(),
                        kMaxFrameBytes));
    }
    const auto len = static_cast<uint32_t>(payload.size());
    const uint8_t header[4] = {static_cast<uint8_t>(len >> 24), static_cast<uint8_t>(len >> 16),
                               static_cast<uint8_t>(len >> 8), static_cast<uint8_t>(len)};
    out.write(header, sizeof(header));
    out.write(payload.data(), payload.size());
    out.flush();
}

bool read_frame(InputStream &in, std::string &payload)
{
    uint8_t header[4];
    // The first byte decides between a clean end of stream and a truncated frame.
    size_t n = 0;
    try
    {
        n = in.read_some(header, 1);
    }
    catch (const IoError &e)
    {
        std::throw_with_nested(IoError(e.code(), "reading frame header"));
    }
    if (n == 0)
    {
        return false;
    }
    in.read_fully(header + 1, sizeof(header) - 1, "frame header");

    const uint32_t len = (static_cast<uint32_t>(header[0]) << 24) |
                         (static_cast<uint32_t>(header[1]) << 16) |
                         (static_cast<uint32_t>(header[2]) << 8) | header[3];
    if (len > kMaxFrameBytes)
    {
        throw IoError(std::make_error_code(std::errc::message_size),
                      fmt::format("frame length {} exceeds the {}-byte limit", len,
                                  kMaxFrameBytes));
    }
    payload.assign(len, '\0');
    if (len > 0)
    {
        in.read_fully(payload.data(), len, "frame body");
    }
    return true;
}

// ============================================================================
// StreamChannel
// ============================================================================

StreamChannel::StreamChannel(std::string name, std::unique_ptr<InputStream> in,
                             std::unique_ptr<OutputStream> out, LogStreamPtr log,
                             CloseCallback on_close, MessageHandler on_message)
    : m_name(std::move(name)), m_in(std::move(in)), m_out(std::move(out)), m_log(std::move(log)),
      m_on_close(std::move(on_close)), m_on_message(std::move(on_message))
{
}

StreamChannel::~StreamChannel()
{
    LOGGER_TRACE("[Channel] '{}' destroyed", m_name);
}

void StreamChannel::handshake()
{
    write_frame(*m_out, kChannelPreamble);

    std::string peer_preamble;
    try
    {
        if (!read_frame(*m_in, peer_preamble))
        {
            throw IoError::end_of_stream("channel preamble");
        }
    }
    catch (const IoError &e)
    {
        if (e.code() == std::errc::message_size)
        {
            // A length that large means the peer sent something other than a frame.
            std::throw_with_nested(AbortError("Peer did not send a channel preamble"));
        }
        throw;
    }

    if (peer_preamble != kChannelPreamble)
    {
        throw AbortError(fmt::format("Unexpected channel preamble: '{}'",
                                     format_tools::printable(peer_preamble, 64)));
    }
}

void StreamChannel::start()
{
    std::thread([self = shared_from_this()]() { self->reader_loop(); }).detach();
}

void StreamChannel::send(std::string_view payload)
{
    if (is_closed() || m_close_requested.load(std::memory_order_acquire))
    {
        throw IoError(std::make_error_code(std::errc::not_connected),
                      fmt::format("channel '{}' is closed", m_name));
    }
    std::lock_guard<std::mutex> lock(m_send_mutex);
    try
    {
        write_frame(*m_out, payload);
    }
    catch (const IoError &)
    {
        // The reader reports the failure through the close callback.
        m_in->interrupt();
        throw;
    }
}

void StreamChannel::close() noexcept
{
    if (!m_close_requested.exchange(true, std::memory_order_acq_rel))
    {
        LOGGER_DEBUG("[Channel] close requested for '{}'", m_name);
        m_in->interrupt();
    }
}

bool StreamChannel::wait_closed(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_done_mutex);
    return m_done_cv.wait_for(lock, timeout, [this] { return m_done; });
}

void StreamChannel::reader_loop() noexcept
{
    std::exception_ptr cause;
    try
    {
        std::string payload;
        while (read_frame(*m_in, payload))
        {
            if (m_on_message)
            {
                m_on_message(*this, payload);
            }
        }
    }
    catch (const std::exception &)
    {
        cause = std::current_exception();
    }

    if (m_close_requested.load(std::memory_order_acquire))
    {
        // Errors caused by our own interrupt are not a failure.
        cause = nullptr;
    }
    terminate(cause);
}

void StreamChannel::terminate(std::exception_ptr cause) noexcept
{
    if (m_closed.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    if (m_log)
    {
        try
        {
            m_log->write_line(cause ? fmt::format("Connection terminated: {}",
                                                  format_exception_trace(cause))
                                    : std::string("Connection terminated"));
            m_log->flush();
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("[Channel] '{}': agent log write failed: {}", m_name, e.what());
        }
    }

    // Moved out so the callback and whatever it captures are released after one call.
    CloseCallback on_close = std::move(m_on_close);
    m_on_close = nullptr;
    if (on_close)
    {
        try
        {
            on_close(*this, cause);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("[Channel] '{}': close callback threw: {}", m_name, e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_done_mutex);
        m_done = true;
    }
    m_done_cv.notify_all();
}

// ============================================================================
// StreamChannelTransport
// ============================================================================

ChannelPtr StreamChannelTransport::establish(const std::string &name,
                                             std::unique_ptr<InputStream> in,
                                             std::unique_ptr<OutputStream> out, LogStreamPtr log,
                                             CloseCallback on_close)
{
    auto channel = std::make_shared<StreamChannel>(name, std::move(in), std::move(out),
                                                   std::move(log), std::move(on_close),
                                                   m_on_message);
    channel->handshake();
    channel->start();
    LOGGER_DEBUG("[Channel] '{}' established", name);
    return channel;
}

} // namespace agentgate::gate
