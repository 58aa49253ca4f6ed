#include "byte_stream.hpp"

#include "errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace agentgate::gate
{

// ============================================================================
// InputStream
// ============================================================================

void InputStream::read_fully(void *buf, size_t len, const char *what)
{
    auto *p = static_cast<uint8_t *>(buf);
    size_t got = 0;
    while (got < len)
    {
        size_t n = 0;
        try
        {
            n = read_some(p + got, len - got);
        }
        catch (const IoError &e)
        {
            std::throw_with_nested(IoError(e.code(), fmt::format("reading {}", what)));
        }
        if (n == 0)
        {
            throw IoError::end_of_stream(
                fmt::format("reading {} ({} of {} bytes received)", what, got, len));
        }
        got += n;
    }
}

// ============================================================================
// Socket streams
// ============================================================================

size_t SocketInputStream::read_some(void *buf, size_t len)
{
    return m_socket->recv_some(buf, len);
}

void SocketOutputStream::write(const void *buf, size_t len)
{
    m_socket->send_all(buf, len);
}

// ============================================================================
// Buffered streams
// ============================================================================

BufferedInputStream::BufferedInputStream(std::unique_ptr<InputStream> inner, size_t capacity)
    : m_inner(std::move(inner)), m_buf(capacity)
{
}

size_t BufferedInputStream::read_some(void *buf, size_t len)
{
    if (len == 0)
    {
        return 0;
    }
    if (m_pos == m_end)
    {
        // Large reads bypass the buffer.
        if (len >= m_buf.size())
        {
            return m_inner->read_some(buf, len);
        }
        m_pos = 0;
        m_end = m_inner->read_some(m_buf.data(), m_buf.size());
        if (m_end == 0)
        {
            return 0;
        }
    }
    const size_t n = std::min(len, m_end - m_pos);
    std::memcpy(buf, m_buf.data() + m_pos, n);
    m_pos += n;
    return n;
}

BufferedOutputStream::BufferedOutputStream(std::unique_ptr<OutputStream> inner, size_t capacity)
    : m_inner(std::move(inner)), m_capacity(capacity)
{
    m_buf.reserve(m_capacity);
}

void BufferedOutputStream::write(const void *buf, size_t len)
{
    if (m_buf.size() + len > m_capacity)
    {
        flush();
        if (len >= m_capacity)
        {
            m_inner->write(buf, len);
            return;
        }
    }
    const auto *p = static_cast<const uint8_t *>(buf);
    m_buf.insert(m_buf.end(), p, p + len);
}

void BufferedOutputStream::flush()
{
    if (!m_buf.empty())
    {
        // Drop the pending bytes even if the write fails; the stream is dead then.
        std::vector<uint8_t> pending;
        pending.swap(m_buf);
        m_buf.reserve(m_capacity);
        m_inner->write(pending.data(), pending.size());
    }
    m_inner->flush();
}

// ============================================================================
// Length-prefixed UTF-8
// ============================================================================

bool is_valid_utf8(std::string_view bytes) noexcept
{
    const auto *s = reinterpret_cast<const unsigned char *>(bytes.data());
    const size_t n = bytes.size();
    size_t i = 0;
    while (i < n)
    {
        const unsigned char c = s[i];
        if (c < 0x80)
        {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t cp = 0;
        if (c >= 0xC2 && c <= 0xDF)
        {
            extra = 1;
            cp = c & 0x1F;
        }
        else if (c >= 0xE0 && c <= 0xEF)
        {
            extra = 2;
            cp = c & 0x0F;
        }
        else if (c >= 0xF0 && c <= 0xF4)
        {
            extra = 3;
            cp = c & 0x07;
        }
        else
        {
            return false; // continuation byte, overlong 2-byte lead, or > U+10FFFF lead
        }

        if (i + extra >= n)
        {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k)
        {
            const unsigned char cc = s[i + k];
            if ((cc & 0xC0) != 0x80)
            {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if ((extra == 2 && cp < 0x800) || (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)))
        {
            return false;
        }
        if (cp >= 0xD800 && cp <= 0xDFFF)
        {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string read_utf(InputStream &in, const char *what)
{
    uint8_t prefix[2];
    in.read_fully(prefix, sizeof(prefix), what);
    const size_t len = (static_cast<size_t>(prefix[0]) << 8) | prefix[1];

    std::string text(len, '\0');
    if (len > 0)
    {
        in.read_fully(text.data(), len, what);
    }
    if (!is_valid_utf8(text))
    {
        throw IoError(std::make_error_code(std::errc::illegal_byte_sequence),
                      fmt::format("reading {}: malformed UTF-8 input", what));
    }
    return text;
}

void write_utf(OutputStream &out, std::string_view text)
{
    if (text.size() > kMaxUtfBytes)
    {
        throw std::length_error(
            fmt::format("write_utf: {} bytes exceed the 65535-byte limit", text.size()));
    }
    const uint8_t prefix[2] = {static_cast<uint8_t>(text.size() >> 8),
                               static_cast<uint8_t>(text.size() & 0xFF)};
    out.write(prefix, sizeof(prefix));
    out.write(text.data(), text.size());
    out.flush();
}

void write_line(OutputStream &out, std::string_view text)
{
    out.write(text.data(), text.size());
    out.write("\n", 1);
    out.flush();
}

} // namespace agentgate::gate
