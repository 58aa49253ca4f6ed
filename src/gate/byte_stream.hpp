#pragma once
/**
 * @file byte_stream.hpp
 * @brief Blocking byte streams over a Socket and the handshake string codec.
 *
 * The handshake reads through unbuffered SocketInputStream so that no byte
 * belonging to the channel that follows is consumed early. Once the handshake
 * succeeds the same socket streams are wrapped in BufferedInputStream /
 * BufferedOutputStream and handed to the channel transport.
 *
 * Wire format of a handshake string: 2-byte unsigned big-endian byte count,
 * followed by that many bytes of UTF-8.
 */
#include "socket.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace agentgate::gate
{

/** Largest string the 2-byte length prefix can describe. */
inline constexpr size_t kMaxUtfBytes = 0xFFFF;

class InputStream
{
  public:
    virtual ~InputStream() = default;

    /**
     * @brief Reads up to @p len bytes, blocking until at least one is available.
     * @return Bytes read; 0 only at end of stream.
     * @throws IoError on transport failure.
     */
    virtual size_t read_some(void *buf, size_t len) = 0;

    /**
     * @brief Reads exactly @p len bytes.
     * @throws IoError on transport failure or if the stream ends first;
     *         @p what names the field being read.
     */
    void read_fully(void *buf, size_t len, const char *what);

    /// Wakes a reader blocked in read_some(); later reads report end of stream or fail.
    virtual void interrupt() noexcept {}
};

class OutputStream
{
  public:
    virtual ~OutputStream() = default;

    /** @throws IoError on transport failure. */
    virtual void write(const void *buf, size_t len) = 0;
    virtual void flush() {}
};

class SocketInputStream final : public InputStream
{
  public:
    explicit SocketInputStream(SocketPtr socket) : m_socket(std::move(socket)) {}
    size_t read_some(void *buf, size_t len) override;
    void interrupt() noexcept override { m_socket->shutdown(); }

  private:
    SocketPtr m_socket;
};

class SocketOutputStream final : public OutputStream
{
  public:
    explicit SocketOutputStream(SocketPtr socket) : m_socket(std::move(socket)) {}
    void write(const void *buf, size_t len) override;

  private:
    SocketPtr m_socket;
};

class BufferedInputStream final : public InputStream
{
  public:
    explicit BufferedInputStream(std::unique_ptr<InputStream> inner, size_t capacity = 8192);
    size_t read_some(void *buf, size_t len) override;
    void interrupt() noexcept override { m_inner->interrupt(); }

  private:
    std::unique_ptr<InputStream> m_inner;
    std::vector<uint8_t> m_buf;
    size_t m_pos = 0;
    size_t m_end = 0;
};

/// Collects writes until flush() or until the buffer fills.
class BufferedOutputStream final : public OutputStream
{
  public:
    explicit BufferedOutputStream(std::unique_ptr<OutputStream> inner, size_t capacity = 8192);
    void write(const void *buf, size_t len) override;
    void flush() override;

  private:
    std::unique_ptr<OutputStream> m_inner;
    std::vector<uint8_t> m_buf;
    size_t m_capacity;
};

/** @brief True if @p bytes is well-formed UTF-8 (no overlongs, surrogates or code points past U+10FFFF). */
[[nodiscard]] bool is_valid_utf8(std::string_view bytes) noexcept;

/**
 * @brief Reads one length-prefixed UTF-8 string.
 * @throws IoError on end of stream, transport failure or malformed UTF-8.
 */
std::string read_utf(InputStream &in, const char *what = "string");

/**
 * @brief Writes one length-prefixed UTF-8 string and flushes.
 * @throws std::length_error if @p text exceeds kMaxUtfBytes.
 */
void write_utf(OutputStream &out, std::string_view text);

/** @brief Writes @p text followed by '\n' and flushes. */
void write_line(OutputStream &out, std::string_view text);

} // namespace agentgate::gate
