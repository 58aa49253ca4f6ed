#pragma once
/**
 * @file errors.hpp
 * @brief Exception types shared by the socket, channel and handshake layers.
 *
 * Two failure families leave channel establishment:
 *  - IoError:    the transport itself failed (EOF, reset, malformed framing,
 *                read deadline). Carries a std::error_code.
 *  - AbortError: the application decided the connection must not proceed
 *                (e.g. the peer is not speaking the channel protocol).
 *
 * Handshake rejections (bad secret, unknown agent, duplicate connection) are
 * expected outcomes and are NOT exceptions; see connection_handler.hpp.
 */
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

namespace agentgate::gate
{

class IoError : public std::system_error
{
  public:
    IoError(std::error_code ec, const std::string &what) : std::system_error(ec, what) {}

    /// Builds an IoError from the current errno.
    static IoError from_errno(const std::string &what);

    /// Peer closed the stream before the expected number of bytes arrived.
    static IoError end_of_stream(const std::string &what);
};

class AbortError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Renders an exception and its std::nested_exception chain.
 *
 * One line per level, outermost first, each with the dynamic type category
 * (IoError / AbortError / exception) and the error code where one exists:
 * @code
 * IoError: channel preamble: Connection reset by peer [generic:104]
 *   Caused by: IoError: recv: Connection reset by peer [generic:104]
 * @endcode
 */
std::string format_exception_trace(const std::exception &e);

/// Same as above for an exception_ptr; returns "unknown exception" for non-std types.
std::string format_exception_trace(const std::exception_ptr &ep);

} // namespace agentgate::gate
