#include "errors.hpp"

#include <fmt/format.h>

#include <cerrno>

namespace agentgate::gate
{

IoError IoError::from_errno(const std::string &what)
{
    return IoError(std::error_code(errno, std::generic_category()), what);
}

IoError IoError::end_of_stream(const std::string &what)
{
    return IoError(std::make_error_code(std::errc::connection_aborted),
                   what + ": unexpected end of stream");
}

namespace
{

void append_level(std::string &out, const std::exception &e, int depth)
{
    if (depth > 0)
    {
        out += fmt::format("\n{:{}}Caused by: ", "", depth * 2);
    }

    if (const auto *io = dynamic_cast<const IoError *>(&e))
    {
        // std::system_error::what() already carries the category message.
        out += fmt::format("IoError: {} [{}:{}]", io->what(), io->code().category().name(),
                           io->code().value());
    }
    else if (dynamic_cast<const AbortError *>(&e) != nullptr)
    {
        out += fmt::format("AbortError: {}", e.what());
    }
    else
    {
        out += fmt::format("exception: {}", e.what());
    }

    try
    {
        std::rethrow_if_nested(e);
    }
    catch (const std::exception &nested)
    {
        append_level(out, nested, depth + 1);
    }
    catch (...)
    {
        out += fmt::format("\n{:{}}Caused by: unknown exception", "", (depth + 1) * 2);
    }
}

} // namespace

std::string format_exception_trace(const std::exception &e)
{
    std::string out;
    append_level(out, e, 0);
    return out;
}

std::string format_exception_trace(const std::exception_ptr &ep)
{
    if (!ep)
    {
        return "no exception";
    }
    try
    {
        std::rethrow_exception(ep);
    }
    catch (const std::exception &e)
    {
        return format_exception_trace(e);
    }
    catch (...)
    {
        return "unknown exception";
    }
}

} // namespace agentgate::gate
