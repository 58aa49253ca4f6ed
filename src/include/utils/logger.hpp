/*******************************************************************************
 * @file logger.hpp
 * @brief Process-wide asynchronous logger used by the controller and its tests.
 *
 * Callers format on their own thread and hand the finished line to a single
 * background writer, so a handshake thread never waits on disk or syslog. The
 * writer owns exactly one destination at a time:
 *
 *   - console (stderr), the default after start-up;
 *   - an append-only file;
 *   - syslog.
 *
 * Switching destination, changing the error callback and flushing travel
 * through the same queue as log lines, so they take effect in call order.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("Agent '{}' connected from {}", name, peer);
 *
 * auto &log = Logger::instance();
 * log.set_logfile("/var/log/agentgate/controller.log");
 * log.set_level(Logger::Level::L_DEBUG);
 * ...
 * log.shutdown(); // once, before main() returns
 * ```
 *
 * The Logger cannot be restarted after shutdown(); later messages go straight
 * to stderr with a fallback prefix.
 ******************************************************************************/

#pragma once

#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "agentgate_utils_export.h"

// Messages below this level are compiled out entirely (0 = trace ... 5 = system).
#ifndef AGENTGATE_LOG_FLOOR
#define AGENTGATE_LOG_FLOOR 0
#endif

namespace agentgate::utils
{

class AGENTGATE_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    ~Logger();

    // --- Destinations (queued, non-blocking) ---

    void set_console();

    /// Appends to @p utf8_path. A file that cannot be opened is reported
    /// through the write-error callback and the current destination stays.
    void set_logfile(const std::string &utf8_path);

    void set_syslog(const char *ident = nullptr, int option = 0, int facility = 0);

    /// Invoked on a helper thread when a destination cannot be opened or written.
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Level ---

    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /// Returns once every line queued before the call has reached the destination.
    void flush();

    /// Drains the queue and stops the writer thread. Idempotent.
    void shutdown();

    template <Level L, typename... Args>
    void write(fmt::format_string<Args...> pattern, Args &&...args) noexcept
    {
        if constexpr (static_cast<int>(L) >= AGENTGATE_LOG_FLOOR)
        {
            if (!enabled(L))
                return;
            std::string line;
            try
            {
                fmt::memory_buffer buf;
                fmt::format_to(std::back_inserter(buf), pattern, std::forward<Args>(args)...);
                line.assign(buf.data(), buf.size());
            }
            catch (const std::exception &e)
            {
                line = fmt::format("<unformattable log line: {}>", e.what());
            }
            submit(L, std::move(line));
        }
    }

  private:
    Logger();

    bool enabled(Level lvl) const noexcept;
    void submit(Level lvl, std::string &&line) noexcept;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Maps a configuration name to a Level.
 *
 * Accepts "trace", "debug", "info", "warn" or "warning", "error" and "system".
 * Leaves @p out untouched and returns false for anything else.
 */
AGENTGATE_UTILS_EXPORT bool parse_log_level(std::string_view name, Logger::Level &out) noexcept;

} // namespace agentgate::utils

#define AGENTGATE_LOG_AT_(lvl, fmt, ...)                                                          \
    ::agentgate::utils::Logger::instance().write<::agentgate::utils::Logger::Level::lvl>(        \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE(fmt, ...) AGENTGATE_LOG_AT_(L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...) AGENTGATE_LOG_AT_(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...) AGENTGATE_LOG_AT_(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...) AGENTGATE_LOG_AT_(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...) AGENTGATE_LOG_AT_(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...) AGENTGATE_LOG_AT_(L_SYSTEM, fmt __VA_OPT__(, ) __VA_ARGS__)
