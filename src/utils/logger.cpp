/*******************************************************************************
 * @file logger.cpp
 * @brief Writer thread, destinations and job queue behind utils::Logger.
 *
 * Every public call turns into a Job appended to `pending_`. The writer thread
 * swaps the pending batch out under the lock and runs it unlocked, so a slow
 * destination only ever stalls the writer.
 *
 * Errors raised by a destination are handed to the user callback through
 * ErrorRelay, which runs callbacks on its own thread: a callback that logs
 * would otherwise enqueue from inside the writer.
 ******************************************************************************/

#include "agentgate_base.hpp"
#include "utils/logger.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <fcntl.h>
#include <sys/syscall.h>
#include <syslog.h>
#include <unistd.h>

namespace agentgate::utils
{

namespace
{

using ErrorCallback = std::function<void(const std::string &)>;

const char *level_tag(Logger::Level lvl) noexcept
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE: return "TRACE";
    case Logger::Level::L_DEBUG: return "DEBUG";
    case Logger::Level::L_INFO: return "INFO";
    case Logger::Level::L_WARNING: return "WARN";
    case Logger::Level::L_ERROR: return "ERROR";
    case Logger::Level::L_SYSTEM: return "SYSTEM";
    }
    return "?";
}

uint64_t current_tid() noexcept
{
#if defined(__linux__)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

struct Record
{
    Logger::Level level;
    std::chrono::system_clock::time_point when;
    uint64_t tid;
    std::string text;

    static Record now(Logger::Level level, std::string text)
    {
        return Record{level, std::chrono::system_clock::now(), current_tid(), std::move(text)};
    }

    std::string render() const
    {
        return fmt::format("[{}] [{:<6}] [{:5}] {}\n", format_tools::formatted_time(when),
                           level_tag(level), tid, text);
    }
};

void print_fallback(const Record &rec)
{
    fmt::print(stderr, "[agentgate::Logger-fallback] {}", rec.render());
}

// ============================================================================
// Destinations
// ============================================================================

/// A log destination. Only the writer thread touches one after construction.
class Destination
{
  public:
    virtual ~Destination() = default;
    virtual void put(const Record &rec) = 0;
    virtual void sync() = 0;
    virtual std::string label() const = 0;
};

class StderrDestination final : public Destination
{
  public:
    void put(const Record &rec) override { fmt::print(stderr, "{}", rec.render()); }
    void sync() override { std::fflush(stderr); }
    std::string label() const override { return "Console"; }
};

class FileDestination final : public Destination
{
  public:
    explicit FileDestination(std::string path) : path_(std::move(path))
    {
        fd_ = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0)
        {
            throw std::runtime_error(
                fmt::format("cannot open log file '{}': {}", path_, std::strerror(errno)));
        }
    }

    ~FileDestination() override { ::close(fd_); }

    FileDestination(const FileDestination &) = delete;
    FileDestination &operator=(const FileDestination &) = delete;

    void put(const Record &rec) override
    {
        // A whole line per write(2) so O_APPEND never interleaves partial lines.
        const std::string line = rec.render();
        if (::write(fd_, line.data(), line.size()) < 0)
        {
            throw std::runtime_error(
                fmt::format("write to log file '{}' failed: {}", path_, std::strerror(errno)));
        }
    }

    void sync() override
    {
        // EINVAL: the path names something that cannot be synced, e.g. /dev/stderr.
        if (::fdatasync(fd_) != 0 && errno != EINVAL)
        {
            throw std::runtime_error(
                fmt::format("sync of log file '{}' failed: {}", path_, std::strerror(errno)));
        }
    }

    std::string label() const override { return "File: " + path_; }

  private:
    std::string path_;
    int fd_{-1};
};

class SyslogDestination final : public Destination
{
  public:
    SyslogDestination(const char *ident, int option, int facility)
    {
        ::openlog(ident, option, facility);
    }
    ~SyslogDestination() override { ::closelog(); }

    void put(const Record &rec) override
    {
        ::syslog(priority_of(rec.level), "%.*s", static_cast<int>(rec.text.size()),
                 rec.text.data());
    }
    void sync() override {}
    std::string label() const override { return "Syslog"; }

  private:
    static int priority_of(Logger::Level lvl) noexcept
    {
        switch (lvl)
        {
        case Logger::Level::L_TRACE:
        case Logger::Level::L_DEBUG: return LOG_DEBUG;
        case Logger::Level::L_INFO: return LOG_INFO;
        case Logger::Level::L_WARNING: return LOG_WARNING;
        case Logger::Level::L_ERROR: return LOG_ERR;
        case Logger::Level::L_SYSTEM: return LOG_CRIT;
        }
        return LOG_INFO;
    }
};

// ============================================================================
// ErrorRelay: runs error callbacks away from the writer thread
// ============================================================================

class ErrorRelay
{
  public:
    ErrorRelay() : thread_([this] { loop(); }) {}
    ~ErrorRelay() { stop(); }

    ErrorRelay(const ErrorRelay &) = delete;
    ErrorRelay &operator=(const ErrorRelay &) = delete;

    void deliver(ErrorCallback cb, std::string message)
    {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (stopping_)
                return;
            backlog_.emplace_back(std::move(cb), std::move(message));
        }
        cv_.notify_one();
    }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (stopping_)
                return;
            stopping_ = true;
        }
        cv_.notify_one();
        thread_.join();
    }

  private:
    void loop()
    {
        std::unique_lock<std::mutex> lock(mu_);
        while (true)
        {
            cv_.wait(lock, [this] { return stopping_ || !backlog_.empty(); });
            if (backlog_.empty())
                return;
            auto [cb, message] = std::move(backlog_.front());
            backlog_.pop_front();
            lock.unlock();
            try
            {
                cb(message);
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[agentgate::Logger] error callback threw: {}\n", e.what());
            }
            lock.lock();
        }
    }

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::pair<ErrorCallback, std::string>> backlog_;
    bool stopping_{false};
    std::thread thread_;
};

// ============================================================================
// Jobs
// ============================================================================

struct SwitchTo
{
    std::unique_ptr<Destination> next;
};
struct ReportFailure
{
    std::string message;
};
struct Barrier
{
    std::shared_ptr<std::promise<void>> done;
};
struct ReplaceCallback
{
    ErrorCallback cb;
};

using Job = std::variant<Record, SwitchTo, ReportFailure, Barrier, ReplaceCallback>;

template <typename... Fs>
struct Overloaded : Fs...
{
    using Fs::operator()...;
};
template <typename... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

/// Disposes of a job that arrived after shutdown without losing its effect.
void discard_late(Job &job)
{
    if (auto *rec = std::get_if<Record>(&job))
        print_fallback(*rec);
    else if (auto *barrier = std::get_if<Barrier>(&job))
        barrier->done->set_value();
}

} // namespace

// ============================================================================
// Logger::Impl
// ============================================================================

struct Logger::Impl
{
    Impl() : dest_(std::make_unique<StderrDestination>()), writer_([this] { run(); }) {}

    ~Impl()
    {
        if (!closed_.load())
        {
            fmt::print(stderr, "[agentgate::Logger] shutdown() was never called; draining now\n");
            stop();
        }
    }

    void post(Job &&job)
    {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (!closed_.load(std::memory_order_relaxed))
            {
                pending_.push_back(std::move(job));
                cv_.notify_one();
                return;
            }
        }
        discard_late(job);
    }

    void stop()
    {
        std::lock_guard<std::mutex> once(stop_mu_);
        if (joined_)
            return;
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_.store(true);
        }
        cv_.notify_one();
        writer_.join();
        relay_.stop();
        dest_.reset();
        joined_ = true;
    }

    void fail(const std::string &message)
    {
        if (on_error_)
            relay_.deliver(on_error_, message);
        else
            fmt::print(stderr, "[agentgate::Logger] {}\n", message);
    }

    void execute(Job &job)
    {
        std::visit(Overloaded{
                       [this](Record &rec)
                       {
                           if (rec.level >= threshold_.load(std::memory_order_relaxed))
                               dest_->put(rec);
                       },
                       [this](SwitchTo &sw)
                       {
                           const std::string previous = dest_->label();
                           dest_->put(Record::now(Level::L_SYSTEM,
                                                  "Switching log sink to: " + sw.next->label()));
                           dest_->sync();
                           dest_ = std::move(sw.next);
                           dest_->put(
                               Record::now(Level::L_SYSTEM, "Log sink switched from: " + previous));
                       },
                       [this](ReportFailure &f) { fail(f.message); },
                       [this](Barrier &b)
                       {
                           auto release = basics::make_scope_guard([&b]() { b.done->set_value(); });
                           dest_->sync();
                       },
                       [this](ReplaceCallback &r) { on_error_ = std::move(r.cb); },
                   },
                   job);
    }

    void run()
    {
        std::vector<Job> batch;
        for (;;)
        {
            {
                std::unique_lock<std::mutex> lock(mu_);
                cv_.wait(lock, [this] { return closed_.load() || !pending_.empty(); });
                if (pending_.empty())
                    break; // closed and drained
                batch.swap(pending_);
            }
            for (Job &job : batch)
            {
                try
                {
                    execute(job);
                }
                catch (const std::exception &e)
                {
                    fail(fmt::format("Logger worker error: {}", e.what()));
                }
            }
            batch.clear();
        }
        try
        {
            dest_->sync();
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "[agentgate::Logger] final sync failed: {}\n", e.what());
        }
    }

    std::mutex mu_;
    std::condition_variable cv_;
    std::vector<Job> pending_;
    std::atomic<bool> closed_{false};

    std::mutex stop_mu_;
    bool joined_{false};

    std::atomic<Level> threshold_{Level::L_INFO};

    // Writer-thread state.
    std::unique_ptr<Destination> dest_;
    ErrorCallback on_error_;
    ErrorRelay relay_;

    std::thread writer_; // last: started after everything it reads exists
};

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_console()
{
    impl_->post(SwitchTo{std::make_unique<StderrDestination>()});
}

void Logger::set_logfile(const std::string &utf8_path)
{
    std::unique_ptr<Destination> file;
    try
    {
        file = std::make_unique<FileDestination>(utf8_path);
    }
    catch (const std::exception &e)
    {
        impl_->post(ReportFailure{fmt::format("Failed to create FileSink: {}", e.what())});
        return;
    }
    impl_->post(SwitchTo{std::move(file)});
}

void Logger::set_syslog(const char *ident, int option, int facility)
{
    impl_->post(SwitchTo{std::make_unique<SyslogDestination>(ident ? ident : "agentgate", option,
                                                             facility)});
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    impl_->post(ReplaceCallback{std::move(cb)});
}

void Logger::set_level(Level lvl)
{
    impl_->threshold_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return impl_->threshold_.load(std::memory_order_relaxed);
}

void Logger::flush()
{
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> waited = done->get_future();
    impl_->post(Barrier{std::move(done)});
    waited.wait();
}

void Logger::shutdown()
{
    impl_->stop();
}

bool Logger::enabled(Level lvl) const noexcept
{
    return lvl >= impl_->threshold_.load(std::memory_order_relaxed);
}

void Logger::submit(Level lvl, std::string &&line) noexcept
{
    try
    {
        impl_->post(Record::now(lvl, std::move(line)));
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[agentgate::Logger] dropped a log line: {}\n", e.what());
    }
}

bool parse_log_level(std::string_view name, Logger::Level &out) noexcept
{
    static constexpr std::pair<std::string_view, Logger::Level> kNames[] = {
        {"trace", Logger::Level::L_TRACE},   {"debug", Logger::Level::L_DEBUG},
        {"info", Logger::Level::L_INFO},     {"warn", Logger::Level::L_WARNING},
        {"warning", Logger::Level::L_WARNING}, {"error", Logger::Level::L_ERROR},
        {"system", Logger::Level::L_SYSTEM},
    };
    for (const auto &[key, lvl] : kNames)
    {
        if (key == name)
        {
            out = lvl;
            return true;
        }
    }
    return false;
}

} // namespace agentgate::utils
