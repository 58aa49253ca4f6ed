#pragma once
/**
 * @file agent_log_sink.hpp
 * @brief Per-agent append-only log files.
 *
 * Each registered agent gets its own log, separate from the process Logger.
 * The connection handler writes the connection banner and establishment
 * failures there; the channel writes its termination line there.
 */
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace agentgate::gate
{

class LogStream
{
  public:
    virtual ~LogStream() = default;

    /// Appends one line. Embedded newlines are kept (used for exception traces).
    virtual void write_line(std::string_view line) = 0;
    virtual void flush() = 0;
};

using LogStreamPtr = std::shared_ptr<LogStream>;

class AgentLogSink
{
  public:
    virtual ~AgentLogSink() = default;

    /**
     * @brief Opens (creating if needed) the log of agent @p agent_name.
     * @throws std::system_error if the log cannot be opened.
     */
    virtual LogStreamPtr open(const std::string &agent_name) = 0;
};

/**
 * @class FileAgentLogSink
 * @brief Writes `<directory>/<agent>.log`, one timestamped line per entry.
 *
 * The directory is created on first use.
 */
class FileAgentLogSink final : public AgentLogSink
{
  public:
    explicit FileAgentLogSink(std::filesystem::path directory);

    LogStreamPtr open(const std::string &agent_name) override;

    [[nodiscard]] std::filesystem::path path_for(const std::string &agent_name) const;

  private:
    std::filesystem::path m_directory;
    std::mutex m_dir_mutex;
};

} // namespace agentgate::gate
