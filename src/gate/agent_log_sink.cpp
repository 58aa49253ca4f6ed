#include "agent_log_sink.hpp"

#include "agentgate_service.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace agentgate::gate
{

namespace
{

class FileLogStream final : public LogStream
{
  public:
    explicit FileLogStream(const std::filesystem::path &path) : m_path(path.string())
    {
        m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (m_fd == -1)
        {
            throw std::system_error(errno, std::generic_category(),
                                    "Failed to open agent log: " + m_path);
        }
    }

    ~FileLogStream() override
    {
        if (m_fd != -1)
            ::close(m_fd);
    }

    FileLogStream(const FileLogStream &) = delete;
    FileLogStream &operator=(const FileLogStream &) = delete;

    void write_line(std::string_view line) override
    {
        std::string entry = fmt::format(
            "[{}] {}\n", format_tools::formatted_time(std::chrono::system_clock::now()), line);

        std::lock_guard<std::mutex> lock(m_mutex);
        const char *p = entry.data();
        size_t left = entry.size();
        while (left > 0)
        {
            ssize_t n = ::write(m_fd, p, left);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw std::system_error(errno, std::generic_category(),
                                        "write to agent log '" + m_path + "' failed");
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
    }

    void flush() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // EINVAL: the target (e.g. /dev/null) does not support synchronization.
        if (::fsync(m_fd) != 0 && errno != EINVAL)
        {
            throw std::system_error(errno, std::generic_category(),
                                    "fsync of agent log '" + m_path + "' failed");
        }
    }

  private:
    std::string m_path;
    int m_fd = -1;
    std::mutex m_mutex;
};

} // namespace

FileAgentLogSink::FileAgentLogSink(std::filesystem::path directory)
    : m_directory(std::move(directory))
{
}

std::filesystem::path FileAgentLogSink::path_for(const std::string &agent_name) const
{
    return m_directory / (agent_name + ".log");
}

LogStreamPtr FileAgentLogSink::open(const std::string &agent_name)
{
    {
        std::lock_guard<std::mutex> lock(m_dir_mutex);
        std::error_code ec;
        std::filesystem::create_directories(m_directory, ec);
        if (ec)
        {
            throw std::system_error(ec, "Failed to create agent log directory " +
                                            m_directory.string());
        }
    }
    LOGGER_TRACE("[AgentLogSink] opening {}", path_for(agent_name).string());
    return std::make_shared<FileLogStream>(path_for(agent_name));
}

} // namespace agentgate::gate
