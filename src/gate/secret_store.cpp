#include "secret_store.hpp"

#include "agentgate_service.hpp"
#include "errors.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

namespace agentgate::gate
{

namespace
{

void write_new_secret_file(const std::filesystem::path &path, const std::string &hex)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            throw std::system_error(ec, "Failed to create directory for " + path.string());
        }
    }

    // O_EXCL: a concurrently created file wins; the caller re-reads it.
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd == -1)
    {
        if (errno == EEXIST)
            return;
        throw std::system_error(errno, std::generic_category(),
                                "Failed to create secret file " + path.string());
    }
    auto close_fd = basics::make_scope_guard([fd]() { ::close(fd); });

    const std::string content = hex + "\n";
    const char *p = content.data();
    size_t left = content.size();
    while (left > 0)
    {
        ssize_t n = ::write(fd, p, left);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(),
                                    "Failed to write secret file " + path.string());
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

} // namespace

FileSecretStore::FileSecretStore(std::filesystem::path path) : m_path(std::move(path))
{
    m_secret = load_or_create();
}

std::string FileSecretStore::current() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_secret;
}

void FileSecretStore::reload()
{
    std::string fresh = load_or_create();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_secret = std::move(fresh);
}

std::string FileSecretStore::load_or_create()
{
    if (!std::filesystem::exists(m_path))
    {
        LOGGER_INFO("[SecretStore] {} not found; generating a new agent secret", m_path.string());
        write_new_secret_file(m_path, crypto::generate_secret_hex());
    }

    std::ifstream in(m_path);
    if (!in)
    {
        throw std::system_error(errno, std::generic_category(),
                                "Failed to read secret file " + m_path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();

    const auto first = text.find_first_not_of(" \t\r\n");
    const auto last = text.find_last_not_of(" \t\r\n");
    std::string secret =
        first == std::string::npos ? std::string{} : text.substr(first, last - first + 1);
    if (!crypto::from_hex(secret))
    {
        throw ConfigError(
            fmt::format("Secret file '{}' does not contain a hex-encoded secret", m_path.string()));
    }
    return secret;
}

} // namespace agentgate::gate
