#pragma once
/**
 * @file secret_store.hpp
 * @brief Source of the shared admission secret presented by connecting agents.
 */
#include <filesystem>
#include <mutex>
#include <string>

namespace agentgate::gate
{

class SecretStore
{
  public:
    virtual ~SecretStore() = default;

    /// The secret a connecting agent must present, as the exact byte string sent on the wire.
    [[nodiscard]] virtual std::string current() const = 0;
};

class StaticSecretStore final : public SecretStore
{
  public:
    explicit StaticSecretStore(std::string secret) : m_secret(std::move(secret)) {}
    [[nodiscard]] std::string current() const override { return m_secret; }

  private:
    std::string m_secret;
};

/**
 * @class FileSecretStore
 * @brief Keeps the secret as hex text in a file.
 *
 * If the file does not exist it is created (mode 0600) with a fresh
 * crypto::SECRET_BYTES random secret in lower-case hex. The file's text,
 * minus surrounding whitespace, is the secret agents present; its case is
 * kept as written. The file is read once, at construction; reload() re-reads it.
 */
class FileSecretStore final : public SecretStore
{
  public:
    /**
     * @throws ConfigError if the file exists but does not hold a hex secret.
     * @throws std::system_error if the file cannot be read or created.
     */
    explicit FileSecretStore(std::filesystem::path path);

    [[nodiscard]] std::string current() const override;

    /// Re-reads the file. Throws like the constructor; the old secret stays on failure.
    void reload();

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

  private:
    std::string load_or_create();

    std::filesystem::path m_path;
    mutable std::mutex m_mutex;
    std::string m_secret;
};

} // namespace agentgate::gate
