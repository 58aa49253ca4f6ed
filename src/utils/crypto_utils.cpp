/**
 * @file crypto_utils.cpp
 * @brief Implementation of cryptographic helpers using libsodium.
 */
#include "utils/crypto_utils.hpp"
#include "agentgate_service.hpp"

#include <sodium.h>

#include <atomic>
#include <cctype>
#include <stdexcept>

namespace agentgate::crypto
{

namespace
{
std::atomic<bool> g_sodium_initialized{false};
} // namespace

bool ensure_initialized() noexcept
{
    if (g_sodium_initialized.load(std::memory_order_acquire))
    {
        return true;
    }

    // 0: first initialization, 1: already initialized, -1: failure
    int result = sodium_init();
    if (result == -1)
    {
        LOGGER_ERROR("[CryptoUtils] FATAL: sodium_init() failed!");
        return false;
    }

    g_sodium_initialized.store(true, std::memory_order_release);
    if (result == 0)
    {
        LOGGER_DEBUG("[CryptoUtils] libsodium initialized");
    }
    return true;
}

void generate_random_bytes(uint8_t *out, size_t len)
{
    if (!ensure_initialized())
    {
        throw std::runtime_error("CryptoUtils: libsodium is not available");
    }
    randombytes_buf(out, len);
}

std::string generate_secret_hex(size_t bytes)
{
    std::vector<uint8_t> buf(bytes);
    generate_random_bytes(buf.data(), buf.size());
    std::string hex = to_hex(buf.data(), buf.size());
    sodium_memzero(buf.data(), buf.size());
    return hex;
}

std::string to_hex(const uint8_t *data, size_t len)
{
    // sodium_bin2hex writes a terminating NUL.
    std::string hex(len * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data, len);
    hex.resize(len * 2);
    return hex;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex)
{
    while (!hex.empty() && std::isspace(static_cast<unsigned char>(hex.front())) != 0)
        hex.remove_prefix(1);
    while (!hex.empty() && std::isspace(static_cast<unsigned char>(hex.back())) != 0)
        hex.remove_suffix(1);
    if (hex.empty() || hex.size() % 2 != 0)
    {
        return std::nullopt;
    }

    std::vector<uint8_t> bin(hex.size() / 2);
    size_t bin_len = 0;
    const char *end = nullptr;
    if (sodium_hex2bin(bin.data(), bin.size(), hex.data(), hex.size(), nullptr, &bin_len, &end) !=
            0 ||
        end != hex.data() + hex.size())
    {
        return std::nullopt;
    }
    bin.resize(bin_len);
    return bin;
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    if (a.empty())
    {
        return true;
    }
    if (!ensure_initialized())
    {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace agentgate::crypto
