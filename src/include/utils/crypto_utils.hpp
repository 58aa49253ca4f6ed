#pragma once
/**
 * @file crypto_utils.hpp
 * @brief Cryptographic helpers for the agent admission secret.
 *
 * - Random byte generation for the controller's shared secret
 * - Hex encoding/decoding of secrets for on-disk storage
 * - Constant-time comparison of secrets presented by peers
 *
 * All primitives are provided by libsodium. `sodium_init()` is called lazily
 * on first use; it is idempotent and thread-safe. No libsodium types appear in
 * this header.
 *
 * @see https://libsodium.gitbook.io/doc/
 */
#include "agentgate_utils_export.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentgate::crypto
{

/** Number of random bytes in a freshly generated admission secret (256 bits). */
static constexpr size_t SECRET_BYTES = 32;

/**
 * @brief Initializes libsodium if it has not been initialized yet.
 * @return True on success, false if sodium_init() failed.
 */
AGENTGATE_UTILS_EXPORT bool ensure_initialized() noexcept;

/**
 * @brief Fills @p out with @p len cryptographically secure random bytes.
 * @throws std::runtime_error if libsodium cannot be initialized.
 */
AGENTGATE_UTILS_EXPORT void generate_random_bytes(uint8_t *out, size_t len);

/**
 * @brief Generates a random secret and returns it hex-encoded (2 * @p bytes chars).
 * @throws std::runtime_error if libsodium cannot be initialized.
 */
AGENTGATE_UTILS_EXPORT std::string generate_secret_hex(size_t bytes = SECRET_BYTES);

/** @brief Lower-case hex encoding of @p data. */
AGENTGATE_UTILS_EXPORT std::string to_hex(const uint8_t *data, size_t len);

/**
 * @brief Decodes a hex string. Surrounding whitespace is ignored.
 * @return The decoded bytes, or std::nullopt if @p hex is not valid hex.
 */
AGENTGATE_UTILS_EXPORT std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

/**
 * @brief Compares two byte strings in time independent of their contents.
 *
 * Lengths are compared first (length is not treated as secret); equal-length
 * inputs are compared with sodium_memcmp().
 */
AGENTGATE_UTILS_EXPORT bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

} // namespace agentgate::crypto
