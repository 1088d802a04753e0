#pragma once

#include "stagehand/core/Settings.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <sodium.h>

namespace stagehand::crypto
{

inline constexpr std::size_t kSaltSize = crypto_pwhash_SALTBYTES;

/**
 * @brief Argon2id cost parameters.
 *
 * Both limits are recorded in the envelope header so a file stays readable
 * after the configured profile changes.
 */
struct Argon2idParams
{
    std::uint32_t opslimit{static_cast<std::uint32_t>(crypto_pwhash_OPSLIMIT_MODERATE)};
    std::uint32_t memlimit{static_cast<std::uint32_t>(crypto_pwhash_MEMLIMIT_MODERATE)};
};

[[nodiscard]] Argon2idParams params_for(core::KdfProfile profile);

/**
 * @brief Derive the AES-256 key for a staging file.
 *
 * Argon2id stretches the passphrase, then HKDF-SHA256 binds the result to the
 * staging file context so the same passphrase never yields a key usable elsewhere.
 *
 * @throws std::invalid_argument if the salt has an unexpected size.
 * @throws std::runtime_error if libsodium or OpenSSL fail.
 */
[[nodiscard]] std::vector<std::uint8_t> derive_staging_key(
    std::string_view passphrase,
    std::span<const std::uint8_t> salt,
    const Argon2idParams& params);

//! Thread-safe and idempotent; throws std::runtime_error if libsodium cannot start.
void ensure_sodium_ready();

void fill_random_bytes(std::span<std::uint8_t> destination);

} // namespace stagehand::crypto
