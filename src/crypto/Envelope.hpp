#pragma once

#include "crypto/KeyDerivation.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace stagehand::crypto
{

/**
 * @brief Passphrase envelope around a serialized staging state.
 *
 * The layout is:
 *  - Magic header "STGHENC1" (8 bytes) and format version (uint16_t, little endian)
 *  - Argon2id opslimit and memlimit (uint32_t each)
 *  - Salt (crypto_pwhash_SALTBYTES bytes) and nonce (12 bytes)
 *  - Ciphertext length (uint32_t), ciphertext bytes, and 16-byte tag
 *
 * Everything before the ciphertext length is authenticated as associated data.
 */
namespace envelope
{
using Buffer = std::vector<std::uint8_t>;

[[nodiscard]] bool is_encrypted(std::span<const std::uint8_t> data) noexcept;

[[nodiscard]] Buffer encrypt(
    std::span<const std::uint8_t> plaintext,
    std::string_view passphrase,
    const Argon2idParams& params);

/**
 * @throws AuthenticationError on a wrong passphrase or tampered payload.
 * @throws std::runtime_error if the data is not a well-formed envelope.
 */
[[nodiscard]] Buffer decrypt(std::span<const std::uint8_t> data, std::string_view passphrase);

} // namespace envelope
} // namespace stagehand::crypto
