#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace stagehand::crypto
{

inline constexpr std::size_t kKeySize = 32;
inline constexpr std::size_t kNonceSize = 12;
inline constexpr std::size_t kTagSize = 16;

/**
 * @brief Raised when AES-256-GCM rejects the tag, i.e. wrong key or tampered data.
 *
 * Every other failure inside the cipher is a plain std::runtime_error.
 */
class AuthenticationError : public std::runtime_error
{
public:
    explicit AuthenticationError(const std::string& message)
        : std::runtime_error{message}
    {
    }
};

struct SealedBox
{
    std::vector<std::uint8_t> ciphertext;
    std::array<std::uint8_t, kTagSize> tag{};
};

/**
 * @brief Encrypt plaintext with AES-256-GCM.
 *
 * @param key          32-byte key.
 * @param nonce        12-byte nonce, never reused with the same key.
 * @param plaintext    Data to encrypt.
 * @param associated   Additional authenticated data (the envelope header).
 */
[[nodiscard]] SealedBox seal(
    std::span<const std::uint8_t> key,
    std::span<const std::uint8_t> nonce,
    std::span<const std::uint8_t> plaintext,
    std::span<const std::uint8_t> associated = {});

/**
 * @brief Decrypt and authenticate an AES-256-GCM box.
 *
 * @throws AuthenticationError if the tag does not verify.
 * @throws std::invalid_argument if key or nonce have the wrong size.
 */
[[nodiscard]] std::vector<std::uint8_t> open(
    std::span<const std::uint8_t> key,
    std::span<const std::uint8_t> nonce,
    std::span<const std::uint8_t> ciphertext,
    std::span<const std::uint8_t> tag,
    std::span<const std::uint8_t> associated = {});

} // namespace stagehand::crypto
