#include "crypto/Envelope.hpp"

#include "crypto/Cipher.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace stagehand::crypto::envelope
{
namespace
{
constexpr std::array<char, 8> kMagic{'S', 'T', 'G', 'H', 'E', 'N', 'C', '1'};
constexpr std::uint16_t kFormatVersion = 1;
constexpr std::size_t kHeaderSize = kMagic.size() + sizeof(std::uint16_t) + 2 * sizeof(std::uint32_t) + kSaltSize +
    kNonceSize;

void append_bytes(Buffer& buffer, std::span<const std::uint8_t> bytes)
{
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

void append_le16(Buffer& buffer, std::uint16_t value)
{
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

void append_le32(Buffer& buffer, std::uint32_t value)
{
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

std::uint16_t read_le16(std::span<const std::uint8_t>& data)
{
    if (data.size() < 2)
    {
        throw std::runtime_error{"Staging envelope truncated (u16)"};
    }
    const std::uint16_t value = static_cast<std::uint16_t>(data[0]) | (static_cast<std::uint16_t>(data[1]) << 8);
    data = data.subspan(2);
    return value;
}

std::uint32_t read_le32(std::span<const std::uint8_t>& data)
{
    if (data.size() < 4)
    {
        throw std::runtime_error{"Staging envelope truncated (u32)"};
    }
    const std::uint32_t value = static_cast<std::uint32_t>(data[0]) | (static_cast<std::uint32_t>(data[1]) << 8) |
        (static_cast<std::uint32_t>(data[2]) << 16) | (static_cast<std::uint32_t>(data[3]) << 24);
    data = data.subspan(4);
    return value;
}

// The header is read before authentication, so its costs are bounded before use.
void require_sane_costs(const Argon2idParams& params)
{
    if (params.opslimit < crypto_pwhash_OPSLIMIT_MIN || params.opslimit > crypto_pwhash_OPSLIMIT_SENSITIVE)
    {
        throw std::runtime_error{"Staging envelope has an invalid Argon2id opslimit"};
    }
    if (params.memlimit < crypto_pwhash_MEMLIMIT_MIN || params.memlimit > crypto_pwhash_MEMLIMIT_SENSITIVE)
    {
        throw std::runtime_error{"Staging envelope has an invalid Argon2id memlimit"};
    }
}

std::span<const std::uint8_t> take(std::span<const std::uint8_t>& data, std::size_t count)
{
    if (data.size() < count)
    {
        throw std::runtime_error{"Staging envelope truncated"};
    }
    const auto head = data.first(count);
    data = data.subspan(count);
    return head;
}
} // namespace

bool is_encrypted(std::span<const std::uint8_t> data) noexcept
{
    return data.size() >= kMagic.size() &&
        std::equal(kMagic.begin(), kMagic.end(), data.begin(),
            [](char expected, std::uint8_t actual) { return static_cast<std::uint8_t>(expected) == actual; });
}

Buffer encrypt(std::span<const std::uint8_t> plaintext, std::string_view passphrase, const Argon2idParams& params)
{
    if (passphrase.empty())
    {
        throw std::invalid_argument{"Passphrase must not be empty"};
    }

    Buffer blob;
    blob.reserve(kHeaderSize + sizeof(std::uint32_t) + plaintext.size() + kTagSize);
    blob.insert(blob.end(), kMagic.begin(), kMagic.end());
    append_le16(blob, kFormatVersion);
    append_le32(blob, params.opslimit);
    append_le32(blob, params.memlimit);

    std::array<std::uint8_t, kSaltSize> salt{};
    fill_random_bytes(salt);
    append_bytes(blob, salt);

    std::array<std::uint8_t, kNonceSize> nonce{};
    fill_random_bytes(nonce);
    append_bytes(blob, nonce);

    const auto key = derive_staging_key(passphrase, salt, params);
    const Buffer header{blob.begin(), blob.end()};
    const auto box = seal(key, nonce, plaintext, header);

    append_le32(blob, static_cast<std::uint32_t>(box.ciphertext.size()));
    append_bytes(blob, box.ciphertext);
    append_bytes(blob, box.tag);

    return blob;
}

Buffer decrypt(std::span<const std::uint8_t> data, std::string_view passphrase)
{
    if (!is_encrypted(data))
    {
        throw std::runtime_error{"Staging data is not encrypted"};
    }
    if (data.size() < kHeaderSize)
    {
        throw std::runtime_error{"Staging envelope truncated"};
    }

    const auto header = data.first(kHeaderSize);
    std::span<const std::uint8_t> cursor = data.subspan(kMagic.size());

    const auto version = read_le16(cursor);
    if (version != kFormatVersion)
    {
        throw std::runtime_error{"Unsupported staging envelope version"};
    }

    Argon2idParams params;
    params.opslimit = read_le32(cursor);
    params.memlimit = read_le32(cursor);
    require_sane_costs(params);
    const auto salt = take(cursor, kSaltSize);
    const auto nonce = take(cursor, kNonceSize);

    const auto ciphertext_length = read_le32(cursor);
    const auto ciphertext = take(cursor, ciphertext_length);
    const auto tag = take(cursor, kTagSize);
    if (!cursor.empty())
    {
        throw std::runtime_error{"Staging envelope has trailing bytes"};
    }

    const auto key = derive_staging_key(passphrase, salt, params);
    return open(key, nonce, ciphertext, tag, header);
}

} // namespace stagehand::crypto::envelope
