#include "crypto/Cipher.hpp"

#include <openssl/evp.h>

namespace stagehand::crypto
{
namespace
{
class EvpCipherCtx
{
public:
    EvpCipherCtx()
        : ctx_{EVP_CIPHER_CTX_new()}
    {
        if (!ctx_)
        {
            throw std::runtime_error{"Failed to allocate EVP_CIPHER_CTX"};
        }
    }

    ~EvpCipherCtx()
    {
        EVP_CIPHER_CTX_free(ctx_);
    }

    EvpCipherCtx(const EvpCipherCtx&) = delete;
    EvpCipherCtx& operator=(const EvpCipherCtx&) = delete;

    EVP_CIPHER_CTX* get() noexcept { return ctx_; }

private:
    EVP_CIPHER_CTX* ctx_;
};

void check_parameters(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce)
{
    if (key.size() != kKeySize)
    {
        throw std::invalid_argument{"AES-256-GCM requires a 32-byte key"};
    }
    if (nonce.size() != kNonceSize)
    {
        throw std::invalid_argument{"AES-256-GCM nonce must be 12 bytes"};
    }
}

void check(int status, const char* what)
{
    if (status != 1)
    {
        throw std::runtime_error{what};
    }
}

int as_length(std::size_t size)
{
    return static_cast<int>(size);
}
} // namespace

SealedBox seal(
    std::span<const std::uint8_t> key,
    std::span<const std::uint8_t> nonce,
    std::span<const std::uint8_t> plaintext,
    std::span<const std::uint8_t> associated)
{
    check_parameters(key, nonce);

    EvpCipherCtx ctx;
    check(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr), "EVP_EncryptInit_ex failed");
    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, as_length(nonce.size()), nullptr),
        "Failed to set IV length");
    check(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()),
        "Failed to initialise AES-256-GCM key");

    int len = 0;
    if (!associated.empty())
    {
        check(EVP_EncryptUpdate(ctx.get(), nullptr, &len, associated.data(), as_length(associated.size())),
            "Failed to process associated data");
    }

    SealedBox box;
    box.ciphertext.resize(plaintext.size());
    check(EVP_EncryptUpdate(ctx.get(), box.ciphertext.data(), &len, plaintext.data(), as_length(plaintext.size())),
        "Failed to encrypt staging payload");
    int written = len;

    check(EVP_EncryptFinal_ex(ctx.get(), box.ciphertext.data() + written, &len),
        "Failed to finalise AES-256-GCM encryption");
    written += len;
    box.ciphertext.resize(static_cast<std::size_t>(written));

    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, as_length(box.tag.size()), box.tag.data()),
        "Failed to obtain GCM authentication tag");

    return box;
}

std::vector<std::uint8_t> open(
    std::span<const std::uint8_t> key,
    std::span<const std::uint8_t> nonce,
    std::span<const std::uint8_t> ciphertext,
    std::span<const std::uint8_t> tag,
    std::span<const std::uint8_t> associated)
{
    check_parameters(key, nonce);
    if (tag.size() != kTagSize)
    {
        throw std::invalid_argument{"AES-256-GCM tag must be 16 bytes"};
    }

    EvpCipherCtx ctx;
    check(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr), "EVP_DecryptInit_ex failed");
    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, as_length(nonce.size()), nullptr),
        "Failed to set IV length");
    check(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()),
        "Failed to initialise AES-256-GCM key");

    int len = 0;
    if (!associated.empty())
    {
        check(EVP_DecryptUpdate(ctx.get(), nullptr, &len, associated.data(), as_length(associated.size())),
            "Failed to process associated data");
    }

    std::vector<std::uint8_t> plaintext(ciphertext.size());
    check(EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(), as_length(ciphertext.size())),
        "Failed to decrypt staging payload");
    int written = len;

    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, as_length(tag.size()),
              const_cast<std::uint8_t*>(tag.data())),
        "Failed to set authentication tag");

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &len) != 1)
    {
        throw AuthenticationError{"AES-256-GCM authentication failed"};
    }

    written += len;
    plaintext.resize(static_cast<std::size_t>(written));
    return plaintext;
}

} // namespace stagehand::crypto
