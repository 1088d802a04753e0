#include "crypto/KeyDerivation.hpp"

#include "crypto/Cipher.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include <stdexcept>
#include <string_view>

namespace stagehand::crypto
{
namespace
{
constexpr std::string_view kHkdfInfo{"stagehand.staging"};

class EvpPkeyCtx
{
public:
    explicit EvpPkeyCtx(int type)
        : ctx_{EVP_PKEY_CTX_new_id(type, nullptr)}
    {
        if (!ctx_)
        {
            throw std::runtime_error{"Failed to allocate EVP_PKEY_CTX"};
        }
    }

    ~EvpPkeyCtx()
    {
        EVP_PKEY_CTX_free(ctx_);
    }

    EvpPkeyCtx(const EvpPkeyCtx&) = delete;
    EvpPkeyCtx& operator=(const EvpPkeyCtx&) = delete;

    EVP_PKEY_CTX* get() noexcept { return ctx_; }

private:
    EVP_PKEY_CTX* ctx_;
};

std::vector<std::uint8_t> stretch_passphrase(
    std::string_view passphrase,
    std::span<const std::uint8_t> salt,
    const Argon2idParams& params)
{
    std::vector<std::uint8_t> key(kKeySize);
    const int status = crypto_pwhash(
        key.data(),
        static_cast<unsigned long long>(key.size()),
        passphrase.data(),
        passphrase.size(),
        salt.data(),
        params.opslimit,
        params.memlimit,
        crypto_pwhash_ALG_ARGON2ID13);
    if (status != 0)
    {
        throw std::runtime_error{"libsodium failed to derive key material"};
    }
    return key;
}

std::vector<std::uint8_t> expand(std::span<const std::uint8_t> input_key_material, std::span<const std::uint8_t> salt)
{
    EvpPkeyCtx ctx{EVP_PKEY_HKDF};
    if (EVP_PKEY_derive_init(ctx.get()) != 1)
    {
        throw std::runtime_error{"EVP_PKEY_derive_init failed"};
    }
    if (EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) != 1)
    {
        throw std::runtime_error{"Failed to set HKDF hash function"};
    }
    if (EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) != 1)
    {
        throw std::runtime_error{"Failed to set HKDF salt"};
    }
    if (EVP_PKEY_CTX_set1_hkdf_key(
            ctx.get(), input_key_material.data(), static_cast<int>(input_key_material.size())) != 1)
    {
        throw std::runtime_error{"Failed to set HKDF input key material"};
    }
    if (EVP_PKEY_CTX_add1_hkdf_info(
            ctx.get(),
            reinterpret_cast<const unsigned char*>(kHkdfInfo.data()),
            static_cast<int>(kHkdfInfo.size())) != 1)
    {
        throw std::runtime_error{"Failed to set HKDF info"};
    }

    std::vector<std::uint8_t> output(kKeySize);
    std::size_t len = output.size();
    if (EVP_PKEY_derive(ctx.get(), output.data(), &len) != 1)
    {
        throw std::runtime_error{"HKDF derivation failed"};
    }
    output.resize(len);
    return output;
}
} // namespace

Argon2idParams params_for(core::KdfProfile profile)
{
    Argon2idParams params;
    switch (profile)
    {
    case core::KdfProfile::Interactive:
        params.opslimit = static_cast<std::uint32_t>(crypto_pwhash_OPSLIMIT_INTERACTIVE);
        params.memlimit = static_cast<std::uint32_t>(crypto_pwhash_MEMLIMIT_INTERACTIVE);
        break;
    case core::KdfProfile::Moderate:
        params.opslimit = static_cast<std::uint32_t>(crypto_pwhash_OPSLIMIT_MODERATE);
        params.memlimit = static_cast<std::uint32_t>(crypto_pwhash_MEMLIMIT_MODERATE);
        break;
    case core::KdfProfile::Sensitive:
        params.opslimit = static_cast<std::uint32_t>(crypto_pwhash_OPSLIMIT_SENSITIVE);
        params.memlimit = static_cast<std::uint32_t>(crypto_pwhash_MEMLIMIT_SENSITIVE);
        break;
    }
    return params;
}

void ensure_sodium_ready()
{
    static const int rc = sodium_init();
    if (rc < 0)
    {
        throw std::runtime_error{"libsodium initialisation failed"};
    }
}

std::vector<std::uint8_t> derive_staging_key(
    std::string_view passphrase,
    std::span<const std::uint8_t> salt,
    const Argon2idParams& params)
{
    ensure_sodium_ready();

    if (salt.size() != kSaltSize)
    {
        throw std::invalid_argument{"Argon2id salt must be crypto_pwhash_SALTBYTES bytes"};
    }

    const auto stretched = stretch_passphrase(passphrase, salt, params);
    return expand(stretched, salt);
}

void fill_random_bytes(std::span<std::uint8_t> destination)
{
    ensure_sodium_ready();
    randombytes_buf(destination.data(), destination.size());
}

} // namespace stagehand::crypto
