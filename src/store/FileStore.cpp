#include "stagehand/store/FileStore.hpp"

#include "crypto/Cipher.hpp"
#include "crypto/Envelope.hpp"
#include "stagehand/core/Error.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

namespace stagehand::store
{
namespace
{
constexpr const char* kStateFileName = "stage.json";
constexpr const char* kDefaultComponent = "default";

using Buffer = std::vector<std::uint8_t>;

core::StagingError storage_error(const std::string& message)
{
    return core::StagingError{core::ErrorKind::StorageFailed, message};
}

std::string path_component(const std::string& value, const char* what)
{
    if (value.empty())
    {
        return kDefaultComponent;
    }
    if (value == "." || value == ".." || value.find_first_of("/\\") != std::string::npos)
    {
        throw core::StagingError{
            core::ErrorKind::InvalidArgument,
            std::string{"Invalid "} + what + " for a staging file path: " + value};
    }
    return value;
}

Buffer read_file(const std::filesystem::path& path)
{
    std::ifstream input{path, std::ios::binary};
    if (!input.is_open())
    {
        throw storage_error("Failed to open staging file for reading: " + path.string());
    }
    Buffer blob{std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{}};
    if (input.bad())
    {
        throw storage_error("Failed to read staging file: " + path.string());
    }
    return blob;
}

void write_file_atomically(const std::filesystem::path& path, const Buffer& blob)
{
    std::error_code error;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), error);
        if (error)
        {
            throw storage_error("Failed to create staging directory: " + error.message());
        }
    }

    auto temporary = path;
    temporary += ".tmp";
    {
        std::ofstream output{temporary, std::ios::binary | std::ios::trunc};
        if (!output.is_open())
        {
            throw storage_error("Failed to open staging file for writing: " + temporary.string());
        }
        output.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
        output.flush();
        if (!output)
        {
            output.close();
            std::filesystem::remove(temporary, error);
            throw storage_error("Failed to write staging file: " + temporary.string());
        }
    }

    std::filesystem::rename(temporary, path, error);
    if (error)
    {
        std::error_code ignored;
        std::filesystem::remove(temporary, ignored);
        throw storage_error("Failed to replace staging file: " + error.message());
    }
}

staging::State decode_state(const Buffer& plaintext)
{
    try
    {
        const auto json = nlohmann::json::parse(plaintext.begin(), plaintext.end());
        return json.get<staging::State>();
    }
    catch (const nlohmann::json::exception& error)
    {
        throw storage_error(std::string{"Malformed staging file: "} + error.what());
    }
    catch (const std::runtime_error& error)
    {
        throw storage_error(std::string{"Malformed staging file: "} + error.what());
    }
}

} // namespace

FileStore::FileStore(std::filesystem::path path, std::string passphrase, core::KdfProfile kdfProfile)
    : path_{std::move(path)}
    , passphrase_{std::move(passphrase)}
    , kdfProfile_{kdfProfile}
{
}

std::filesystem::path FileStore::pathFor(const core::Settings& settings, const core::Scope& scope)
{
    const auto root = settings.stateDirectory.empty() ? core::DefaultHome() : settings.stateDirectory;
    return root / path_component(scope.accountId, "account") / path_component(scope.region, "region") /
           kStateFileName;
}

FileStore FileStore::forScope(const core::Settings& settings, const core::Scope& scope, std::string passphrase)
{
    return FileStore{pathFor(settings, scope), std::move(passphrase), settings.kdfProfile};
}

bool FileStore::exists() const
{
    std::error_code error;
    return std::filesystem::is_regular_file(path_, error);
}

bool FileStore::isEncrypted() const
{
    if (!exists())
    {
        return false;
    }
    return crypto::envelope::is_encrypted(read_file(path_));
}

staging::State FileStore::read(const core::Context& ctx) const
{
    ctx.throwIfCancelled();
    if (!exists())
    {
        return {};
    }

    const auto blob = read_file(path_);
    if (blob.empty())
    {
        return {};
    }
    if (!crypto::envelope::is_encrypted(blob))
    {
        return decode_state(blob);
    }
    if (passphrase_.empty())
    {
        throw core::StagingError{
            core::ErrorKind::DecryptionFailed,
            "Staging file is encrypted and no passphrase was supplied"};
    }

    Buffer plaintext;
    try
    {
        plaintext = crypto::envelope::decrypt(blob, passphrase_);
    }
    catch (const crypto::AuthenticationError&)
    {
        throw core::StagingError{
            core::ErrorKind::DecryptionFailed,
            "Failed to decrypt staging file: wrong passphrase or corrupted data"};
    }
    catch (const std::runtime_error& error)
    {
        throw core::StagingError{
            core::ErrorKind::DecryptionFailed,
            std::string{"Failed to decrypt staging file: "} + error.what()};
    }
    return decode_state(plaintext);
}

staging::State FileStore::drain(const core::Context& ctx, bool keep)
{
    auto state = read(ctx);
    if (!keep)
    {
        remove(ctx);
    }
    return state;
}

void FileStore::writeState(const core::Context& ctx, const staging::State& state)
{
    ctx.throwIfCancelled();
    if (state.empty())
    {
        remove(ctx);
        return;
    }

    const auto text = nlohmann::json(state).dump(2);
    Buffer blob{text.begin(), text.end()};
    if (!passphrase_.empty())
    {
        try
        {
            blob = crypto::envelope::encrypt(blob, passphrase_, crypto::params_for(kdfProfile_));
        }
        catch (const std::exception& error)
        {
            throw storage_error(std::string{"Failed to encrypt staging file: "} + error.what());
        }
    }
    write_file_atomically(path_, blob);
}

void FileStore::remove(const core::Context& ctx)
{
    ctx.throwIfCancelled();
    std::error_code error;
    std::filesystem::remove(path_, error);
    if (error)
    {
        throw storage_error("Failed to remove staging file: " + error.message());
    }
}

} // namespace stagehand::store
