#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "stagehand/core/Error.hpp"
#include "stagehand/store/FileStore.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace stagehand;
using namespace stagehand::staging;

namespace
{
struct ScratchDir
{
    std::filesystem::path path;

    explicit ScratchDir(const std::string& name)
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = std::filesystem::temp_directory_path() / ("stagehand-file-" + name + "-" + std::to_string(stamp));
        std::filesystem::create_directories(path);
    }

    ~ScratchDir()
    {
        std::error_code ignored;
        std::filesystem::remove_all(path, ignored);
    }
};

State sample_state()
{
    State state;
    Entry entry;
    entry.operation = Operation::Update;
    entry.value = "hunter2";
    entry.stagedAt = Clock::time_point{std::chrono::milliseconds{1'700'000'000'000}};
    state.entries[Service::Secret]["db-password"] = entry;

    TagEntry tags;
    tags.add = {{"team", "core"}};
    state.tags[Service::Parameter]["/app/key"] = tags;
    return state;
}

std::string slurp(const std::filesystem::path& path)
{
    std::ifstream input{path, std::ios::binary};
    return {std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{}};
}

core::ErrorKind read_error(const store::FileStore& store)
{
    try
    {
        (void)store.read(core::Context{});
    }
    catch (const core::StagingError& error)
    {
        return error.kind();
    }
    FAIL("expected StagingError");
    return core::ErrorKind::Internal;
}
}

TEST_CASE("A missing file drains as an empty state")
{
    ScratchDir dir{"missing"};
    store::FileStore store{dir.path / "stage.json"};
    CHECK_FALSE(store.exists());
    CHECK_FALSE(store.isEncrypted());
    CHECK(store.drain(core::Context{}, false).empty());
}

TEST_CASE("Plain state round trips and keep controls deletion")
{
    ScratchDir dir{"plain"};
    const core::Context ctx;
    store::FileStore store{dir.path / "nested" / "stage.json"};

    store.writeState(ctx, sample_state());
    REQUIRE(store.exists());
    CHECK_FALSE(store.isEncrypted());
    CHECK(slurp(store.path()).find("hunter2") != std::string::npos);

    const auto kept = store.drain(ctx, true);
    CHECK(kept.entryCount() == 1);
    CHECK(kept.tagCount() == 1);
    CHECK(store.exists());

    const auto drained = store.drain(ctx, false);
    CHECK(drained.entries.at(Service::Secret).at("db-password").value == "hunter2");
    CHECK_FALSE(store.exists());
}

TEST_CASE("Writing replaces the previous contents and an empty state removes the file")
{
    ScratchDir dir{"overwrite"};
    const core::Context ctx;
    store::FileStore store{dir.path / "stage.json"};

    store.writeState(ctx, sample_state());
    State smaller;
    smaller.entries[Service::Parameter]["/only"] = Entry{Operation::Delete};
    store.writeState(ctx, smaller);

    const auto state = store.read(ctx);
    CHECK(state.entryCount() == 1);
    CHECK(state.tagCount() == 0);

    store.writeState(ctx, State{});
    CHECK_FALSE(store.exists());
}

TEST_CASE("Encrypted files need the right passphrase")
{
    ScratchDir dir{"encrypted"};
    const core::Context ctx;
    const auto path = dir.path / "stage.json";

    store::FileStore sealed{path, "correct horse", core::KdfProfile::Interactive};
    sealed.writeState(ctx, sample_state());
    CHECK(sealed.isEncrypted());
    CHECK(slurp(path).find("hunter2") == std::string::npos);
    CHECK(sealed.read(ctx).entryCount() == 1);

    store::FileStore wrong{path, "battery staple", core::KdfProfile::Interactive};
    CHECK(read_error(wrong) == core::ErrorKind::DecryptionFailed);

    store::FileStore none{path};
    CHECK(read_error(none) == core::ErrorKind::DecryptionFailed);
    CHECK(none.exists());
}

TEST_CASE("A tampered key derivation cost reads as a decryption failure")
{
    ScratchDir dir{"costs"};
    const auto path = dir.path / "stage.json";
    store::FileStore sealed{path, "correct horse", core::KdfProfile::Interactive};
    sealed.writeState(core::Context{}, sample_state());

    auto bytes = slurp(path);
    // Overwrite the Argon2id opslimit that follows the magic and format version.
    std::fill_n(bytes.begin() + 10, 4, '\xFF');
    {
        std::ofstream output{path, std::ios::binary | std::ios::trunc};
        output << bytes;
    }
    CHECK(read_error(sealed) == core::ErrorKind::DecryptionFailed);
}

TEST_CASE("Corrupt plain files report a storage failure")
{
    ScratchDir dir{"corrupt"};
    const auto path = dir.path / "stage.json";
    {
        std::ofstream output{path};
        output << "{ \"entries\": ";
    }
    store::FileStore store{path};
    CHECK(read_error(store) == core::ErrorKind::StorageFailed);
}

TEST_CASE("Paths are derived from the scope")
{
    core::Settings settings;
    settings.stateDirectory = "/var/lib/stagehand";

    CHECK(store::FileStore::pathFor(settings, core::Scope{"123456789012", "eu-west-1"})
          == std::filesystem::path{"/var/lib/stagehand/123456789012/eu-west-1/stage.json"});
    CHECK(store::FileStore::pathFor(settings, core::Scope{})
          == std::filesystem::path{"/var/lib/stagehand/default/default/stage.json"});
    CHECK_THROWS_AS((void)store::FileStore::pathFor(settings, core::Scope{"..", "eu-west-1"}), core::StagingError);
    CHECK_THROWS_AS((void)store::FileStore::pathFor(settings, core::Scope{"a/b", "eu-west-1"}), core::StagingError);
}
