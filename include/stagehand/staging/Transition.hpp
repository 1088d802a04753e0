#pragma once

#include "stagehand/core/Error.hpp"
#include "stagehand/staging/State.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace stagehand::staging
{

/**
 * @brief Pure staging rules for value and tag changes.
 *
 * The reducer never touches a store or the remote side. Use cases gather the
 * current remote value and the staged state, reduce, and then write the result.
 */

enum class StagedKind
{
    NotStaged,
    Create,
    Update,
    Delete,
};

struct EntryState
{
    //! Remote value, empty when the item does not exist remotely.
    std::optional<std::string> currentValue;
    StagedKind staged = StagedKind::NotStaged;
    std::optional<std::string> draftValue;
};

enum class EntryActionType
{
    Add,
    Edit,
    Delete,
};

struct EntryAction
{
    EntryActionType type = EntryActionType::Edit;
    std::string value;
};

enum class TransitionError
{
    None,
    CannotAddToUpdate,
    CannotAddToDelete,
    CannotAddToExisting,
    CannotEditDelete,
    CannotDeleteNotFound,
    CannotTagNotFound,
    CannotTagDelete,
    CannotUntagNotFound,
    CannotUntagDelete,
};

struct EntryTransition
{
    EntryState state;
    //! Set when the staged tag change must go as well, e.g. deleting a staged create.
    bool discardTags = false;
    TransitionError error = TransitionError::None;
};

struct StagedTags
{
    TagMap toSet;
    KeySet toUnset;
};

enum class TagActionType
{
    Tag,
    Untag,
};

struct TagAction
{
    TagActionType type = TagActionType::Tag;
    TagMap tags;
    KeySet keys;
    //! Tag keys known to exist remotely. When set, untagging a key outside it stages no removal.
    std::optional<KeySet> remoteKeys;
};

struct TagTransition
{
    StagedTags tags;
    TransitionError error = TransitionError::None;
};

[[nodiscard]] EntryTransition reduceEntry(const EntryState& state, const EntryAction& action);
[[nodiscard]] TagTransition reduceTag(const EntryState& state, const StagedTags& staged, const TagAction& action);

[[nodiscard]] StagedKind stagedKindOf(const std::optional<Entry>& entry) noexcept;

[[nodiscard]] std::string_view describe(TransitionError error) noexcept;
[[nodiscard]] core::ErrorKind errorKindOf(TransitionError error) noexcept;

//! Throws StagingError for anything but TransitionError::None.
void throwIfFailed(TransitionError error);

} // namespace stagehand::staging
