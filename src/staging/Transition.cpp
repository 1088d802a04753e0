#include "stagehand/staging/Transition.hpp"

namespace stagehand::staging
{
namespace
{
EntryTransition reduce_add(EntryState state, const EntryAction& action)
{
    if (state.currentValue)
    {
        return {state, false, TransitionError::CannotAddToExisting};
    }

    switch (state.staged)
    {
    case StagedKind::NotStaged:
    case StagedKind::Create:
        state.staged = StagedKind::Create;
        state.draftValue = action.value;
        return {state};
    case StagedKind::Update:
        return {state, false, TransitionError::CannotAddToUpdate};
    case StagedKind::Delete:
        return {state, false, TransitionError::CannotAddToDelete};
    }
    return {state};
}

EntryTransition reduce_edit(EntryState state, const EntryAction& action)
{
    const bool matches_remote = state.currentValue && *state.currentValue == action.value;

    switch (state.staged)
    {
    case StagedKind::NotStaged:
        if (!matches_remote)
        {
            state.staged = StagedKind::Update;
            state.draftValue = action.value;
        }
        return {state};
    case StagedKind::Create:
        state.draftValue = action.value;
        return {state};
    case StagedKind::Update:
        if (matches_remote)
        {
            state.staged = StagedKind::NotStaged;
            state.draftValue.reset();
        }
        else
        {
            state.draftValue = action.value;
        }
        return {state};
    case StagedKind::Delete:
        return {state, false, TransitionError::CannotEditDelete};
    }
    return {state};
}

EntryTransition reduce_delete(EntryState state)
{
    if (!state.currentValue && state.staged != StagedKind::Create)
    {
        return {state, false, TransitionError::CannotDeleteNotFound};
    }

    switch (state.staged)
    {
    case StagedKind::NotStaged:
    case StagedKind::Update:
        state.staged = StagedKind::Delete;
        state.draftValue.reset();
        return {state};
    case StagedKind::Create:
        state.staged = StagedKind::NotStaged;
        state.draftValue.reset();
        return {state, true};
    case StagedKind::Delete:
        return {state};
    }
    return {state};
}

TransitionError tag_guard(const EntryState& state, TagActionType type)
{
    const bool tagging = type == TagActionType::Tag;
    if (state.staged == StagedKind::Delete)
    {
        return tagging ? TransitionError::CannotTagDelete : TransitionError::CannotUntagDelete;
    }
    if (!state.currentValue && state.staged == StagedKind::NotStaged)
    {
        return tagging ? TransitionError::CannotTagNotFound : TransitionError::CannotUntagNotFound;
    }
    return TransitionError::None;
}

} // namespace

EntryTransition reduceEntry(const EntryState& state, const EntryAction& action)
{
    switch (action.type)
    {
    case EntryActionType::Add:
        return reduce_add(state, action);
    case EntryActionType::Edit:
        return reduce_edit(state, action);
    case EntryActionType::Delete:
        return reduce_delete(state);
    }
    return {state};
}

TagTransition reduceTag(const EntryState& state, const StagedTags& staged, const TagAction& action)
{
    if (const auto error = tag_guard(state, action.type); error != TransitionError::None)
    {
        return {staged, error};
    }

    auto result = staged;
    if (action.type == TagActionType::Tag)
    {
        for (const auto& [key, value] : action.tags)
        {
            result.toUnset.erase(key);
            result.toSet[key] = value;
        }
    }
    else
    {
        for (const auto& key : action.keys)
        {
            result.toSet.erase(key);
            if (action.remoteKeys && action.remoteKeys->count(key) == 0)
            {
                result.toUnset.erase(key);
                continue;
            }
            result.toUnset.insert(key);
        }
    }
    return {result};
}

StagedKind stagedKindOf(const std::optional<Entry>& entry) noexcept
{
    if (!entry)
    {
        return StagedKind::NotStaged;
    }
    switch (entry->operation)
    {
    case Operation::Create:
        return StagedKind::Create;
    case Operation::Update:
        return StagedKind::Update;
    case Operation::Delete:
        return StagedKind::Delete;
    }
    return StagedKind::NotStaged;
}

std::string_view describe(TransitionError error) noexcept
{
    switch (error)
    {
    case TransitionError::None:
        return "";
    case TransitionError::CannotAddToUpdate:
        return "cannot add: already staged for update";
    case TransitionError::CannotAddToDelete:
        return "cannot add: already staged for deletion";
    case TransitionError::CannotAddToExisting:
        return "cannot add: resource already exists, use edit instead";
    case TransitionError::CannotEditDelete:
        return "cannot edit: staged for deletion, reset first";
    case TransitionError::CannotDeleteNotFound:
        return "cannot delete: resource not found";
    case TransitionError::CannotTagNotFound:
        return "cannot tag: resource not found";
    case TransitionError::CannotTagDelete:
        return "cannot tag: resource staged for deletion";
    case TransitionError::CannotUntagNotFound:
        return "cannot untag: resource not found";
    case TransitionError::CannotUntagDelete:
        return "cannot untag: resource staged for deletion";
    }
    return "invalid transition";
}

core::ErrorKind errorKindOf(TransitionError error) noexcept
{
    switch (error)
    {
    case TransitionError::CannotDeleteNotFound:
    case TransitionError::CannotTagNotFound:
    case TransitionError::CannotUntagNotFound:
        return core::ErrorKind::ResourceNotFound;
    default:
        return core::ErrorKind::InvalidTransition;
    }
}

void throwIfFailed(TransitionError error)
{
    if (error != TransitionError::None)
    {
        throw core::StagingError{errorKindOf(error), std::string{describe(error)}};
    }
}

} // namespace stagehand::staging
