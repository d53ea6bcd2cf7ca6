#include "sync/SaveTypes.hpp"

namespace Tether {

std::string_view ToString(SaveState state) noexcept {
    switch (state) {
        case SaveState::Idle:     return "idle";
        case SaveState::Pending:  return "pending";
        case SaveState::Saving:   return "saving";
        case SaveState::Saved:    return "saved";
        case SaveState::Error:    return "error";
        case SaveState::Offline:  return "offline";
        case SaveState::Conflict: return "conflict";
    }
    return "unknown";
}

bool IsValidTransition(SaveState from, SaveState to) noexcept {
    if (to == SaveState::Idle) {
        return true;
    }

    switch (from) {
        case SaveState::Idle:
            return to == SaveState::Pending || to == SaveState::Saving;
        case SaveState::Pending:
            return to == SaveState::Saving || to == SaveState::Pending;
        case SaveState::Saving:
            return to == SaveState::Saved || to == SaveState::Error ||
                   to == SaveState::Offline || to == SaveState::Conflict ||
                   to == SaveState::Pending;
        case SaveState::Saved:
        case SaveState::Error:
        case SaveState::Offline:
        case SaveState::Conflict:
            return to == SaveState::Pending || to == SaveState::Saving;
    }
    return false;
}

std::string_view ToString(SaveErrorKind kind) noexcept {
    switch (kind) {
        case SaveErrorKind::None:       return "none";
        case SaveErrorKind::Validation: return "validation";
        case SaveErrorKind::Transient:  return "transient";
        case SaveErrorKind::Conflict:   return "conflict";
    }
    return "unknown";
}

SaveResult SaveResult::Success(std::optional<uint64_t> newVersion) {
    SaveResult result;
    result.version = newVersion;
    return result;
}

SaveResult SaveResult::ValidationFailure(std::string message) {
    SaveResult result;
    result.kind = SaveErrorKind::Validation;
    result.message = std::move(message);
    return result;
}

SaveResult SaveResult::TransientFailure(std::string message) {
    SaveResult result;
    result.kind = SaveErrorKind::Transient;
    result.message = std::move(message);
    return result;
}

SaveResult SaveResult::ConflictWith(nlohmann::json remote, uint64_t remoteVersion, std::string message) {
    SaveResult result;
    result.kind = SaveErrorKind::Conflict;
    result.message = std::move(message);
    result.version = remoteVersion;
    result.remoteData = std::move(remote);
    return result;
}

} // namespace Tether
