#include "sync/ConflictResolver.hpp"
#include "core/Logger.hpp"

#include <stdexcept>

namespace Tether {

FunctionConflictResolver::FunctionConflictResolver(MergeFunction function)
    : m_function(std::move(function)) {
    if (!m_function) {
        throw std::invalid_argument("FunctionConflictResolver requires a merge function");
    }
}

std::optional<nlohmann::json> FunctionConflictResolver::Resolve(const ConflictCase& conflict) {
    return m_function(conflict.localData, conflict.remoteData);
}

std::optional<nlohmann::json> JsonMergeResolver::Resolve(const ConflictCase& conflict) {
    if (!conflict.localData.is_object() || !conflict.remoteData.is_object()) {
        TETHER_LOG_WARN("JSON merge needs object records (local {}, remote {})",
                        conflict.localData.type_name(), conflict.remoteData.type_name());
        return std::nullopt;
    }

    nlohmann::json merged = conflict.remoteData;
    merged.merge_patch(conflict.localData);
    return merged;
}

} // namespace Tether
