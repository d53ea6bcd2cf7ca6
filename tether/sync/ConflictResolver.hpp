#pragma once

#include "sync/SaveTypes.hpp"
#include <functional>
#include <optional>
#include <nlohmann/json.hpp>

namespace Tether {

/**
 * @brief Merges diverged local and remote records
 *
 * Returning nullopt (or throwing) leaves the session in the conflict state
 * until the caller resolves it explicitly.
 */
class IConflictResolver {
public:
    virtual ~IConflictResolver() = default;

    virtual std::optional<nlohmann::json> Resolve(const ConflictCase& conflict) = 0;
};

/**
 * @brief Resolver backed by a caller supplied function (local, remote) -> merged
 */
class FunctionConflictResolver : public IConflictResolver {
public:
    using MergeFunction = std::function<std::optional<nlohmann::json>(const nlohmann::json& local,
                                                                      const nlohmann::json& remote)>;

    explicit FunctionConflictResolver(MergeFunction function);

    std::optional<nlohmann::json> Resolve(const ConflictCase& conflict) override;

private:
    MergeFunction m_function;
};

/**
 * @brief Field-level JSON merge
 *
 * Starts from the remote object and applies the local object as an RFC 7386
 * merge patch, so fields edited locally win and fields only present remotely
 * are kept. Non-object records cannot be merged and stay in conflict.
 */
class JsonMergeResolver : public IConflictResolver {
public:
    std::optional<nlohmann::json> Resolve(const ConflictCase& conflict) override;
};

} // namespace Tether
