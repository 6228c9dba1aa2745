/**
 * @file function_registry.hpp
 * @brief Registered functions, persisted as descriptor blobs.
 *
 * Each registration is stored as an empty blob whose metadata follows the
 * function metadata convention. The blob id doubles as the function id, so
 * the registry can be rebuilt from IBlobStore::list() after a restart.
 */

#pragma once

#include "blob/blob_store.hpp"
#include "core/result.hpp"
#include "functions/registration.hpp"

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace cloudlet {

class FunctionRegistry {
public:
    explicit FunctionRegistry(IBlobStore& store);

    /// Rebuild the in-memory view from the blob store; returns the count found.
    Result<size_t> load();

    /// Persist a new registration; the id field of @p draft is ignored and assigned.
    Result<FunctionRegistration> add(FunctionRegistration draft);

    [[nodiscard]] std::optional<FunctionRegistration> get(const FunctionId& id) const;
    [[nodiscard]] std::vector<FunctionRegistration> list() const;
    [[nodiscard]] std::vector<FunctionRegistration> by_source(const BlobId& source) const;

    /**
     * @brief Persist and apply a new trigger binding.
     *
     * The write only happens while the current binding is None or of kind
     * @p replaceable; otherwise it fails with ValidationFailed and nothing
     * changes. The check and the write share one critical section, so two
     * callers racing to bind different trigger kinds cannot both win.
     */
    Result<FunctionRegistration> set_trigger(const FunctionId& id,
                                             TriggerBinding trigger,
                                             TriggerKind replaceable);

    /// Delete the descriptor blob and forget the registration.
    Result<void> remove(const FunctionId& id);

    [[nodiscard]] size_t size() const;

private:
    IBlobStore& store_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<FunctionId, FunctionRegistration> functions_;
};

}  // namespace cloudlet
