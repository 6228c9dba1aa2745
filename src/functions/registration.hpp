/**
 * @file registration.hpp
 * @brief Function registrations and their blob metadata representation.
 */

#pragma once

#include "blob/blob_store.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cloudlet {

// ─────────────────────────────────────────────
// Metadata Keys
// ─────────────────────────────────────────────

namespace metadata_keys {

inline constexpr std::string_view kFunctionName = "function.name";
inline constexpr std::string_view kFunctionRuntime = "function.runtime";
inline constexpr std::string_view kFunctionEntrypoint = "function.entrypoint";
inline constexpr std::string_view kFunctionDeclaringType = "function.declaringType";
inline constexpr std::string_view kFunctionVerified = "function.verified";
inline constexpr std::string_view kFunctionSourceId = "function.sourceId";
inline constexpr std::string_view kTimerTrigger = "TimerTrigger";
inline constexpr std::string_view kQueueTrigger = "QueueTrigger";

}  // namespace metadata_keys

// ─────────────────────────────────────────────
// Trigger Binding
// ─────────────────────────────────────────────

enum class TriggerKind : uint8_t {
    None,
    Queue,         ///< target is a queue name
    Timer          ///< target is a cron expression
};

[[nodiscard]] constexpr std::string_view to_string(TriggerKind kind) noexcept {
    switch (kind) {
        case TriggerKind::None:  return "none";
        case TriggerKind::Queue: return "queue";
        case TriggerKind::Timer: return "timer";
    }
    return "unknown";
}

/**
 * @brief At most one trigger per function: a queue or a cron schedule.
 */
struct TriggerBinding {
    TriggerKind kind{TriggerKind::None};
    std::string target;

    static TriggerBinding none() { return {}; }
    static TriggerBinding queue(std::string name) { return {TriggerKind::Queue, std::move(name)}; }
    static TriggerBinding timer(std::string cron) { return {TriggerKind::Timer, std::move(cron)}; }

    bool operator==(const TriggerBinding&) const = default;
};

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

struct FunctionRegistration {
    FunctionId id;                  ///< Id of the descriptor blob
    std::string name;
    std::string runtime;            ///< Runtime strategy tag
    std::string entrypoint;
    std::string declaring_type;
    bool verified{false};
    BlobId source_blob_id;          ///< Blob holding the code
    TriggerBinding trigger;
};

/// Metadata entries describing @p registration, trigger included.
[[nodiscard]] std::vector<BlobMetadata> to_metadata(const FunctionRegistration& registration);

/// Replace the function and trigger keys in @p metadata, keeping unrelated entries.
void merge_metadata(std::vector<BlobMetadata>& metadata,
                    const FunctionRegistration& registration);

/**
 * @brief Rebuild a registration from a descriptor blob.
 *
 * Returns nullopt for blobs that are not function descriptors (no name or
 * source id). When both trigger keys are present the queue binding wins.
 */
[[nodiscard]] std::optional<FunctionRegistration> from_blob_info(const BlobInfo& info);

}  // namespace cloudlet
