/**
 * @file registration.cpp
 * @brief Conversions between FunctionRegistration and blob metadata.
 */

#include "functions/registration.hpp"

namespace cloudlet {

std::vector<BlobMetadata> to_metadata(const FunctionRegistration& registration) {
    std::vector<BlobMetadata> metadata;
    merge_metadata(metadata, registration);
    return metadata;
}

void merge_metadata(std::vector<BlobMetadata>& metadata,
                    const FunctionRegistration& registration) {
    using namespace metadata_keys;

    set_metadata_value(metadata, kFunctionName, registration.name);
    set_metadata_value(metadata, kFunctionRuntime, registration.runtime);
    set_metadata_value(metadata, kFunctionEntrypoint, registration.entrypoint);
    set_metadata_value(metadata, kFunctionDeclaringType, registration.declaring_type);
    set_metadata_value(metadata, kFunctionVerified, registration.verified ? "true" : "false");
    set_metadata_value(metadata, kFunctionSourceId, registration.source_blob_id);

    erase_metadata(metadata, kTimerTrigger);
    erase_metadata(metadata, kQueueTrigger);
    switch (registration.trigger.kind) {
        case TriggerKind::Queue:
            set_metadata_value(metadata, kQueueTrigger, registration.trigger.target);
            break;
        case TriggerKind::Timer:
            set_metadata_value(metadata, kTimerTrigger, registration.trigger.target);
            break;
        case TriggerKind::None:
            break;
    }
}

std::optional<FunctionRegistration> from_blob_info(const BlobInfo& info) {
    using namespace metadata_keys;

    auto name = find_metadata(info.metadata, kFunctionName);
    auto source = find_metadata(info.metadata, kFunctionSourceId);
    if (!name || name->empty() || !source || source->empty()) {
        return std::nullopt;
    }

    FunctionRegistration registration;
    registration.id = info.id;
    registration.name = *name;
    registration.source_blob_id = *source;
    registration.runtime = find_metadata(info.metadata, kFunctionRuntime).value_or("");
    registration.entrypoint = find_metadata(info.metadata, kFunctionEntrypoint).value_or("");
    registration.declaring_type =
        find_metadata(info.metadata, kFunctionDeclaringType).value_or("");
    registration.verified =
        find_metadata(info.metadata, kFunctionVerified).value_or("false") == "true";

    if (auto queue = find_metadata(info.metadata, kQueueTrigger); queue && !queue->empty()) {
        registration.trigger = TriggerBinding::queue(*queue);
    } else if (auto cron = find_metadata(info.metadata, kTimerTrigger); cron && !cron->empty()) {
        registration.trigger = TriggerBinding::timer(*cron);
    }
    return registration;
}

}  // namespace cloudlet
