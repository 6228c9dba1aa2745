/**
 * @file function_registry.cpp
 * @brief FunctionRegistry implementation.
 */

#include "functions/function_registry.hpp"

#include <algorithm>
#include <mutex>

namespace cloudlet {

namespace {

constexpr const char* kDescriptorContentType = "application/vnd.cloudlet.function";

}  // namespace

FunctionRegistry::FunctionRegistry(IBlobStore& store) : store_(store) {}

Result<size_t> FunctionRegistry::load() {
    auto blobs = store_.list();
    if (!blobs) return blobs.error();

    std::unordered_map<FunctionId, FunctionRegistration> loaded;
    for (const auto& info : *blobs) {
        if (auto registration = from_blob_info(info)) {
            loaded.emplace(registration->id, std::move(*registration));
        }
    }

    std::unique_lock lock(mutex_);
    functions_ = std::move(loaded);
    return functions_.size();
}

Result<FunctionRegistration> FunctionRegistry::add(FunctionRegistration draft) {
    BlobPutRequest request;
    request.file_name = draft.name + ".function";
    request.content_type = kDescriptorContentType;
    request.metadata = to_metadata(draft);

    std::unique_lock lock(mutex_);
    auto stored = store_.put(Bytes{}, std::move(request));
    if (!stored) return stored.error();

    draft.id = stored->id;
    functions_[draft.id] = draft;
    return draft;
}

std::optional<FunctionRegistration> FunctionRegistry::get(const FunctionId& id) const {
    std::shared_lock lock(mutex_);
    auto it = functions_.find(id);
    if (it == functions_.end()) return std::nullopt;
    return it->second;
}

std::vector<FunctionRegistration> FunctionRegistry::list() const {
    std::vector<FunctionRegistration> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(functions_.size());
        for (const auto& [id, registration] : functions_) {
            out.push_back(registration);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const FunctionRegistration& a, const FunctionRegistration& b) {
                  return a.name != b.name ? a.name < b.name : a.id < b.id;
              });
    return out;
}

std::vector<FunctionRegistration> FunctionRegistry::by_source(const BlobId& source) const {
    auto all = list();
    std::erase_if(all, [&source](const FunctionRegistration& r) {
        return r.source_blob_id != source;
    });
    return all;
}

Result<FunctionRegistration> FunctionRegistry::set_trigger(const FunctionId& id,
                                                           TriggerBinding trigger,
                                                           TriggerKind replaceable) {
    std::unique_lock lock(mutex_);
    auto it = functions_.find(id);
    if (it == functions_.end()) {
        return Error::validation_failed("function_id", "unknown function '" + id + "'");
    }

    const auto& current = it->second.trigger;
    if (current.kind != TriggerKind::None && current.kind != replaceable) {
        return Error::validation_failed(
            "trigger", "function " + id + " already has a " + std::string{to_string(current.kind)}
                           + " trigger '" + current.target + "'");
    }

    auto info = store_.info(id);
    if (!info) return info.error();

    FunctionRegistration updated = it->second;
    updated.trigger = std::move(trigger);

    auto metadata = info->metadata;
    merge_metadata(metadata, updated);
    if (auto stored = store_.set_metadata(id, std::move(metadata)); !stored) {
        return stored.error();
    }

    it->second = updated;
    return updated;
}

Result<void> FunctionRegistry::remove(const FunctionId& id) {
    std::unique_lock lock(mutex_);
    auto it = functions_.find(id);
    if (it == functions_.end()) {
        return Error::validation_failed("function_id", "unknown function '" + id + "'");
    }

    auto removed = store_.remove(id);
    if (!removed && !removed.error().is(ErrorKind::BlobNotFound)) {
        return removed.error();
    }
    functions_.erase(it);
    return Result<void>{};
}

size_t FunctionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return functions_.size();
}

}  // namespace cloudlet
