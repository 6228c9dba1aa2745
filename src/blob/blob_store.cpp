/**
 * @file blob_store.cpp
 * @brief Metadata list helpers.
 */

#include "blob/blob_store.hpp"

#include <algorithm>
#include <cctype>

namespace cloudlet {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

std::optional<std::string> find_metadata(const std::vector<BlobMetadata>& metadata,
                                         std::string_view name) {
    auto it = std::find_if(metadata.begin(), metadata.end(),
                           [name](const BlobMetadata& m) { return iequals(m.name, name); });
    if (it == metadata.end()) return std::nullopt;
    return it->value;
}

void set_metadata_value(std::vector<BlobMetadata>& metadata,
                        std::string_view name,
                        std::string value) {
    for (auto& m : metadata) {
        if (iequals(m.name, name)) {
            m.value = std::move(value);
            return;
        }
    }
    metadata.push_back(BlobMetadata{.name = std::string(name), .value = std::move(value)});
}

void erase_metadata(std::vector<BlobMetadata>& metadata, std::string_view name) {
    std::erase_if(metadata, [name](const BlobMetadata& m) { return iequals(m.name, name); });
}

}  // namespace cloudlet
