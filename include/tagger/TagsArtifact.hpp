// include/tagger/TagsArtifact.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "tagger/ItemTagger.hpp"

namespace tagger {

struct TagsArtifact {
    std::string config_path;
    std::string catalog_path;
    int num_items = 0;

    std::vector<ItemTags> items;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace tagger
