#include "tagger/TagsArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace tagger {

static nlohmann::json stats_to_json(const MatchStats& s) {
    return {
        {"scored", s.scored},
        {"skipped", s.skipped},
        {"missing", s.missing},
    };
}

static nlohmann::json assignment_to_json(const Assignment& a) {
    nlohmann::json j;
    j["taxonomy"] = a.taxonomy;
    j["matcher"] = matcher_kind_str(a.matcher);
    j["available"] = a.available;

    if (a.matcher == MatcherKind::Multi) {
        nlohmann::json matches = nlohmann::json::array();
        for (const auto& m : a.matches) {
            matches.push_back({
                {"path", m.path},
                {"similarity", m.similarity},
                {"rank", m.rank},
                {"score", (double)m.similarity * m.rank / 100.0}
            });
        }
        j["matches"] = matches;
    } else {
        j["path"] = a.path;
        j["value"] = a.value;
    }

    j["stats"] = stats_to_json(a.stats);
    return j;
}

static nlohmann::json item_to_json(const ItemTags& t) {
    nlohmann::json j;
    j["item_id"] = t.item_id;

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& a : t.assignments) arr.push_back(assignment_to_json(a));
    j["assignments"] = arr;

    if (!t.warnings.empty()) j["warnings"] = t.warnings;
    return j;
}

nlohmann::json TagsArtifact::to_json() const {
    nlohmann::json j;
    j["config_path"] = config_path;
    j["catalog_path"] = catalog_path;
    j["num_items"] = num_items;

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& it : items) {
        arr.push_back(item_to_json(it));
    }
    j["items"] = arr;

    return j;
}

void TagsArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace tagger
