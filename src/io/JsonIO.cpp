#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

// object key order is the sibling order of the taxonomy
using json = nlohmann::ordered_json;

namespace fs = std::filesystem;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::string optional_string(const json& j, const char* key, const std::string& where, const std::string& def) {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::vector<std::string> optional_string_array(const json& j, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;

    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + path + ": " + e.what());
    }
    return j;
}

static json parse_json_text(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
}

// ---------- taxonomy ----------

static void parseTaxonomyChildren(const json& j, tagger::RawNode& parent, const std::string& where) {
    if (j.is_null()) return;

    if (j.is_array()) {
        for (size_t i = 0; i < j.size(); ++i) {
            if (!j.at(i).is_string()) {
                std::ostringstream oss;
                oss << where << "[" << i << "] must be a string";
                throw std::runtime_error(oss.str());
            }
            tagger::RawNode leaf;
            leaf.label = j.at(i).get<std::string>();
            parent.children.push_back(std::move(leaf));
        }
        return;
    }

    require_object(j, where);
    for (auto it = j.begin(); it != j.end(); ++it) {
        tagger::RawNode child;
        child.label = it.key();
        parseTaxonomyChildren(it.value(), child, where + "." + it.key());
        parent.children.push_back(std::move(child));
    }
}

static tagger::RawNode parseTaxonomyJson(const json& j) {
    tagger::RawNode root;
    parseTaxonomyChildren(j, root, "root");
    return root;
}

tagger::RawNode loadTaxonomy(const std::string& path) {
    return parseTaxonomyJson(read_json_file(path, "taxonomy"));
}

tagger::RawNode parseTaxonomy(const std::string& json_text) {
    return parseTaxonomyJson(parse_json_text(json_text));
}

// ---------- catalog ----------

static tagger::CatalogItem parseCatalogItem(const json& j, const std::string& where) {
    require_object(j, where);

    tagger::CatalogItem item;
    item.id = require_string(j, "id", where);
    item.image = optional_string(j, "image", where, "");

    if (j.contains("fields")) {
        const json& f = j.at("fields");
        require_object(f, where + ".fields");
        for (auto it = f.begin(); it != f.end(); ++it) {
            if (it.value().is_null()) continue;
            if (!it.value().is_string()) {
                throw std::runtime_error(where + ".fields." + it.key() + " must be a string");
            }
            item.fields.emplace_back(it.key(), it.value().get<std::string>());
        }
    }
    return item;
}

std::vector<tagger::CatalogItem> loadCatalog(const std::string& path) {
    const json j = read_json_file(path, "catalog");
    require_array(j, "root");

    std::vector<tagger::CatalogItem> items;
    items.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << "root[" << i << "]";
        items.push_back(parseCatalogItem(j.at(i), oss.str()));
    }
    return items;
}

// ---------- config ----------

static std::string resolve_path(const std::string& p, const std::string& base_dir) {
    if (p.empty() || base_dir.empty()) return p;
    fs::path fp(p);
    if (fp.is_absolute()) return p;
    return (fs::path(base_dir) / fp).lexically_normal().string();
}

static emb::ProviderConfig parseProviderConfig(const json& j, const std::string& where, const std::string& base_dir) {
    require_object(j, where);

    emb::ProviderConfig pc;
    pc.text_model = resolve_path(require_string(j, "text_model", where), base_dir);
    pc.image_model = resolve_path(optional_string(j, "image_model", where, ""), base_dir);
    pc.vocab = resolve_path(require_string(j, "vocab", where), base_dir);

    const std::string tok = optional_string(j, "tokenizer", where, "bpe");
    if (tok == "bpe") {
        pc.tokenizer = emb::TokenizerKind::Bpe;
        pc.merges = resolve_path(require_string(j, "merges", where), base_dir);
    } else if (tok == "wordpiece") {
        pc.tokenizer = emb::TokenizerKind::WordPiece;
    } else {
        throw std::runtime_error(where + ".tokenizer must be one of: bpe, wordpiece");
    }

    if (j.contains("max_len")) {
        if (!j.at("max_len").is_number_unsigned() || j.at("max_len").get<size_t>() < 2) {
            throw std::runtime_error(where + ".max_len must be an integer >= 2");
        }
        pc.max_len = j.at("max_len").get<size_t>();
    }
    if (j.contains("lowercase")) {
        if (!j.at("lowercase").is_boolean()) throw std::runtime_error(where + ".lowercase must be a boolean");
        pc.lowercase = j.at("lowercase").get<bool>();
    }
    if (j.contains("threads")) {
        if (!j.at("threads").is_number_integer()) throw std::runtime_error(where + ".threads must be an integer");
        pc.threads = j.at("threads").get<int>();
    }
    return pc;
}

static tagger::TaxonomySpec parseTaxonomySpec(const json& j, const std::string& where, const std::string& base_dir) {
    require_object(j, where);

    tagger::TaxonomySpec t;
    t.name = require_string(j, "name", where);
    t.path = resolve_path(require_string(j, "path", where), base_dir);

    const std::string provider = require_string(j, "provider", where);
    if (!emb::parse_provider_kind(provider, t.provider)) {
        throw std::runtime_error(where + ".provider must be one of: clip, fclip, mclip");
    }

    const std::string policy = optional_string(j, "policy", where, "label");
    if (!tagger::parse_embedding_policy(policy, t.policy)) {
        throw std::runtime_error(where + ".policy must be one of: label, path");
    }

    const std::string matcher = optional_string(j, "matcher", where, "greedy");
    if (!tagger::parse_matcher_kind(matcher, t.matcher)) {
        throw std::runtime_error(where + ".matcher must be one of: greedy, best_leaf, multi");
    }
    // path trees embed leaves only, so a greedy descent has nothing to follow
    if (t.matcher == tagger::MatcherKind::Greedy && t.policy != tagger::EmbeddingPolicy::Label) {
        throw std::runtime_error(where + ".matcher greedy requires policy label");
    }

    const std::string text = optional_string(j, "text", where, "short");
    if (text == "short") t.text = tagger::TextScope::Short;
    else if (text == "full") t.text = tagger::TextScope::Full;
    else throw std::runtime_error(where + ".text must be one of: short, full");

    if (j.contains("threshold")) {
        if (!j.at("threshold").is_number()) throw std::runtime_error(where + ".threshold must be a number");
        t.threshold = j.at("threshold").get<double>();
    }
    return t;
}

static tagger::TaggerConfig parseTaggerConfigJson(const json& j, const std::string& base_dir) {
    require_object(j, "config");

    tagger::TaggerConfig cfg;

    if (j.contains("providers")) {
        const json& ps = j.at("providers");
        require_object(ps, "config.providers");
        for (auto it = ps.begin(); it != ps.end(); ++it) {
            emb::ProviderKind kind;
            if (!emb::parse_provider_kind(it.key(), kind)) {
                throw std::runtime_error("config.providers." + it.key() + " is not one of: clip, fclip, mclip");
            }
            cfg.providers[kind] = parseProviderConfig(it.value(), "config.providers." + it.key(), base_dir);
        }
    }

    cfg.text_fields = optional_string_array(j, "text_fields", "config");
    cfg.full_text_fields = optional_string_array(j, "full_text_fields", "config");
    if (cfg.full_text_fields.empty()) cfg.full_text_fields = cfg.text_fields;

    if (!j.contains("taxonomies")) {
        throw std::runtime_error("config missing required field: taxonomies");
    }
    const json& ts = j.at("taxonomies");
    require_array(ts, "config.taxonomies");
    for (size_t i = 0; i < ts.size(); ++i) {
        std::ostringstream oss;
        oss << "config.taxonomies[" << i << "]";
        cfg.taxonomies.push_back(parseTaxonomySpec(ts.at(i), oss.str(), base_dir));
    }

    cfg.cache_path = resolve_path(optional_string(j, "cache", "config", ""), base_dir);
    return cfg;
}

tagger::TaggerConfig loadTaggerConfig(const std::string& path) {
    const std::string base_dir = fs::path(path).parent_path().string();
    return parseTaggerConfigJson(read_json_file(path, "config"), base_dir);
}

tagger::TaggerConfig parseTaggerConfig(const std::string& json_text, const std::string& base_dir) {
    return parseTaggerConfigJson(parse_json_text(json_text), base_dir);
}
