#include "tagger/ItemTagger.hpp"

#include <cctype>
#include <optional>
#include <stdexcept>
#include <utility>

#include "tagger/Similarity.hpp"

namespace tagger {

static std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

static std::string join_labels(const Path& p) {
    std::string s;
    for (const auto& label : p) {
        if (!s.empty()) s += ' ';
        s += label;
    }
    return trim_copy(s);
}

std::string build_item_text(const CatalogItem& item, const std::vector<std::string>& field_names) {
    std::string out;
    for (const auto& name : field_names) {
        for (const auto& kv : item.fields) {
            if (kv.first != name) continue;
            const std::string v = trim_copy(kv.second);
            if (v.empty()) break;
            if (!out.empty()) out += ". ";
            out += v;
            break;
        }
    }
    return out;
}

ItemTagger::ItemTagger(
    std::vector<LoadedTaxonomy> taxonomies,
    ProviderMap providers,
    std::vector<std::string> text_fields,
    std::vector<std::string> full_text_fields
)
    : m_taxonomies(std::move(taxonomies)),
      m_providers(std::move(providers)),
      m_text_fields(std::move(text_fields)),
      m_full_text_fields(std::move(full_text_fields)) {
    for (const auto& t : m_taxonomies) {
        auto it = m_providers.find(t.spec.provider);
        if (it == m_providers.end() || !it->second) {
            throw std::invalid_argument(
                "taxonomy '" + t.spec.name + "' needs provider " + emb::provider_kind_str(t.spec.provider));
        }
        if (it->second->kind() != t.spec.provider || t.tree.provider() != t.spec.provider) {
            throw std::invalid_argument(
                "taxonomy '" + t.spec.name + "' was embedded with " + emb::provider_kind_str(t.tree.provider()) +
                " but is queried with " + emb::provider_kind_str(t.spec.provider));
        }
    }
}

namespace {

// Query vectors for one item, computed at most once per (provider, text scope).
class QueryCache {
public:
    QueryCache(const CatalogItem& item, ItemTags& out) : m_item(item), m_out(out) {}

    const std::optional<Vector>& query(
        const emb::EmbeddingProvider& provider,
        TextScope scope,
        const std::vector<std::string>& fields
    ) {
        const auto key = std::make_pair(provider.kind(), scope);
        auto it = m_queries.find(key);
        if (it != m_queries.end()) return it->second;

        std::vector<Vector> parts;

        const std::optional<Vector>& img = image(provider);
        if (img) parts.push_back(*img);

        const std::string text = build_item_text(m_item, fields);
        if (!text.empty()) {
            std::optional<Vector> tv = provider.embed_text(text);
            if (tv && !tv->empty()) parts.push_back(std::move(*tv));
            else warn(std::string("text embedding unavailable (") + emb::provider_kind_str(provider.kind()) + ")");
        }

        std::optional<Vector> q;
        if (!parts.empty()) {
            try {
                q = blend(parts);
            } catch (const DimensionMismatch& e) {
                warn(std::string("cannot blend image and text embeddings: ") + e.what());
            }
        }

        return m_queries.emplace(key, std::move(q)).first->second;
    }

private:
    const CatalogItem& m_item;
    ItemTags& m_out;
    std::map<std::pair<emb::ProviderKind, TextScope>, std::optional<Vector>> m_queries;
    std::map<emb::ProviderKind, std::optional<Vector>> m_images;

    const std::optional<Vector>& image(const emb::EmbeddingProvider& provider) {
        auto it = m_images.find(provider.kind());
        if (it != m_images.end()) return it->second;

        std::optional<Vector> v;
        if (!m_item.image.empty()) {
            v = provider.embed_image(m_item.image);
            if (!v || v->empty()) {
                v.reset();
                warn(std::string("image embedding unavailable (") + emb::provider_kind_str(provider.kind()) +
                     "): " + m_item.image);
            }
        }
        return m_images.emplace(provider.kind(), std::move(v)).first->second;
    }

    void warn(const std::string& msg) { m_out.warnings.push_back(msg); }
};

}  // namespace

ItemTags ItemTagger::tag(const CatalogItem& item) const {
    ItemTags out;
    out.item_id = item.id;

    QueryCache queries(item, out);

    for (const auto& t : m_taxonomies) {
        Assignment a;
        a.taxonomy = t.spec.name;
        a.matcher = t.spec.matcher;

        const emb::EmbeddingProvider& provider = *m_providers.at(t.spec.provider);
        const auto& fields = (t.spec.text == TextScope::Full) ? m_full_text_fields : m_text_fields;

        const std::optional<Vector>& q = queries.query(provider, t.spec.text, fields);
        if (!q) {
            out.assignments.push_back(std::move(a));
            continue;
        }

        a.available = true;
        switch (t.spec.matcher) {
            case MatcherKind::Greedy:
                a.path = greedy_match(t.tree, *q, &a.stats);
                a.value = join_labels(a.path);
                break;
            case MatcherKind::BestLeaf:
                a.path = best_leaf(t.tree, *q, &a.stats);
                a.value = join_labels(a.path);
                break;
            case MatcherKind::Multi:
                a.matches = multi_match(t.tree, *q, t.spec.threshold, &a.stats);
                break;
        }

        out.assignments.push_back(std::move(a));
    }

    return out;
}

}  // namespace tagger
