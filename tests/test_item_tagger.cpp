// =============================================================================
// Item Tagger Tests: query assembly, blending, per-taxonomy assignment
// =============================================================================

#include <gtest/gtest.h>

#include <stdexcept>

#include "FakeProvider.hpp"
#include "tagger/ItemTagger.hpp"
#include "tagger/TagsArtifact.hpp"

using namespace tagger;

static LoadedTaxonomy load(
    const std::string& name,
    const RawNode& raw,
    const emb::EmbeddingProvider& provider,
    EmbeddingPolicy policy,
    MatcherKind matcher,
    TextScope text = TextScope::Short,
    double threshold = 0.25
) {
    TaxonomySpec spec;
    spec.name = name;
    spec.provider = provider.kind();
    spec.policy = policy;
    spec.matcher = matcher;
    spec.text = text;
    spec.threshold = threshold;
    return LoadedTaxonomy{spec, build_tree(raw, provider, policy)};
}

class ItemTaggerTest : public ::testing::Test {
protected:
    FakeProvider clip{emb::ProviderKind::Baseline};
    FakeProvider fclip{emb::ProviderKind::Fast};
    std::vector<LoadedTaxonomy> taxonomies;

    CatalogItem shirt;

    void SetUp() override {
        // category: greedy over label embeddings
        clip.texts["Casual"] = {1.0f, 1.0f};
        clip.texts["Formal"] = {0.0f, 1.0f};
        taxonomies.push_back(load("category",
            RawNode{"", {RawNode{"Casual", {}}, RawNode{"Formal", {}}}},
            clip, EmbeddingPolicy::Label, MatcherKind::Greedy));

        // color: best leaf over path phrases, full text
        fclip.texts["a photo of a red color"] = {1.0f, 0.0f};
        fclip.texts["a photo of a blue color"] = {0.0f, 1.0f};
        taxonomies.push_back(load("color",
            RawNode{"", {RawNode{"Color", {RawNode{"Red", {}}, RawNode{"Blue", {}}}}}},
            fclip, EmbeddingPolicy::Path, MatcherKind::BestLeaf, TextScope::Full));

        // style: multi match, same provider and text as category
        clip.texts["a photo of a casual style"] = {1.0f, 1.0f};
        clip.texts["a photo of a formal style"] = {0.0f, 1.0f};
        taxonomies.push_back(load("style",
            RawNode{"", {RawNode{"Style", {RawNode{"Casual", {}}, RawNode{"Formal", {}}}}}},
            clip, EmbeddingPolicy::Path, MatcherKind::Multi, TextScope::Short, 0.5));

        // item queries
        clip.images["img/1.jpg"] = {1.0f, 0.0f};
        clip.texts["Linen shirt"] = {0.0f, 1.0f};
        fclip.images["img/1.jpg"] = {1.0f, 0.0f};
        fclip.texts["Linen shirt. Bright red"] = {1.0f, 0.0f};

        shirt.id = "sku-1";
        shirt.image = "img/1.jpg";
        shirt.fields = {{"name", "Linen shirt"}, {"brand", "Acme"}, {"description", " Bright red "}};

        clip.text_calls = clip.image_calls = 0;
        fclip.text_calls = fclip.image_calls = 0;
    }

    ProviderMap providers() const {
        return {{emb::ProviderKind::Baseline, &clip}, {emb::ProviderKind::Fast, &fclip}};
    }

    ItemTagger make_tagger() const {
        return ItemTagger(taxonomies, providers(), {"name"}, {"name", "description"});
    }
};

TEST_F(ItemTaggerTest, BuildItemTextFollowsFieldOrder) {
    EXPECT_EQ(build_item_text(shirt, {"name"}), "Linen shirt");
    EXPECT_EQ(build_item_text(shirt, {"description", "name"}), "Bright red. Linen shirt");
    EXPECT_EQ(build_item_text(shirt, {"missing", "brand"}), "Acme");
}

TEST_F(ItemTaggerTest, BuildItemTextSkipsBlankFields) {
    CatalogItem item;
    item.fields = {{"name", "Hat"}, {"brand", "   "}, {"description", ""}};
    EXPECT_EQ(build_item_text(item, {"brand", "name", "description"}), "Hat");
    EXPECT_EQ(build_item_text(item, {"brand"}), "");
}

TEST_F(ItemTaggerTest, TagsEveryTaxonomyInOrder) {
    ItemTagger tagger = make_tagger();
    ItemTags t = tagger.tag(shirt);

    EXPECT_EQ(t.item_id, "sku-1");
    EXPECT_TRUE(t.warnings.empty());
    ASSERT_EQ(t.assignments.size(), 3u);

    const Assignment& category = t.assignments[0];
    EXPECT_EQ(category.taxonomy, "category");
    EXPECT_TRUE(category.available);
    // blend of image (1,0) and text (0,1) sits on "Casual"
    EXPECT_EQ(category.path, (Path{"Casual"}));
    EXPECT_EQ(category.value, "Casual");

    const Assignment& color = t.assignments[1];
    EXPECT_EQ(color.matcher, MatcherKind::BestLeaf);
    EXPECT_EQ(color.path, (Path{"Color", "Red"}));
    EXPECT_EQ(color.value, "Color Red");

    const Assignment& style = t.assignments[2];
    EXPECT_EQ(style.matcher, MatcherKind::Multi);
    ASSERT_EQ(style.matches.size(), 1u);
    EXPECT_EQ(style.matches[0].path, (Path{"Style", "Casual"}));
}

TEST_F(ItemTaggerTest, TextOnlyItemUsesTextAlone) {
    shirt.image.clear();

    ItemTags t = make_tagger().tag(shirt);
    EXPECT_TRUE(t.warnings.empty());
    EXPECT_EQ(t.assignments[0].path, (Path{"Formal"}));
    EXPECT_EQ(clip.image_calls, 0);
}

TEST_F(ItemTaggerTest, QueriesComputedOncePerProviderAndText) {
    make_tagger().tag(shirt);

    // category and style share the clip short-text query
    EXPECT_EQ(clip.text_calls, 1);
    EXPECT_EQ(clip.image_calls, 1);
    EXPECT_EQ(fclip.text_calls, 1);
    EXPECT_EQ(fclip.image_calls, 1);
}

TEST_F(ItemTaggerTest, MissingImageFallsBackToTextWithWarning) {
    shirt.image = "img/missing.jpg";

    ItemTags t = make_tagger().tag(shirt);
    ASSERT_EQ(t.warnings.size(), 2u);
    EXPECT_NE(t.warnings[0].find("image embedding unavailable"), std::string::npos);
    EXPECT_NE(t.warnings[0].find("img/missing.jpg"), std::string::npos);

    EXPECT_TRUE(t.assignments[0].available);
    EXPECT_EQ(t.assignments[0].path, (Path{"Formal"}));
}

TEST_F(ItemTaggerTest, NothingToEmbedLeavesAssignmentsUnavailable) {
    CatalogItem bare;
    bare.id = "sku-2";

    ItemTags t = make_tagger().tag(bare);
    ASSERT_EQ(t.assignments.size(), 3u);
    for (const auto& a : t.assignments) {
        EXPECT_FALSE(a.available);
        EXPECT_TRUE(a.path.empty());
        EXPECT_TRUE(a.matches.empty());
    }
    EXPECT_EQ(clip.text_calls, 0);
}

TEST_F(ItemTaggerTest, UnembeddableTextIsWarned) {
    shirt.image.clear();
    shirt.fields = {{"name", "Unknown thing"}};

    ItemTags t = make_tagger().tag(shirt);
    EXPECT_FALSE(t.assignments[0].available);
    EXPECT_FALSE(t.warnings.empty());
    EXPECT_NE(t.warnings[0].find("text embedding unavailable"), std::string::npos);
}

TEST_F(ItemTaggerTest, BlendSizeMismatchIsWarned) {
    clip.images["img/1.jpg"] = {1.0f, 0.0f, 0.0f};

    ItemTags t = make_tagger().tag(shirt);
    EXPECT_FALSE(t.assignments[0].available);
    EXPECT_TRUE(t.assignments[1].available);

    bool found = false;
    for (const auto& w : t.warnings) {
        if (w.find("cannot blend") != std::string::npos) found = true;
    }
    EXPECT_TRUE(found);
}

static std::vector<LoadedTaxonomy> copy_of(const std::vector<LoadedTaxonomy>& v) {
    return v;
}

// The tagger keeps its own taxonomies; the caller's vector may go away
TEST_F(ItemTaggerTest, OwnsItsTaxonomies) {
    ItemTagger tagger(copy_of(taxonomies), providers(), {"name"}, {"name", "description"});
    taxonomies.clear();

    ASSERT_EQ(tagger.taxonomies().size(), 3u);
    ItemTags t = tagger.tag(shirt);
    ASSERT_EQ(t.assignments.size(), 3u);
    EXPECT_EQ(t.assignments[0].path, (Path{"Casual"}));
    EXPECT_EQ(t.assignments[1].path, (Path{"Color", "Red"}));
}

TEST_F(ItemTaggerTest, MissingProviderRejected) {
    ProviderMap only_clip = {{emb::ProviderKind::Baseline, &clip}};
    EXPECT_THROW(ItemTagger tagger(taxonomies, only_clip, {"name"}, {"name"}), std::invalid_argument);
}

// A tree embedded with one model cannot be queried with another
TEST_F(ItemTaggerTest, ProviderSpaceMismatchRejected) {
    taxonomies[0].spec.provider = emb::ProviderKind::Fast;
    EXPECT_THROW(make_tagger(), std::invalid_argument);
}

TEST_F(ItemTaggerTest, ArtifactJsonShape) {
    TagsArtifact artifact;
    artifact.config_path = "config/tagger.json";
    artifact.catalog_path = "data/catalog.json";
    artifact.num_items = 1;
    artifact.items.push_back(make_tagger().tag(shirt));

    nlohmann::json j = artifact.to_json();
    EXPECT_EQ(j["num_items"], 1);
    ASSERT_EQ(j["items"].size(), 1u);

    const auto& item = j["items"][0];
    EXPECT_EQ(item["item_id"], "sku-1");
    EXPECT_FALSE(item.contains("warnings"));

    const auto& category = item["assignments"][0];
    EXPECT_EQ(category["matcher"], "greedy");
    EXPECT_EQ(category["value"], "Casual");
    EXPECT_EQ(category["available"], true);

    const auto& style = item["assignments"][2];
    EXPECT_EQ(style["matcher"], "multi");
    ASSERT_EQ(style["matches"].size(), 1u);
    EXPECT_EQ(style["matches"][0]["path"][1], "Casual");
    EXPECT_FALSE(style.contains("value"));
}
