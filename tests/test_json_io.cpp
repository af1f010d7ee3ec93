// =============================================================================
// Taxonomy / Catalog / Config Loading Tests
// =============================================================================

#include <gtest/gtest.h>

#include <stdexcept>

#include "TempDir.hpp"
#include "io/JsonIO.hpp"

using namespace tagger;

class JsonIOTest : public TempDirTest {};

TEST_F(JsonIOTest, TaxonomyKeepsFileOrder) {
    RawNode root = parseTaxonomy(R"({
        "Tops": ["T-Shirt", "Blouse"],
        "Bottoms": {"Jeans": {}, "Shorts": null},
        "Accessories": {}
    })");

    ASSERT_EQ(root.children.size(), 3u);
    EXPECT_EQ(root.children[0].label, "Tops");
    EXPECT_EQ(root.children[1].label, "Bottoms");
    EXPECT_EQ(root.children[2].label, "Accessories");

    const RawNode& tops = root.children[0];
    ASSERT_EQ(tops.children.size(), 2u);
    EXPECT_EQ(tops.children[0].label, "T-Shirt");
    EXPECT_EQ(tops.children[1].label, "Blouse");
    EXPECT_TRUE(tops.children[0].children.empty());

    const RawNode& bottoms = root.children[1];
    ASSERT_EQ(bottoms.children.size(), 2u);
    EXPECT_EQ(bottoms.children[1].label, "Shorts");

    // empty object is a leaf
    EXPECT_TRUE(root.children[2].children.empty());
}

TEST_F(JsonIOTest, TaxonomyRejectsBadShapes) {
    EXPECT_THROW(parseTaxonomy(R"({"Tops": ["T-Shirt", 3]})"), std::runtime_error);
    EXPECT_THROW(parseTaxonomy(R"({"Tops": "T-Shirt"})"), std::runtime_error);
    EXPECT_THROW(parseTaxonomy("{not json"), std::runtime_error);
}

TEST_F(JsonIOTest, LoadTaxonomyFromFile) {
    const std::string path = write("tax.json", R"({"Color": ["Red", "Blue"]})");
    RawNode root = loadTaxonomy(path);
    ASSERT_EQ(root.children.size(), 1u);
    EXPECT_EQ(root.children[0].children.size(), 2u);

    EXPECT_THROW(loadTaxonomy((dir / "nope.json").string()), std::runtime_error);
}

TEST_F(JsonIOTest, LoadCatalog) {
    const std::string path = write("catalog.json", R"([
        {"id": "a", "image": "img/a.jpg", "fields": {"name": "Shirt", "brand": "Acme", "note": null}},
        {"id": "b"}
    ])");

    std::vector<CatalogItem> items = loadCatalog(path);
    ASSERT_EQ(items.size(), 2u);

    EXPECT_EQ(items[0].id, "a");
    EXPECT_EQ(items[0].image, "img/a.jpg");
    ASSERT_EQ(items[0].fields.size(), 2u);
    EXPECT_EQ(items[0].fields[0].first, "name");
    EXPECT_EQ(items[0].fields[1].second, "Acme");

    EXPECT_EQ(items[1].id, "b");
    EXPECT_TRUE(items[1].image.empty());
    EXPECT_TRUE(items[1].fields.empty());
}

TEST_F(JsonIOTest, CatalogItemNeedsId) {
    const std::string path = write("catalog.json", R"([{"image": "x.jpg"}])");
    EXPECT_THROW(loadCatalog(path), std::runtime_error);
}

TEST_F(JsonIOTest, ParseConfig) {
    TaggerConfig cfg = parseTaggerConfig(R"({
        "providers": {
            "clip": {
                "text_model": "models/clip/text.onnx",
                "image_model": "models/clip/image.onnx",
                "vocab": "models/clip/vocab.json",
                "merges": "models/clip/merges.txt"
            },
            "mclip": {
                "text_model": "/abs/mclip/text.onnx",
                "vocab": "/abs/mclip/vocab.txt",
                "tokenizer": "wordpiece",
                "max_len": 128,
                "lowercase": false,
                "threads": 4
            }
        },
        "text_fields": ["name", "brand"],
        "taxonomies": [
            {"name": "category", "path": "tax/category.json", "provider": "clip"},
            {"name": "attributes", "path": "tax/attr.json", "provider": "mclip",
             "policy": "path", "matcher": "multi", "text": "full", "threshold": 0.4}
        ],
        "cache": "cache/emb.bin"
    })", "/cfg");

    ASSERT_EQ(cfg.providers.size(), 2u);

    const emb::ProviderConfig& clip = cfg.providers.at(emb::ProviderKind::Baseline);
    EXPECT_EQ(clip.text_model, "/cfg/models/clip/text.onnx");
    EXPECT_EQ(clip.merges, "/cfg/models/clip/merges.txt");
    EXPECT_EQ(clip.tokenizer, emb::TokenizerKind::Bpe);
    EXPECT_EQ(clip.max_len, 77u);

    const emb::ProviderConfig& mclip = cfg.providers.at(emb::ProviderKind::Multilingual);
    EXPECT_EQ(mclip.text_model, "/abs/mclip/text.onnx");
    EXPECT_TRUE(mclip.image_model.empty());
    EXPECT_EQ(mclip.tokenizer, emb::TokenizerKind::WordPiece);
    EXPECT_EQ(mclip.max_len, 128u);
    EXPECT_FALSE(mclip.lowercase);
    EXPECT_EQ(mclip.threads, 4);

    EXPECT_EQ(cfg.text_fields, (std::vector<std::string>{"name", "brand"}));
    // defaults to the short list
    EXPECT_EQ(cfg.full_text_fields, cfg.text_fields);

    ASSERT_EQ(cfg.taxonomies.size(), 2u);
    const TaxonomySpec& category = cfg.taxonomies[0];
    EXPECT_EQ(category.path, "/cfg/tax/category.json");
    EXPECT_EQ(category.policy, EmbeddingPolicy::Label);
    EXPECT_EQ(category.matcher, MatcherKind::Greedy);
    EXPECT_EQ(category.text, TextScope::Short);

    const TaxonomySpec& attributes = cfg.taxonomies[1];
    EXPECT_EQ(attributes.provider, emb::ProviderKind::Multilingual);
    EXPECT_EQ(attributes.policy, EmbeddingPolicy::Path);
    EXPECT_EQ(attributes.matcher, MatcherKind::Multi);
    EXPECT_EQ(attributes.text, TextScope::Full);
    EXPECT_DOUBLE_EQ(attributes.threshold, 0.4);

    EXPECT_EQ(cfg.cache_path, "/cfg/cache/emb.bin");
}

TEST_F(JsonIOTest, ConfigErrorsNameTheField) {
    try {
        parseTaggerConfig(R"({"taxonomies": [
            {"name": "a", "path": "a.json", "provider": "clip"},
            {"name": "b", "path": "b.json", "provider": "clip", "policy": "leaf"}
        ]})", "");
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("config.taxonomies[1].policy"), std::string::npos);
    }

    try {
        parseTaggerConfig(R"({"taxonomies": [
            {"name": "color", "path": "c.json", "provider": "fclip", "policy": "path"}
        ]})", "");
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("config.taxonomies[0].matcher greedy requires policy label"),
                  std::string::npos);
    }

    EXPECT_THROW(parseTaggerConfig(R"({"providers": {}})", ""), std::runtime_error);
    EXPECT_THROW(parseTaggerConfig(R"({"taxonomies": [{"name": "a", "path": "a.json", "provider": "bert"}]})", ""),
                 std::runtime_error);
    EXPECT_THROW(parseTaggerConfig(R"({"providers": {"clip": {"text_model": "t.onnx", "vocab": "v.json"}},
                                       "taxonomies": []})", ""),
                 std::runtime_error);
}

TEST_F(JsonIOTest, LoadConfigResolvesAgainstItsDirectory) {
    std::filesystem::create_directories(dir / "conf");
    const std::string path = write("conf/tagger.json",
        R"({"taxonomies": [{"name": "c", "path": "c.json", "provider": "fclip"}]})");

    TaggerConfig cfg = loadTaggerConfig(path);
    ASSERT_EQ(cfg.taxonomies.size(), 1u);
    EXPECT_EQ(cfg.taxonomies[0].path, (dir / "conf" / "c.json").lexically_normal().string());
    EXPECT_TRUE(cfg.cache_path.empty());
}
