#pragma once
#include <string>
#include <vector>

#include "tagger/Config.hpp"
#include "tagger/Models.hpp"

// Taxonomy file: nested objects, sibling order preserved. A leaf is an empty
// object or null; an array of strings is shorthand for a list of leaves.
tagger::RawNode loadTaxonomy(const std::string& path);
tagger::RawNode parseTaxonomy(const std::string& json_text);

// Catalog file: array of {"id", "image", "fields": {name: value, ...}}
std::vector<tagger::CatalogItem> loadCatalog(const std::string& path);

// Relative paths inside the config resolve against the config's directory.
tagger::TaggerConfig loadTaggerConfig(const std::string& path);
tagger::TaggerConfig parseTaggerConfig(const std::string& json_text, const std::string& base_dir);
