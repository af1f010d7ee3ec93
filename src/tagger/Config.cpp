#include "tagger/Config.hpp"

namespace tagger {

const char* matcher_kind_str(MatcherKind m) {
    switch (m) {
        case MatcherKind::Greedy: return "greedy";
        case MatcherKind::BestLeaf: return "best_leaf";
        case MatcherKind::Multi: return "multi";
        default: return "unknown";
    }
}

bool parse_matcher_kind(const std::string& name, MatcherKind& out) {
    if (name == "greedy")    { out = MatcherKind::Greedy; return true; }
    if (name == "best_leaf") { out = MatcherKind::BestLeaf; return true; }
    if (name == "multi")     { out = MatcherKind::Multi; return true; }
    return false;
}

}  // namespace tagger
