#pragma once
#include <axground/ax/state.h>
#include <axground/geometry/rect.h>
#include <optional>
#include <string>
#include <vector>

namespace axground::ax {

// One node of a browser accessibility snapshot, as collected. Fields the
// collector could not provide stay empty; the tree builder degrades them
// (no bounds -> zero rectangle, no role -> Unknown).
struct RawNode {
    std::string node_id;
    std::vector<std::string> child_ids;
    std::optional<std::string> role;
    std::optional<std::string> name;
    std::optional<geometry::Bounds> bounds;
    bool ignored = false;
    std::vector<RawProperty> properties;
};

// A whole snapshot: the flat node list plus the screen it was taken on.
struct Snapshot {
    std::vector<RawNode> nodes;
    int screen_width = 0;
    int screen_height = 0;
};

} // namespace axground::ax
