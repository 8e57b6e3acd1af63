#pragma once
#include <axground/ax/role.h>
#include <axground/ax/state.h>
#include <axground/ax/tree_builder.h>
#include <axground/core/config.h>
#include <axground/geometry/rect.h>
#include <cstdint>
#include <string>
#include <vector>

namespace axground::core {
class DiagnosticEmitter;
}

namespace axground::visibility {

// Whether a node's own states may cut off its subtree.
enum class SubtreePolicy {
    // Only geometry prunes; states are left to candidate selection.
    GeometryFirst,
    // Additionally prune subtrees rooted at hidden, invisible or collapsed nodes.
    PruneHiddenOrCollapsed,
};

const char* subtree_policy_name(SubtreePolicy policy);

struct WalkOptions {
    std::int64_t min_visible_area = core::config::kMinVisibleArea;
    SubtreePolicy policy = SubtreePolicy::GeometryFirst;
};

// A node that survived clipping. Records are produced in pre-order, which is
// also taken as back-to-front paint order.
struct VisibleRecord {
    std::uint32_t id = 0;
    ax::CanonicalRole role = ax::CanonicalRole::Unknown;
    std::string name;
    ax::StateSet states;
    geometry::Bounds bounds;
    geometry::ClipRect visible;
    std::int64_t visible_area = 0;

    bool has_state(ax::CanonicalState s) const { return states.count(s) > 0; }
};

struct WalkStats {
    std::size_t visited = 0;
    std::size_t emitted = 0;
    std::size_t pruned_zero_size = 0;
    std::size_t pruned_clipped = 0;
    std::size_t pruned_by_state = 0;
};

class VisibilityWalker {
public:
    explicit VisibilityWalker(WalkOptions options = {}) : options_(options) {}

    void set_diagnostics(core::DiagnosticEmitter* emitter) { diagnostics_ = emitter; }

    // Throws ContractViolation when `screen` is inverted.
    std::vector<VisibleRecord> walk(const ax::CanonicalNode& root,
                                    const geometry::ClipRect& screen);

    const WalkStats& stats() const { return stats_; }

private:
    void visit(const ax::CanonicalNode& node, const geometry::ClipRect& clip,
               std::vector<VisibleRecord>& out);
    bool pruned_by_state(const ax::CanonicalNode& node) const;

    WalkOptions options_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    WalkStats stats_;
};

} // namespace axground::visibility
