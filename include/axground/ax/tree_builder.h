#pragma once
#include <axground/ax/raw_node.h>
#include <axground/ax/role.h>
#include <axground/ax/state.h>
#include <axground/geometry/rect.h>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace axground::core {
class DiagnosticEmitter;
}

namespace axground::ax {

// Node of the canonical element tree. Children are owned; insertion order is
// paint order (earlier children are drawn first).
struct CanonicalNode {
    std::uint32_t id = 0;
    CanonicalRole role = CanonicalRole::Unknown;
    std::string name;
    geometry::Bounds bounds;
    StateSet states;
    std::vector<std::unique_ptr<CanonicalNode>> children;

    CanonicalNode* append_child(std::unique_ptr<CanonicalNode> child);
    bool has_state(CanonicalState s) const { return states.count(s) > 0; }
};

// "node_<id>", the identifier form used in emitted documents.
std::string node_label(std::uint32_t id);

struct TreeBuildStats {
    std::size_t input_nodes = 0;
    std::size_t output_nodes = 0;  // includes the synthetic root
    std::size_t spliced = 0;       // ignored nodes removed
    std::size_t dangling = 0;      // child ids with no matching node
    std::size_t revisited = 0;     // nodes reached through a second parent
};

// Rebuilds the element hierarchy from a flat, id-referenced snapshot.
//
// The result is wrapped in a synthetic Desktop root (id 0) covering the
// screen; snapshot nodes follow with fresh pre-order ids. A non-ignored root
// that is already a desktop takes the synthetic root's place instead. Ignored nodes
// are spliced out and their children take their place. Dangling references,
// duplicate parents and cycles are skipped, never fatal.
class TreeBuilder {
public:
    explicit TreeBuilder(geometry::Bounds screen);

    void set_diagnostics(core::DiagnosticEmitter* emitter) { diagnostics_ = emitter; }
    void set_role_tally(UnmappedRoleTally* tally) { tally_ = tally; }

    // Returns nullptr for an empty snapshot.
    std::unique_ptr<CanonicalNode> build(const std::vector<RawNode>& raw_nodes);

    const TreeBuildStats& stats() const { return stats_; }

private:
    const RawNode* find_root(const std::vector<RawNode>& raw_nodes) const;
    std::vector<std::unique_ptr<CanonicalNode>> expand(const RawNode& raw);
    std::unique_ptr<CanonicalNode> convert(const RawNode& raw);
    void append_children(const RawNode& raw, std::vector<std::unique_ptr<CanonicalNode>>& out);

    geometry::Bounds screen_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    UnmappedRoleTally* tally_ = nullptr;

    std::unordered_map<std::string, const RawNode*> index_;
    std::unordered_set<const RawNode*> visited_;
    std::uint32_t next_id_ = 0;
    TreeBuildStats stats_;
};

} // namespace axground::ax
