#include <axground/visibility/visibility_walker.h>
#include <axground/core/diagnostics.h>
#include <axground/core/error.h>

namespace axground::visibility {

const char* subtree_policy_name(SubtreePolicy policy) {
    switch (policy) {
        case SubtreePolicy::GeometryFirst:          return "geometry-first";
        case SubtreePolicy::PruneHiddenOrCollapsed: return "prune-hidden-or-collapsed";
    }
    return "unknown";
}

std::vector<VisibleRecord> VisibilityWalker::walk(const ax::CanonicalNode& root,
                                                  const geometry::ClipRect& screen) {
    if (!screen.is_well_formed()) {
        throw ContractViolation("screen rectangle is inverted: " + geometry::to_string(screen));
    }

    stats_ = WalkStats{};
    std::vector<VisibleRecord> records;
    visit(root, screen, records);

    if (diagnostics_) {
        diagnostics_->debug("visibility", "walk",
            std::to_string(stats_.emitted) + "/" + std::to_string(stats_.visited) +
            " nodes on screen (zero-size " + std::to_string(stats_.pruned_zero_size) +
            ", clipped " + std::to_string(stats_.pruned_clipped) +
            ", by state " + std::to_string(stats_.pruned_by_state) + ")");
    }
    return records;
}

void VisibilityWalker::visit(const ax::CanonicalNode& node, const geometry::ClipRect& clip,
                             std::vector<VisibleRecord>& out) {
    ++stats_.visited;

    if (!node.bounds.has_positive_size()) {
        ++stats_.pruned_zero_size;
        return;
    }

    // Clip only shrinks going down, so a node clipped away takes its
    // whole subtree with it.
    auto visible = geometry::intersect(geometry::ClipRect::from_bounds(node.bounds), clip);
    if (!visible || visible->area() < options_.min_visible_area) {
        ++stats_.pruned_clipped;
        return;
    }

    if (pruned_by_state(node)) {
        ++stats_.pruned_by_state;
        return;
    }

    VisibleRecord record;
    record.id = node.id;
    record.role = node.role;
    record.name = node.name;
    record.states = node.states;
    record.bounds = node.bounds;
    record.visible = *visible;
    record.visible_area = visible->area();
    out.push_back(std::move(record));
    ++stats_.emitted;

    const geometry::ClipRect child_clip = *visible;
    for (const auto& child : node.children) {
        visit(*child, child_clip, out);
    }
}

bool VisibilityWalker::pruned_by_state(const ax::CanonicalNode& node) const {
    if (options_.policy != SubtreePolicy::PruneHiddenOrCollapsed) {
        return false;
    }
    return node.has_state(ax::CanonicalState::Hidden) ||
           node.has_state(ax::CanonicalState::Invisible) ||
           node.has_state(ax::CanonicalState::Collapsed);
}

} // namespace axground::visibility
