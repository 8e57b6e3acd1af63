#include <axground/ax/tree_builder.h>
#include <axground/core/diagnostics.h>
#include <axground/core/config.h>

#include <utility>

namespace axground::ax {

namespace {

constexpr const char kModule[] = "tree_builder";

bool is_desktop(const RawNode& raw) {
    return !raw.ignored && raw.role &&
           normalize_role(std::string_view(*raw.role)) == CanonicalRole::Desktop;
}

} // anonymous namespace

// ============================================================================
// CanonicalNode
// ============================================================================

CanonicalNode* CanonicalNode::append_child(std::unique_ptr<CanonicalNode> child) {
    children.push_back(std::move(child));
    return children.back().get();
}

std::string node_label(std::uint32_t id) {
    return core::config::kNodeIdPrefix + std::to_string(id);
}

// ============================================================================
// TreeBuilder
// ============================================================================

TreeBuilder::TreeBuilder(geometry::Bounds screen) : screen_(screen) {}

std::unique_ptr<CanonicalNode> TreeBuilder::build(const std::vector<RawNode>& raw_nodes) {
    index_.clear();
    visited_.clear();
    next_id_ = 0;
    stats_ = TreeBuildStats{};
    stats_.input_nodes = raw_nodes.size();

    if (raw_nodes.empty()) {
        if (diagnostics_) diagnostics_->info(kModule, "build", "empty snapshot");
        return nullptr;
    }

    for (const auto& raw : raw_nodes) {
        if (!raw.node_id.empty()) {
            // First occurrence wins for duplicated ids.
            index_.emplace(raw.node_id, &raw);
        }
    }

    const RawNode* root = find_root(raw_nodes);

    std::unique_ptr<CanonicalNode> desktop;
    if (is_desktop(*root)) {
        // A re-read ui_tree document already starts at its desktop; reusing it
        // keeps node_<n> identical to the ids in that document.
        desktop = convert(*root);
        if (!desktop->bounds.has_positive_size()) desktop->bounds = screen_;
    } else {
        desktop = std::make_unique<CanonicalNode>();
        desktop->id = next_id_++;
        desktop->role = CanonicalRole::Desktop;
        desktop->bounds = screen_;

        for (auto& node : expand(*root)) {
            desktop->append_child(std::move(node));
        }
    }

    stats_.output_nodes = next_id_;
    if (diagnostics_) {
        diagnostics_->info(kModule, "build",
            std::to_string(stats_.input_nodes) + " raw nodes -> " +
            std::to_string(stats_.output_nodes) + " canonical nodes (" +
            std::to_string(stats_.spliced) + " spliced)");
    }
    return desktop;
}

const RawNode* TreeBuilder::find_root(const std::vector<RawNode>& raw_nodes) const {
    std::unordered_set<std::string> child_ids;
    for (const auto& raw : raw_nodes) {
        child_ids.insert(raw.child_ids.begin(), raw.child_ids.end());
    }
    for (const auto& raw : raw_nodes) {
        if (!raw.node_id.empty() && child_ids.count(raw.node_id) == 0) {
            return &raw;
        }
    }
    // Every node is somebody's child (malformed or cyclic snapshot).
    if (diagnostics_) {
        diagnostics_->warn(kModule, "find_root",
                           "no parentless node; using first node as root");
    }
    return &raw_nodes.front();
}

std::vector<std::unique_ptr<CanonicalNode>> TreeBuilder::expand(const RawNode& raw) {
    std::vector<std::unique_ptr<CanonicalNode>> out;
    visited_.insert(&raw);

    if (raw.ignored) {
        ++stats_.spliced;
        if (diagnostics_) {
            diagnostics_->debug(kModule, "splice", "ignored node '" + raw.node_id +
                                "' replaced by its " + std::to_string(raw.child_ids.size()) +
                                " children");
        }
        append_children(raw, out);
        return out;
    }

    out.push_back(convert(raw));
    return out;
}

std::unique_ptr<CanonicalNode> TreeBuilder::convert(const RawNode& raw) {
    auto node = std::make_unique<CanonicalNode>();
    node->id = next_id_++;
    node->role = normalize_role(raw.role ? std::optional<std::string_view>(*raw.role)
                                         : std::nullopt,
                                tally_);
    node->name = raw.name.value_or("");
    node->bounds = raw.bounds.value_or(geometry::Bounds{});
    node->states = extract_states(raw.properties, raw.ignored);

    append_children(raw, node->children);
    return node;
}

void TreeBuilder::append_children(const RawNode& raw,
                                  std::vector<std::unique_ptr<CanonicalNode>>& out) {
    for (const auto& child_id : raw.child_ids) {
        auto it = index_.find(child_id);
        if (it == index_.end()) {
            ++stats_.dangling;
            if (diagnostics_) {
                diagnostics_->warn(kModule, "resolve", "node '" + raw.node_id +
                                   "' references missing child '" + child_id + "'");
            }
            continue;
        }
        const RawNode* child = it->second;
        if (visited_.count(child) > 0) {
            ++stats_.revisited;
            if (diagnostics_) {
                diagnostics_->warn(kModule, "resolve", "node '" + child_id +
                                   "' already attached; second reference from '" +
                                   raw.node_id + "' dropped");
            }
            continue;
        }
        for (auto& node : expand(*child)) {
            out.push_back(std::move(node));
        }
    }
}

} // namespace axground::ax
