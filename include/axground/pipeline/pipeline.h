#pragma once
#include <axground/ax/raw_node.h>
#include <axground/ax/role.h>
#include <axground/ax/tree_builder.h>
#include <axground/selection/candidate_selector.h>
#include <axground/selection/occlusion_resolver.h>
#include <axground/visibility/visibility_walker.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace axground::core {
class DiagnosticEmitter;
}

namespace axground::pipeline {

struct PipelineConfig {
    visibility::WalkOptions walk;
    selection::CandidateRules candidates;
    selection::OcclusionRules occlusion;

    // The walker and the selector share one area threshold.
    void set_min_visible_area(std::int64_t area) {
        walk.min_visible_area = area;
        candidates.min_visible_area = area;
    }
};

// Everything one snapshot run produced. `tree` is null for an empty snapshot.
struct PipelineResult {
    std::unique_ptr<ax::CanonicalNode> tree;
    std::vector<visibility::VisibleRecord> records;
    std::vector<visibility::VisibleRecord> candidates;
    std::vector<selection::Sample> samples;
    ax::UnmappedRoleTally unmapped_roles;
    ax::TreeBuildStats tree_stats;
    visibility::WalkStats walk_stats;
};

// The emitted sample document for one screenshot.
struct SampleSet {
    std::string image_filename;
    int image_width = 0;
    int image_height = 0;
    std::vector<selection::Sample> samples;
};

// Runs tree building, visibility, candidate selection and occlusion over one
// snapshot. Stateless: the same snapshot always yields the same result, and
// independent snapshots may run on different threads.
PipelineResult extract_samples(const ax::Snapshot& snapshot,
                               const PipelineConfig& config = {},
                               core::DiagnosticEmitter* diagnostics = nullptr);

SampleSet make_sample_set(const PipelineResult& result, const ax::Snapshot& snapshot,
                          std::string image_filename);

} // namespace axground::pipeline
