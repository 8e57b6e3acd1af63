#include <axground/pipeline/pipeline.h>
#include <axground/core/diagnostics.h>

#include <utility>

namespace axground::pipeline {

PipelineResult extract_samples(const ax::Snapshot& snapshot, const PipelineConfig& config,
                               core::DiagnosticEmitter* diagnostics) {
    PipelineResult result;

    const geometry::Bounds screen{0, 0, snapshot.screen_width, snapshot.screen_height};

    ax::TreeBuilder builder(screen);
    builder.set_diagnostics(diagnostics);
    builder.set_role_tally(&result.unmapped_roles);
    result.tree = builder.build(snapshot.nodes);
    result.tree_stats = builder.stats();

    if (!result.tree) {
        return result;
    }

    visibility::VisibilityWalker walker(config.walk);
    walker.set_diagnostics(diagnostics);
    result.records = walker.walk(*result.tree, geometry::ClipRect::from_bounds(screen));
    result.walk_stats = walker.stats();

    selection::CandidateSelector selector(config.candidates);
    selector.set_diagnostics(diagnostics);
    result.candidates = selector.select(result.records);

    selection::OcclusionResolver resolver(config.occlusion);
    resolver.set_diagnostics(diagnostics);
    result.samples = resolver.resolve(result.candidates, result.records);

    if (diagnostics && !result.unmapped_roles.empty()) {
        diagnostics->info("pipeline", "roles",
                          std::to_string(result.unmapped_roles.total()) +
                          " nodes with unmapped roles");
    }
    return result;
}

SampleSet make_sample_set(const PipelineResult& result, const ax::Snapshot& snapshot,
                          std::string image_filename) {
    SampleSet set;
    set.image_filename = std::move(image_filename);
    set.image_width = snapshot.screen_width;
    set.image_height = snapshot.screen_height;
    set.samples = result.samples;
    return set;
}

} // namespace axground::pipeline
