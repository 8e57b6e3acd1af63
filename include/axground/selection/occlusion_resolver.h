#pragma once
#include <axground/ax/role.h>
#include <axground/core/config.h>
#include <axground/geometry/rect.h>
#include <axground/selection/candidate_selector.h>
#include <axground/visibility/visibility_walker.h>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace axground::core {
class DiagnosticEmitter;
}

namespace axground::selection {

// Roles that never block interaction even when painted on top: text,
// labels and pure layout groups.
const RoleSet& default_non_occluding_roles();

struct OcclusionRules {
    RoleSet non_occluding_roles = default_non_occluding_roles();
    double coverage_ratio = core::config::kOcclusionCoverageRatio;
};

// A grounding sample: the visible box of one clickable element.
struct Sample {
    std::uint32_t id = 0;
    ax::CanonicalRole category = ax::CanonicalRole::Unknown;
    std::string name;
    geometry::ClipRect bbox;
    geometry::Point point;
};

class OcclusionResolver {
public:
    explicit OcclusionResolver(OcclusionRules rules = {}) : rules_(std::move(rules)) {}

    void set_diagnostics(core::DiagnosticEmitter* emitter) { diagnostics_ = emitter; }

    // True when `above` hides most of `below`: it covers more than the
    // coverage ratio of `below`'s visible area and contains its center.
    bool occludes(const visibility::VisibleRecord& above,
                  const visibility::VisibleRecord& below) const;

    // Drops candidates occluded by any record painted after them in
    // `all_records` (document order is the only z-order signal) and turns
    // the rest into samples, in candidate order.
    std::vector<Sample> resolve(const std::vector<visibility::VisibleRecord>& candidates,
                                const std::vector<visibility::VisibleRecord>& all_records) const;

    const OcclusionRules& rules() const { return rules_; }

private:
    OcclusionRules rules_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
};

Sample make_sample(const visibility::VisibleRecord& record);

} // namespace axground::selection
