#include <axground/selection/occlusion_resolver.h>
#include <axground/core/diagnostics.h>

#include <unordered_map>

namespace axground::selection {

using ax::CanonicalRole;

const RoleSet& default_non_occluding_roles() {
    static const RoleSet roles = {
        CanonicalRole::Label,    CanonicalRole::Panel,  CanonicalRole::ListBox,
        CanonicalRole::ListItem, CanonicalRole::Window, CanonicalRole::Desktop,
    };
    return roles;
}

Sample make_sample(const visibility::VisibleRecord& record) {
    Sample sample;
    sample.id = record.id;
    sample.category = record.role;
    sample.name = trim(record.name);
    sample.bbox = record.visible;
    sample.point = record.visible.center();
    return sample;
}

bool OcclusionResolver::occludes(const visibility::VisibleRecord& above,
                                 const visibility::VisibleRecord& below) const {
    if (rules_.non_occluding_roles.count(above.role) > 0) return false;

    const std::int64_t below_area = below.visible.area();
    if (below_area <= 0) return false;

    const std::int64_t covered = geometry::intersection_area(below.visible, above.visible);
    if (covered == 0) return false;
    if (static_cast<double>(covered) <= rules_.coverage_ratio * static_cast<double>(below_area)) {
        return false;
    }
    return above.visible.contains(below.visible.center());
}

std::vector<Sample>
OcclusionResolver::resolve(const std::vector<visibility::VisibleRecord>& candidates,
                           const std::vector<visibility::VisibleRecord>& all_records) const {
    std::unordered_map<std::uint32_t, std::size_t> position;
    position.reserve(all_records.size());
    for (std::size_t i = 0; i < all_records.size(); ++i) {
        position.emplace(all_records[i].id, i);
    }

    std::vector<Sample> samples;
    samples.reserve(candidates.size());
    std::size_t occluded = 0;

    for (const auto& candidate : candidates) {
        bool hidden = false;
        auto it = position.find(candidate.id);
        if (it != position.end()) {
            for (std::size_t j = it->second + 1; j < all_records.size(); ++j) {
                if (occludes(all_records[j], candidate)) {
                    hidden = true;
                    if (diagnostics_) {
                        diagnostics_->debug("selection", "occlusion",
                                            ax::node_label(candidate.id) + " covered by " +
                                            ax::node_label(all_records[j].id));
                    }
                    break;
                }
            }
        }
        if (hidden) {
            ++occluded;
            continue;
        }
        samples.push_back(make_sample(candidate));
    }

    if (diagnostics_) {
        diagnostics_->info("selection", "occlusion",
                           std::to_string(samples.size()) + " samples, " +
                           std::to_string(occluded) + " occluded");
    }
    return samples;
}

} // namespace axground::selection
