#include <axground/selection/candidate_selector.h>
#include <axground/core/diagnostics.h>

#include <cctype>

namespace axground::selection {

using ax::CanonicalRole;

const RoleSet& default_interactive_roles() {
    static const RoleSet roles = {
        CanonicalRole::Button,   CanonicalRole::Link,        CanonicalRole::TextField,
        CanonicalRole::TextArea, CanonicalRole::CheckBox,    CanonicalRole::RadioButton,
        CanonicalRole::MenuItem, CanonicalRole::Tab,         CanonicalRole::ComboBox,
        CanonicalRole::ListBox,  CanonicalRole::Slider,
    };
    return roles;
}

std::string trim(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return std::string(s.substr(begin, end - begin));
}

bool CandidateSelector::accepts(const visibility::VisibleRecord& record) const {
    if (rules_.interactive_roles.count(record.role) == 0) return false;
    if (trim(record.name).empty()) return false;
    // Already guaranteed by the walker with default options; rechecked
    // because the rules may be stricter than the walk.
    if (record.visible_area < rules_.min_visible_area || record.visible_area <= 0) return false;
    if (record.has_state(ax::CanonicalState::Invisible)) return false;
    return true;
}

std::vector<visibility::VisibleRecord>
CandidateSelector::select(const std::vector<visibility::VisibleRecord>& records) const {
    std::vector<visibility::VisibleRecord> out;
    for (const auto& record : records) {
        if (accepts(record)) {
            out.push_back(record);
        }
    }
    if (diagnostics_) {
        diagnostics_->info("selection", "candidates",
                           std::to_string(out.size()) + " of " + std::to_string(records.size()) +
                           " on-screen nodes are candidates");
    }
    return out;
}

} // namespace axground::selection
