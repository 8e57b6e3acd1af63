#pragma once
#include <axground/ax/role.h>
#include <axground/core/config.h>
#include <axground/visibility/visibility_walker.h>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace axground::core {
class DiagnosticEmitter;
}

namespace axground::selection {

using RoleSet = std::set<ax::CanonicalRole>;

// Roles a user can click or type into.
const RoleSet& default_interactive_roles();

struct CandidateRules {
    RoleSet interactive_roles = default_interactive_roles();
    std::int64_t min_visible_area = core::config::kMinVisibleArea;
};

// Copy of `s` without leading/trailing ASCII whitespace.
std::string trim(std::string_view s);

// Keeps interactive, named, large enough records that are not marked
// Invisible. The soft Hidden tag does not exclude: some frameworks mark
// rendered controls aria-hidden, and geometry is trusted over semantics.
class CandidateSelector {
public:
    explicit CandidateSelector(CandidateRules rules = {}) : rules_(std::move(rules)) {}

    void set_diagnostics(core::DiagnosticEmitter* emitter) { diagnostics_ = emitter; }

    bool accepts(const visibility::VisibleRecord& record) const;

    std::vector<visibility::VisibleRecord>
    select(const std::vector<visibility::VisibleRecord>& records) const;

    const CandidateRules& rules() const { return rules_; }

private:
    CandidateRules rules_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
};

} // namespace axground::selection
