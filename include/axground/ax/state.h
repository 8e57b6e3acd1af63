#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace axground::ax {

enum class CanonicalState : uint8_t {
    Focused,
    Selected,
    Checked,
    Disabled,
    Expanded,
    Collapsed,
    Hidden,     // soft: ignored or aria-hidden, may still be painted
    Invisible,  // strict: not rendered
    Editable,
    ReadOnly,
    Pressed,
    Active,
};

using StateSet = std::set<CanonicalState>;

const char* state_name(CanonicalState state);
std::optional<CanonicalState> state_from_name(std::string_view name);

// A vendor property value: absent, boolean, number or token/tristate string.
using PropertyValue = std::variant<std::monostate, bool, double, std::string>;

struct RawProperty {
    std::string name;
    PropertyValue value;
};

// Maps vendor property flags to canonical state tags. `ignored` forces
// Hidden. Returns an empty set when nothing matched.
StateSet extract_states(const std::vector<RawProperty>& properties, bool ignored = false);

} // namespace axground::ax
