#include <axground/ax/state.h>

#include <array>
#include <utility>

namespace axground::ax {

namespace {

constexpr std::array<std::pair<CanonicalState, const char*>, 12> kStateNames = {{
    {CanonicalState::Focused, "focused"},
    {CanonicalState::Selected, "selected"},
    {CanonicalState::Checked, "checked"},
    {CanonicalState::Disabled, "disabled"},
    {CanonicalState::Expanded, "expanded"},
    {CanonicalState::Collapsed, "collapsed"},
    {CanonicalState::Hidden, "hidden"},
    {CanonicalState::Invisible, "invisible"},
    {CanonicalState::Editable, "editable"},
    {CanonicalState::ReadOnly, "readonly"},
    {CanonicalState::Pressed, "pressed"},
    {CanonicalState::Active, "active"},
}};

// Vendor flag name -> tag contributed when the flag is true.
std::optional<CanonicalState> flag_state(std::string_view flag) {
    if (flag == "busy" || flag == "modal") return CanonicalState::Active;
    return state_from_name(flag);
}

bool is_true(const PropertyValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) return *b;
    if (const std::string* s = std::get_if<std::string>(&value)) return *s == "true";
    return false;
}

bool is_false(const PropertyValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) return !*b;
    if (const std::string* s = std::get_if<std::string>(&value)) return *s == "false";
    return false;
}

} // anonymous namespace

const char* state_name(CanonicalState state) {
    for (const auto& [s, name] : kStateNames) {
        if (s == state) return name;
    }
    return "unknown";
}

std::optional<CanonicalState> state_from_name(std::string_view name) {
    for (const auto& [s, n] : kStateNames) {
        if (name == n) return s;
    }
    return std::nullopt;
}

StateSet extract_states(const std::vector<RawProperty>& properties, bool ignored) {
    StateSet states;
    for (const auto& prop : properties) {
        if (prop.name == "expanded" && is_false(prop.value)) {
            states.insert(CanonicalState::Collapsed);
            continue;
        }
        if (!is_true(prop.value)) continue;
        if (auto state = flag_state(prop.name)) {
            states.insert(*state);
        }
    }
    if (ignored) {
        states.insert(CanonicalState::Hidden);
    }
    return states;
}

} // namespace axground::ax
