#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace axground::ax {

enum class CanonicalRole : uint8_t {
    Unknown,
    Desktop, Window, Dialog, Panel, Toolbar, MenuBar, Menu, MenuItem,
    Button, CheckBox, RadioButton, TextField, TextArea, ComboBox,
    ListBox, ListItem, Tab, TabPanel, TreeView, TreeItem, Table, TableCell,
    ScrollBar, Slider, ProgressBar, Label, Link, Image, Icon, Separator,
    Tooltip, StatusBar, Taskbar
};

// Lowercase canonical name ("button", "textfield", ...); "unknown" for the sentinel.
const char* role_name(CanonicalRole role);

// Inverse of role_name(); only exact canonical names are accepted.
std::optional<CanonicalRole> role_from_name(std::string_view name);

// Counts raw role strings that could not be mapped. Owned by one run and
// passed down explicitly; only read for reporting.
class UnmappedRoleTally {
public:
    void record(std::string_view raw_role);

    std::size_t count(const std::string& raw_role) const;
    std::size_t total() const { return total_; }
    bool empty() const { return counts_.empty(); }

    // Most frequent first; ties ordered by role string.
    std::vector<std::pair<std::string, std::size_t>> most_common(std::size_t limit) const;

    void merge(const UnmappedRoleTally& other);

private:
    std::map<std::string, std::size_t> counts_;
    std::size_t total_ = 0;
};

// Maps a vendor role string to the canonical vocabulary. Lookup order:
// exact table entry, case-insensitive table entry, an already-canonical
// name, then Unknown (recorded in `tally` when given). Never throws.
CanonicalRole normalize_role(std::optional<std::string_view> raw_role,
                             UnmappedRoleTally* tally = nullptr);

} // namespace axground::ax
