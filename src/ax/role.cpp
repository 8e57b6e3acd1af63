#include <axground/ax/role.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>

namespace axground::ax {

// ============================================================================
// Tables
// ============================================================================

namespace {

struct RoleNameEntry {
    CanonicalRole role;
    const char* name;
};

constexpr std::array<RoleNameEntry, 34> kRoleNames = {{
    {CanonicalRole::Unknown, "unknown"},
    {CanonicalRole::Desktop, "desktop"},
    {CanonicalRole::Window, "window"},
    {CanonicalRole::Dialog, "dialog"},
    {CanonicalRole::Panel, "panel"},
    {CanonicalRole::Toolbar, "toolbar"},
    {CanonicalRole::MenuBar, "menubar"},
    {CanonicalRole::Menu, "menu"},
    {CanonicalRole::MenuItem, "menuitem"},
    {CanonicalRole::Button, "button"},
    {CanonicalRole::CheckBox, "checkbox"},
    {CanonicalRole::RadioButton, "radiobutton"},
    {CanonicalRole::TextField, "textfield"},
    {CanonicalRole::TextArea, "textarea"},
    {CanonicalRole::ComboBox, "combobox"},
    {CanonicalRole::ListBox, "listbox"},
    {CanonicalRole::ListItem, "listitem"},
    {CanonicalRole::Tab, "tab"},
    {CanonicalRole::TabPanel, "tabpanel"},
    {CanonicalRole::TreeView, "treeview"},
    {CanonicalRole::TreeItem, "treeitem"},
    {CanonicalRole::Table, "table"},
    {CanonicalRole::TableCell, "tablecell"},
    {CanonicalRole::ScrollBar, "scrollbar"},
    {CanonicalRole::Slider, "slider"},
    {CanonicalRole::ProgressBar, "progressbar"},
    {CanonicalRole::Label, "label"},
    {CanonicalRole::Link, "link"},
    {CanonicalRole::Image, "image"},
    {CanonicalRole::Icon, "icon"},
    {CanonicalRole::Separator, "separator"},
    {CanonicalRole::Tooltip, "tooltip"},
    {CanonicalRole::StatusBar, "statusbar"},
    {CanonicalRole::Taskbar, "taskbar"},
}};

using R = CanonicalRole;

// Chrome reports roles in several spellings (PascalCase internal names,
// camelCase and lowercase ARIA names); each spelling seen in practice is
// listed.
struct VendorRoleEntry {
    const char* vendor;
    CanonicalRole role;
};

constexpr VendorRoleEntry kVendorRoles[] = {
    // Generic containers
    {"generic", R::Panel}, {"none", R::Panel}, {"presentation", R::Panel},
    {"group", R::Panel}, {"GenericContainer", R::Panel}, {"Group", R::Panel},

    // Document structure
    {"RootWebArea", R::Window}, {"rootWebArea", R::Window},
    {"WebArea", R::Panel}, {"webArea", R::Panel},
    {"Document", R::Panel}, {"document", R::Panel},
    {"Article", R::Panel}, {"article", R::Panel},
    {"Section", R::Panel}, {"section", R::Panel},
    {"Region", R::Panel}, {"region", R::Panel},
    {"Main", R::Panel}, {"main", R::Panel},
    {"Header", R::Panel}, {"header", R::Panel},
    {"Footer", R::Panel}, {"footer", R::Panel},
    {"Navigation", R::Panel}, {"navigation", R::Panel},
    {"Complementary", R::Panel}, {"complementary", R::Panel},
    {"Banner", R::Panel}, {"banner", R::Panel},
    {"ContentInfo", R::Panel}, {"contentinfo", R::Panel},
    {"Form", R::Panel}, {"form", R::Panel},
    {"Search", R::Panel}, {"search", R::Panel},
    {"Blockquote", R::Panel}, {"blockquote", R::Panel},
    {"Figure", R::Panel}, {"figure", R::Panel},
    {"FigureCaption", R::Label}, {"figcaption", R::Label},

    // Interactive
    {"button", R::Button}, {"Button", R::Button},
    {"link", R::Link}, {"Link", R::Link},
    {"TextField", R::TextField}, {"textField", R::TextField},
    {"textbox", R::TextField}, {"TextBox", R::TextField},
    {"SearchBox", R::TextField}, {"searchbox", R::TextField},
    {"SpinButton", R::TextField}, {"spinbutton", R::TextField},
    {"TextArea", R::TextArea}, {"textarea", R::TextArea},
    {"ComboBox", R::ComboBox}, {"combobox", R::ComboBox},
    {"ComboBoxGrouping", R::ComboBox}, {"ComboBoxMenuButton", R::ComboBox},
    {"ListBox", R::ListBox}, {"listbox", R::ListBox},
    {"ListBoxOption", R::ListItem}, {"option", R::ListItem},
    {"CheckBox", R::CheckBox}, {"checkbox", R::CheckBox},
    {"RadioButton", R::RadioButton}, {"radio", R::RadioButton},
    {"Switch", R::CheckBox}, {"switch", R::CheckBox},
    {"Slider", R::Slider}, {"slider", R::Slider},
    {"ScrollBar", R::ScrollBar}, {"scrollbar", R::ScrollBar},
    {"ProgressIndicator", R::ProgressBar}, {"progressbar", R::ProgressBar},
    {"Meter", R::ProgressBar}, {"meter", R::ProgressBar},

    // Menus
    {"Menu", R::Menu}, {"menu", R::Menu},
    {"MenuBar", R::MenuBar}, {"menubar", R::MenuBar},
    {"MenuItem", R::MenuItem}, {"menuitem", R::MenuItem},
    {"MenuItemCheckBox", R::MenuItem}, {"menuitemcheckbox", R::MenuItem},
    {"MenuItemRadio", R::MenuItem}, {"menuitemradio", R::MenuItem},
    {"MenuButton", R::Button}, {"MenuListPopup", R::Menu},

    // Lists
    {"List", R::ListBox}, {"list", R::ListBox},
    {"ListItem", R::ListItem}, {"listitem", R::ListItem},
    {"DescriptionList", R::ListBox},
    {"DescriptionListTerm", R::ListItem}, {"DescriptionListDetail", R::ListItem},
    {"term", R::ListItem}, {"definition", R::ListItem},

    // Tables
    {"Table", R::Table}, {"table", R::Table},
    {"Grid", R::Table}, {"grid", R::Table},
    {"TreeGrid", R::Table}, {"treegrid", R::Table},
    {"Row", R::ListItem}, {"row", R::ListItem},
    {"RowGroup", R::Panel}, {"rowgroup", R::Panel},
    {"Cell", R::TableCell}, {"cell", R::TableCell},
    {"GridCell", R::TableCell}, {"gridcell", R::TableCell},
    {"ColumnHeader", R::TableCell}, {"columnheader", R::TableCell},
    {"RowHeader", R::TableCell}, {"rowheader", R::TableCell},

    // Trees
    {"Tree", R::TreeView}, {"tree", R::TreeView},
    {"TreeItem", R::TreeItem}, {"treeitem", R::TreeItem},

    // Tabs
    {"TabList", R::Panel}, {"tablist", R::Panel},
    {"Tab", R::Tab}, {"tab", R::Tab},
    {"TabPanel", R::TabPanel}, {"tabpanel", R::TabPanel},

    // Dialogs
    {"Dialog", R::Dialog}, {"dialog", R::Dialog},
    {"AlertDialog", R::Dialog}, {"alertdialog", R::Dialog},
    {"Alert", R::Dialog}, {"alert", R::Dialog},

    // Text
    {"StaticText", R::Label}, {"staticText", R::Label},
    {"InlineTextBox", R::Label}, {"inlineTextBox", R::Label},
    {"Heading", R::Label}, {"heading", R::Label},
    {"Paragraph", R::Label}, {"paragraph", R::Label},
    {"LabelText", R::Label}, {"labelText", R::Label},
    {"Legend", R::Label}, {"legend", R::Label},
    {"Caption", R::Label}, {"caption", R::Label},
    {"text", R::Label},

    // Media
    {"Image", R::Image}, {"image", R::Image},
    {"Img", R::Image}, {"img", R::Image},
    {"Video", R::Panel}, {"video", R::Panel},
    {"Audio", R::Panel}, {"audio", R::Panel},
    {"Canvas", R::Image}, {"canvas", R::Image},
    {"SVGRoot", R::Image}, {"svgRoot", R::Image},
    {"graphics-document", R::Image}, {"graphics-object", R::Image},
    {"graphics-symbol", R::Image},

    // Everything else
    {"Toolbar", R::Toolbar}, {"toolbar", R::Toolbar},
    {"Status", R::StatusBar}, {"status", R::StatusBar},
    {"Tooltip", R::Tooltip}, {"tooltip", R::Tooltip},
    {"Separator", R::Separator}, {"separator", R::Separator},
    {"Splitter", R::Separator}, {"splitter", R::Separator},
    {"Application", R::Panel}, {"application", R::Panel},
    {"Iframe", R::Panel}, {"iframe", R::Panel},
    {"IframePresentational", R::Panel}, {"EmbeddedObject", R::Panel},
    {"PluginObject", R::Panel}, {"Presentation", R::Panel},
    {"Math", R::Panel}, {"Note", R::Panel}, {"Log", R::Panel},
    {"Marquee", R::Panel}, {"Timer", R::Label}, {"Definition", R::Label},
    {"Term", R::Label}, {"Time", R::Label}, {"Abbr", R::Label},
    {"Code", R::Label}, {"Pre", R::Panel}, {"Emphasis", R::Label},
    {"Strong", R::Label}, {"Subscript", R::Label}, {"Superscript", R::Label},
    {"Insertion", R::Label}, {"Deletion", R::Label}, {"Mark", R::Label},
    {"LineBreak", R::Separator}, {"WordBreak", R::Separator},
    {"Ruby", R::Label}, {"RubyAnnotation", R::Label},
};

std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_lower_ascii(std::string_view s) {
    return std::none_of(s.begin(), s.end(),
                        [](unsigned char c) { return std::isupper(c) != 0; });
}

const std::unordered_map<std::string_view, CanonicalRole>& exact_table() {
    static const std::unordered_map<std::string_view, CanonicalRole> table = [] {
        std::unordered_map<std::string_view, CanonicalRole> t;
        for (const auto& e : kVendorRoles) {
            t.emplace(e.vendor, e.role);
        }
        return t;
    }();
    return table;
}

// Keys folded to lowercase. Where two spellings fold to the same key
// ("Term" and "term"), the lowercase spelling wins.
const std::unordered_map<std::string, CanonicalRole>& folded_table() {
    static const std::unordered_map<std::string, CanonicalRole> table = [] {
        std::unordered_map<std::string, CanonicalRole> t;
        for (const auto& e : kVendorRoles) {
            if (is_lower_ascii(e.vendor)) t.emplace(e.vendor, e.role);
        }
        for (const auto& e : kVendorRoles) {
            t.emplace(to_lower_ascii(e.vendor), e.role);
        }
        return t;
    }();
    return table;
}

} // anonymous namespace

// ============================================================================
// Canonical names
// ============================================================================

const char* role_name(CanonicalRole role) {
    for (const auto& e : kRoleNames) {
        if (e.role == role) return e.name;
    }
    return "unknown";
}

std::optional<CanonicalRole> role_from_name(std::string_view name) {
    for (const auto& e : kRoleNames) {
        if (name == e.name) return e.role;
    }
    return std::nullopt;
}

// ============================================================================
// UnmappedRoleTally
// ============================================================================

void UnmappedRoleTally::record(std::string_view raw_role) {
    ++counts_[std::string(raw_role)];
    ++total_;
}

std::size_t UnmappedRoleTally::count(const std::string& raw_role) const {
    auto it = counts_.find(raw_role);
    return it == counts_.end() ? 0 : it->second;
}

std::vector<std::pair<std::string, std::size_t>>
UnmappedRoleTally::most_common(std::size_t limit) const {
    std::vector<std::pair<std::string, std::size_t>> entries(counts_.begin(), counts_.end());
    // counts_ is ordered by name, so a stable sort keeps ties alphabetical.
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (entries.size() > limit) entries.resize(limit);
    return entries;
}

void UnmappedRoleTally::merge(const UnmappedRoleTally& other) {
    for (const auto& [role, n] : other.counts_) {
        counts_[role] += n;
    }
    total_ += other.total_;
}

// ============================================================================
// normalize_role
// ============================================================================

CanonicalRole normalize_role(std::optional<std::string_view> raw_role,
                             UnmappedRoleTally* tally) {
    if (!raw_role || raw_role->empty()) {
        return CanonicalRole::Unknown;
    }

    const auto& exact = exact_table();
    if (auto it = exact.find(*raw_role); it != exact.end()) {
        return it->second;
    }

    const std::string lowered = to_lower_ascii(*raw_role);
    const auto& folded = folded_table();
    if (auto it = folded.find(lowered); it != folded.end()) {
        return it->second;
    }

    if (auto canonical = role_from_name(lowered)) {
        return *canonical;
    }

    if (tally) {
        tally->record(*raw_role);
    }
    return CanonicalRole::Unknown;
}

} // namespace axground::ax
