#include <axground/io/snapshot_reader.h>
#include <axground/core/config.h>
#include <axground/core/diagnostics.h>
#include <axground/core/error.h>

#include <nlohmann/json.hpp>
#include <zlib.h>

#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>

namespace axground::io {

using nlohmann::json;

namespace {

constexpr const char kModule[] = "snapshot_reader";

// ============================================================================
// Field helpers
// ============================================================================

int clamp_to_int(double d) {
    if (std::isnan(d)) return 0;
    constexpr double kMax = static_cast<double>(std::numeric_limits<int>::max());
    constexpr double kMin = static_cast<double>(std::numeric_limits<int>::min());
    if (d > kMax) d = kMax;
    if (d < kMin) d = kMin;
    return static_cast<int>(d);  // truncates toward zero
}

int to_pixel(const json& value, const char* field) {
    if (!value.is_number()) {
        throw ContractViolation(std::string("bounds field '") + field + "' is not a number");
    }
    return clamp_to_int(value.get<double>());
}

std::optional<geometry::Bounds> read_bounds(const json& node) {
    auto it = node.find("bounds");
    if (it == node.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_object()) {
        throw ContractViolation("bounds is not an object");
    }
    geometry::Bounds b;
    const json& obj = *it;
    if (auto f = obj.find("x"); f != obj.end()) b.x = to_pixel(*f, "x");
    if (auto f = obj.find("y"); f != obj.end()) b.y = to_pixel(*f, "y");
    if (auto f = obj.find("width"); f != obj.end()) b.width = to_pixel(*f, "width");
    if (auto f = obj.find("height"); f != obj.end()) b.height = to_pixel(*f, "height");
    return b;
}

// CDP wraps most values as AXValue objects {type, value}.
const json& unwrap_ax_value(const json& value) {
    if (value.is_object()) {
        auto it = value.find("value");
        if (it != value.end()) return *it;
        static const json kNull;
        return kNull;
    }
    return value;
}

std::optional<std::string> read_text(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end()) return std::nullopt;
    const json& v = unwrap_ax_value(*it);
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number()) return v.dump();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return std::nullopt;
}

std::string read_identifier(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return {};
}

bool read_flag(const json& node, const char* key) {
    auto it = node.find(key);
    return it != node.end() && it->is_boolean() && it->get<bool>();
}

ax::PropertyValue to_property_value(const json& value) {
    const json& v = unwrap_ax_value(value);
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return v.get<std::string>();
    return std::monostate{};
}

const json& require_array(const json& parent, const char* key) {
    static const json kEmpty = json::array();
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return kEmpty;
    if (!it->is_array()) {
        throw ContractViolation(std::string("'") + key + "' is not an array");
    }
    return *it;
}

int read_dimension(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return 0;
    return clamp_to_int(it->get<double>());
}

// ============================================================================
// CDP layout nodes
// ============================================================================

ax::RawNode read_cdp_node(const json& node) {
    ax::RawNode raw;
    if (auto it = node.find("nodeId"); it != node.end()) {
        raw.node_id = read_identifier(*it);
    }
    for (const auto& child : require_array(node, "childIds")) {
        std::string id = read_identifier(child);
        if (!id.empty()) raw.child_ids.push_back(std::move(id));
    }
    raw.role = read_text(node, "role");
    raw.name = read_text(node, "name");
    raw.bounds = read_bounds(node);
    raw.ignored = read_flag(node, "ignored");
    for (const auto& prop : require_array(node, "properties")) {
        if (!prop.is_object()) continue;
        auto name = prop.find("name");
        if (name == prop.end() || !name->is_string()) continue;
        ax::RawProperty p;
        p.name = name->get<std::string>();
        if (auto value = prop.find("value"); value != prop.end()) {
            p.value = to_property_value(*value);
        }
        raw.properties.push_back(std::move(p));
    }
    return raw;
}

// ============================================================================
// Nested ui_tree nodes
// ============================================================================

// Flattens `node` and its subtree in pre-order; returns the id given to `node`.
std::string flatten_ui_node(const json& node, std::vector<ax::RawNode>& out) {
    if (!node.is_object()) {
        throw ContractViolation("ui_tree node is not an object");
    }
    const std::size_t slot = out.size();
    std::string id = "n" + std::to_string(slot);
    out.emplace_back();
    {
        ax::RawNode& raw = out[slot];
        raw.node_id = id;
        raw.role = read_text(node, "role");
        raw.name = read_text(node, "name");
        raw.bounds = read_bounds(node);
        raw.ignored = read_flag(node, "ignored");
        for (const auto& state : require_array(node, "states")) {
            if (state.is_string()) {
                raw.properties.push_back({state.get<std::string>(), true});
            }
        }
    }
    std::vector<std::string> child_ids;
    for (const auto& child : require_array(node, "children")) {
        child_ids.push_back(flatten_ui_node(child, out));
    }
    // `out` may have reallocated while recursing.
    out[slot].child_ids = std::move(child_ids);
    return id;
}

} // anonymous namespace

// ============================================================================
// SnapshotReader
// ============================================================================

ax::Snapshot SnapshotReader::parse(std::string_view text) const {
    json document;
    try {
        document = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        throw SnapshotReadError(std::string("invalid JSON: ") + e.what());
    }
    return from_json(document);
}

ax::Snapshot SnapshotReader::from_json(const json& document) const {
    if (!document.is_object()) {
        throw SnapshotReadError("snapshot document is not a JSON object");
    }

    if (auto tabs = document.find("tabs"); tabs != document.end()) {
        if (!tabs->is_array()) {
            throw ContractViolation("'tabs' is not an array");
        }
        if (tabs->empty()) {
            ax::Snapshot snapshot;
            apply_default_screen(snapshot);
            return snapshot;
        }
        const json& tab = tabs->front();
        if (!tab.is_object()) {
            throw ContractViolation("tab entry is not an object");
        }
        auto layout = tab.find("layout");
        if (layout == tab.end() || !layout->is_object()) {
            ax::Snapshot snapshot;
            apply_default_screen(snapshot);
            return snapshot;
        }
        return from_layout(*layout);
    }
    if (document.contains("nodes")) {
        return from_layout(document);
    }
    if (document.contains("root")) {
        return from_ui_tree(document);
    }
    throw SnapshotReadError("unrecognized snapshot document: expected 'tabs', 'nodes' or 'root'");
}

ax::Snapshot SnapshotReader::from_layout(const json& layout) const {
    ax::Snapshot snapshot;
    for (const auto& node : require_array(layout, "nodes")) {
        if (!node.is_object()) {
            throw ContractViolation("layout node is not an object");
        }
        snapshot.nodes.push_back(read_cdp_node(node));
    }

    if (auto viewport = layout.find("viewport");
        viewport != layout.end() && viewport->is_object()) {
        if (auto visual = viewport->find("visualViewport");
            visual != viewport->end() && visual->is_object()) {
            snapshot.screen_width = read_dimension(*visual, "width");
            snapshot.screen_height = read_dimension(*visual, "height");
        }
    }
    apply_default_screen(snapshot);
    return snapshot;
}

ax::Snapshot SnapshotReader::from_ui_tree(const json& document) const {
    ax::Snapshot snapshot;
    if (auto screen = document.find("screen"); screen != document.end() && screen->is_object()) {
        snapshot.screen_width = read_dimension(*screen, "width");
        snapshot.screen_height = read_dimension(*screen, "height");
    }
    const json& root = document.at("root");
    if (!root.is_null()) {
        flatten_ui_node(root, snapshot.nodes);
    }
    apply_default_screen(snapshot);
    return snapshot;
}

void SnapshotReader::apply_default_screen(ax::Snapshot& snapshot) const {
    if (snapshot.screen_width > 0 && snapshot.screen_height > 0) {
        return;
    }
    snapshot.screen_width = core::config::kDefaultScreenWidth;
    snapshot.screen_height = core::config::kDefaultScreenHeight;
    if (diagnostics_) {
        diagnostics_->warn(kModule, "viewport",
                           "no usable viewport; assuming " +
                           std::to_string(snapshot.screen_width) + "x" +
                           std::to_string(snapshot.screen_height));
    }
}

ax::Snapshot SnapshotReader::read_file(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw SnapshotReadError("cannot open " + path.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw SnapshotReadError("error reading " + path.string());
    }

    if (is_gzip(bytes)) {
        bytes = inflate_gzip(bytes);
    }
    std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    try {
        return parse(text);
    } catch (const SnapshotReadError& e) {
        throw SnapshotReadError(path.string() + ": " + e.what());
    }
}

// ============================================================================
// gzip
// ============================================================================

bool is_gzip(const std::vector<uint8_t>& data) {
    return data.size() >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}

std::vector<uint8_t> inflate_gzip(const std::vector<uint8_t>& compressed) {
    z_stream strm{};
    // 15 + 32 enables automatic gzip / zlib header detection
    if (inflateInit2(&strm, 15 + 32) != Z_OK) {
        throw SnapshotReadError("zlib initialization failed");
    }

    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_in = const_cast<Bytef*>(compressed.data());

    std::vector<uint8_t> output;
    output.reserve(compressed.size() * 4);

    uint8_t buffer[32768];
    int ret;
    do {
        strm.avail_out = sizeof(buffer);
        strm.next_out = buffer;
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR ||
            ret == Z_MEM_ERROR || ret == Z_NEED_DICT || ret == Z_BUF_ERROR) {
            // Z_BUF_ERROR here means the input ended before the stream did.
            inflateEnd(&strm);
            throw SnapshotReadError("corrupt or truncated gzip stream");
        }
        size_t have = sizeof(buffer) - strm.avail_out;
        output.insert(output.end(), buffer, buffer + have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return output;
}

} // namespace axground::io
