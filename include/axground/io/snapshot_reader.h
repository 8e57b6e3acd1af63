#pragma once
#include <axground/ax/raw_node.h>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace axground::core {
class DiagnosticEmitter;
}

namespace axground::io {

// Reads accessibility snapshots in any of the collector's shapes:
//
//   { "tabs": [ { "layout": { "nodes": [...], "viewport": {...} } } ] }
//   { "nodes": [...], "viewport": { "visualViewport": { "width", "height" } } }
//   { "screen": { "width", "height" }, "root": { ..., "children": [...] } }
//
// The nested ui_tree form is flattened into RawNodes so that it goes through
// the same tree building (and ignored-node splicing) as the flat form.
//
// Malformed-but-typed data degrades (missing bounds, unknown fields); values
// of the wrong JSON type where an object/array/number is required throw
// ContractViolation. Unreadable input throws SnapshotReadError.
class SnapshotReader {
public:
    void set_diagnostics(core::DiagnosticEmitter* emitter) { diagnostics_ = emitter; }

    ax::Snapshot parse(std::string_view text) const;
    ax::Snapshot from_json(const nlohmann::json& document) const;

    // Plain or gzip-compressed JSON file.
    ax::Snapshot read_file(const std::filesystem::path& path) const;

private:
    ax::Snapshot from_layout(const nlohmann::json& layout) const;
    ax::Snapshot from_ui_tree(const nlohmann::json& document) const;
    void apply_default_screen(ax::Snapshot& snapshot) const;

    core::DiagnosticEmitter* diagnostics_ = nullptr;
};

bool is_gzip(const std::vector<uint8_t>& data);

// Inflates a gzip or zlib stream; throws SnapshotReadError on corrupt input.
std::vector<uint8_t> inflate_gzip(const std::vector<uint8_t>& compressed);

} // namespace axground::io
