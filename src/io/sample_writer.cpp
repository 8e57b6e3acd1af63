#include <axground/io/sample_writer.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace axground::io {

using nlohmann::ordered_json;

namespace {

ordered_json node_to_json(const ax::CanonicalNode& node) {
    ordered_json j;
    j["id"] = ax::node_label(node.id);
    j["role"] = ax::role_name(node.role);
    j["name"] = node.name;
    j["bounds"] = {
        {"x", node.bounds.x},
        {"y", node.bounds.y},
        {"width", node.bounds.width},
        {"height", node.bounds.height},
    };
    if (!node.states.empty()) {
        ordered_json states = ordered_json::array();
        for (auto s : node.states) states.push_back(ax::state_name(s));
        j["states"] = std::move(states);
    }
    if (!node.children.empty()) {
        ordered_json children = ordered_json::array();
        for (const auto& child : node.children) children.push_back(node_to_json(*child));
        j["children"] = std::move(children);
    }
    return j;
}

} // anonymous namespace

ordered_json samples_to_json(const pipeline::SampleSet& set) {
    ordered_json samples = ordered_json::array();
    for (const auto& s : set.samples) {
        ordered_json j;
        j["id"] = ax::node_label(s.id);
        j["category"] = ax::role_name(s.category);
        j["name"] = s.name;
        j["bbox"] = {s.bbox.x1, s.bbox.y1, s.bbox.x2, s.bbox.y2};
        j["point"] = {s.point.x, s.point.y};
        samples.push_back(std::move(j));
    }

    ordered_json doc;
    doc["image_filename"] = set.image_filename;
    doc["image_width"] = set.image_width;
    doc["image_height"] = set.image_height;
    doc["sample_count"] = set.samples.size();
    doc["test_samples"] = std::move(samples);
    return doc;
}

std::string write_samples(const pipeline::SampleSet& set, int indent) {
    return samples_to_json(set).dump(indent);
}

ordered_json ui_tree_to_json(const ax::CanonicalNode& root, int screen_width,
                             int screen_height, const std::string& timestamp) {
    ordered_json doc;
    doc["timestamp"] = timestamp;
    doc["screen"] = {{"width", screen_width}, {"height", screen_height}};
    doc["root"] = node_to_json(root);
    return doc;
}

std::string write_ui_tree(const ax::CanonicalNode& root, int screen_width, int screen_height,
                          const std::string& timestamp, int indent) {
    return ui_tree_to_json(root, screen_width, screen_height, timestamp).dump(indent);
}

std::string utc_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void write_text_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open " + path.string() + " for writing");
    }
    out << contents << "\n";
    if (!out) {
        throw std::runtime_error("error writing " + path.string());
    }
}

} // namespace axground::io
