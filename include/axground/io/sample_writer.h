#pragma once
#include <axground/ax/tree_builder.h>
#include <axground/pipeline/pipeline.h>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace axground::io {

// { image_filename, image_width, image_height, sample_count,
//   test_samples: [ { id, category, name, bbox: [x1,y1,x2,y2], point: [x,y] } ] }
nlohmann::ordered_json samples_to_json(const pipeline::SampleSet& set);
std::string write_samples(const pipeline::SampleSet& set, int indent = 2);

// { timestamp, screen: { width, height }, root: { id, role, name, bounds,
//   states?, children? } }
nlohmann::ordered_json ui_tree_to_json(const ax::CanonicalNode& root, int screen_width,
                                       int screen_height, const std::string& timestamp);
std::string write_ui_tree(const ax::CanonicalNode& root, int screen_width, int screen_height,
                          const std::string& timestamp, int indent = 2);

// Current UTC time as ISO-8601 with a trailing 'Z'.
std::string utc_timestamp();

// Writes `contents` (plus a trailing newline) to `path`; throws
// std::runtime_error when the file cannot be written.
void write_text_file(const std::filesystem::path& path, const std::string& contents);

} // namespace axground::io
