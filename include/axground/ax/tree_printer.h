#pragma once
#include <axground/ax/tree_builder.h>
#include <optional>
#include <string>

namespace axground::ax {

struct TreePrintOptions {
    bool compact = false;       // single line, no indentation
    bool include_bounds = true;
    bool include_states = true;
    bool skip_empty = false;    // drop unnamed leaves
    std::optional<int> max_depth;
    std::optional<int> min_size;  // drop nodes narrower AND shorter than this
};

// Renders a canonical tree as an s-expression, one node per line:
//
//   (window "My App" [0,0 1920x1080]
//     (button "File" [10,5 50x30] :focused))
class TreePrinter {
public:
    explicit TreePrinter(TreePrintOptions options = {}) : options_(options) {}

    std::string print(const CanonicalNode& root) const;

    // Same, preceded by a ";;" header naming the screen size (non-compact only).
    std::string print_document(const CanonicalNode& root, int screen_width, int screen_height) const;

private:
    std::optional<std::string> print_node(const CanonicalNode& node, int depth) const;

    TreePrintOptions options_;
};

} // namespace axground::ax
