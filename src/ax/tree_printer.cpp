#include <axground/ax/tree_printer.h>

#include <sstream>
#include <vector>

namespace axground::ax {

namespace {

std::string escape_name(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (char c : name) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    out += '"';
    return out;
}

} // anonymous namespace

std::string TreePrinter::print(const CanonicalNode& root) const {
    return print_node(root, 0).value_or("");
}

std::string TreePrinter::print_document(const CanonicalNode& root,
                                        int screen_width, int screen_height) const {
    std::ostringstream oss;
    if (!options_.compact) {
        oss << ";; UI Tree\n";
        oss << ";; screen: " << screen_width << "x" << screen_height << "\n\n";
    }
    oss << print(root);
    return oss.str();
}

std::optional<std::string> TreePrinter::print_node(const CanonicalNode& node, int depth) const {
    if (options_.max_depth && depth > *options_.max_depth) {
        return std::nullopt;
    }
    if (options_.min_size && node.bounds.width < *options_.min_size &&
        node.bounds.height < *options_.min_size) {
        return std::nullopt;
    }
    if (options_.skip_empty && node.name.empty() && node.children.empty()) {
        return std::nullopt;
    }

    std::ostringstream head;
    head << "(" << role_name(node.role);
    if (!node.name.empty()) {
        head << " " << escape_name(node.name);
    }
    if (options_.include_bounds) {
        head << " [" << node.bounds.x << "," << node.bounds.y << " "
             << node.bounds.width << "x" << node.bounds.height << "]";
    }
    if (options_.include_states) {
        for (auto state : node.states) {
            head << " :" << state_name(state);
        }
    }

    std::vector<std::string> children;
    for (const auto& child : node.children) {
        if (auto text = print_node(*child, depth + 1)) {
            children.push_back(std::move(*text));
        }
    }

    std::string out = head.str();
    if (options_.compact) {
        for (const auto& c : children) out += c;
        out += ")";
        return out;
    }

    // Children are rendered relative to their own depth; shift every line
    // of each child by one indent level.
    for (const auto& c : children) {
        out += "\n  ";
        for (char ch : c) {
            out += ch;
            if (ch == '\n') out += "  ";
        }
    }
    out += ")";
    return out;
}

} // namespace axground::ax
