#include <axground/ax/tree_printer.h>
#include <axground/batch/batch_runner.h>
#include <axground/core/config.h>
#include <axground/core/diagnostics.h>
#include <axground/core/error.h>
#include <axground/io/sample_writer.h>
#include <axground/io/snapshot_reader.h>
#include <axground/pipeline/pipeline.h>

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char kProgramName[] = "axground";
constexpr const char kVersionString[] = "axground 0.1.0";

struct CliOptions {
    std::string input;
    std::optional<std::string> output;
    std::optional<std::string> batch_dir;
    std::string image_filename = axground::core::config::kDefaultImageFilename;
    std::optional<std::string> ui_tree_path;
    std::optional<std::string> lisp_path;
    axground::pipeline::PipelineConfig config;
    size_t jobs = axground::batch::BatchRunner::default_workers();
    bool verbose = false;
};

void print_usage(std::ostream& stream) {
    stream << "usage: " << kProgramName << " [options] <snapshot.json[.gz]> [output.json]\n"
           << "       " << kProgramName << " [options] --batch <dataset_dir>\n"
           << "options:\n"
           << "  --image=NAME      image_filename recorded in the sample document\n"
           << "  --ui-tree=PATH    also write the canonical tree as ui_tree JSON\n"
           << "  --lisp=PATH       also write the canonical tree as an s-expression\n"
           << "  --min-area=N      minimum visible area in px^2 (default "
           << axground::core::config::kMinVisibleArea << ")\n"
           << "  --coverage=R      occlusion coverage ratio in (0,1] (default "
           << axground::core::config::kOcclusionCoverageRatio << ")\n"
           << "  --prune-hidden    hidden/collapsed nodes prune their subtree\n"
           << "  --jobs=N          worker threads for --batch\n"
           << "  --verbose         print debug diagnostics\n"
           << "  -h, --help        show this help\n"
           << "  -V, --version     show version\n";
}

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_positive_int(std::string_view text, long long& value) {
    if (text.empty()) {
        return false;
    }
    long long parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
        return false;
    }
    value = parsed;
    return true;
}

bool parse_ratio(std::string_view text, double& value) {
    if (text.empty()) {
        return false;
    }
    double parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end || parsed <= 0.0 || parsed > 1.0) {
        return false;
    }
    value = parsed;
    return true;
}

// Returns false (after printing why) when the command line is unusable.
bool parse_arguments(int argc, char** argv, CliOptions& options) {
    std::vector<std::string_view> positional;
    bool expect_batch_dir = false;

    for (int index = 1; index < argc; ++index) {
        const std::string_view arg(argv[index] != nullptr ? argv[index] : "");

        if (expect_batch_dir) {
            options.batch_dir = std::string(arg);
            expect_batch_dir = false;
            continue;
        }
        if (arg == "--batch") {
            expect_batch_dir = true;
        } else if (starts_with(arg, "--image=")) {
            options.image_filename = std::string(arg.substr(8));
        } else if (starts_with(arg, "--ui-tree=")) {
            options.ui_tree_path = std::string(arg.substr(10));
        } else if (starts_with(arg, "--lisp=")) {
            options.lisp_path = std::string(arg.substr(7));
        } else if (starts_with(arg, "--min-area=")) {
            long long area = 0;
            if (!parse_positive_int(arg.substr(11), area)) {
                std::cerr << "Invalid --min-area: '" << arg << "' (expected a positive integer)\n";
                return false;
            }
            options.config.set_min_visible_area(area);
        } else if (starts_with(arg, "--coverage=")) {
            double ratio = 0;
            if (!parse_ratio(arg.substr(11), ratio)) {
                std::cerr << "Invalid --coverage: '" << arg << "' (expected a number in (0,1])\n";
                return false;
            }
            options.config.occlusion.coverage_ratio = ratio;
        } else if (arg == "--prune-hidden") {
            options.config.walk.policy =
                axground::visibility::SubtreePolicy::PruneHiddenOrCollapsed;
        } else if (starts_with(arg, "--jobs=")) {
            long long jobs = 0;
            if (!parse_positive_int(arg.substr(7), jobs)) {
                std::cerr << "Invalid --jobs: '" << arg << "' (expected a positive integer)\n";
                return false;
            }
            options.jobs = static_cast<size_t>(jobs);
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (starts_with(arg, "--")) {
            std::cerr << "Unknown option '" << arg << "'\n";
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (expect_batch_dir) {
        std::cerr << "--batch requires a dataset directory\n";
        return false;
    }
    if (options.batch_dir) {
        if (!positional.empty()) {
            std::cerr << "--batch takes no snapshot arguments\n";
            return false;
        }
        return true;
    }
    if (positional.empty() || positional.size() > 2) {
        return false;
    }
    options.input = std::string(positional[0]);
    if (positional.size() == 2) {
        options.output = std::string(positional[1]);
    }
    return true;
}

void report_unmapped_roles(const axground::ax::UnmappedRoleTally& tally) {
    if (tally.empty()) {
        return;
    }
    std::cerr << "Warning: " << tally.total() << " nodes with unmapped roles:\n";
    for (const auto& [role, count] :
         tally.most_common(axground::core::config::kUnmappedRoleReportLimit)) {
        std::cerr << "  " << role << ": " << count << "\n";
    }
}

void write_tree_dumps(const CliOptions& options, const axground::pipeline::PipelineResult& result,
                      const axground::ax::Snapshot& snapshot) {
    if (!result.tree) {
        if (options.ui_tree_path || options.lisp_path) {
            std::cerr << "Warning: empty snapshot, no tree written\n";
        }
        return;
    }
    if (options.ui_tree_path) {
        axground::io::write_text_file(
            *options.ui_tree_path,
            axground::io::write_ui_tree(*result.tree, snapshot.screen_width,
                                        snapshot.screen_height, axground::io::utc_timestamp()));
    }
    if (options.lisp_path) {
        axground::ax::TreePrinter printer;
        axground::io::write_text_file(
            *options.lisp_path,
            printer.print_document(*result.tree, snapshot.screen_width, snapshot.screen_height));
    }
}

int run_single(const CliOptions& options) {
    axground::core::DiagnosticEmitter diagnostics;
    diagnostics.set_min_severity(options.verbose ? axground::core::Severity::Debug
                                                 : axground::core::Severity::Warning);
    diagnostics.add_observer(axground::core::make_stream_observer(std::cerr));

    axground::io::SnapshotReader reader;
    reader.set_diagnostics(&diagnostics);
    const axground::ax::Snapshot snapshot = reader.read_file(options.input);

    const auto result = axground::pipeline::extract_samples(snapshot, options.config, &diagnostics);
    const auto sample_set =
        axground::pipeline::make_sample_set(result, snapshot, options.image_filename);
    const std::string document = axground::io::write_samples(sample_set);

    if (options.output) {
        axground::io::write_text_file(*options.output, document);
        std::cerr << "Generated " << sample_set.samples.size() << " samples in "
                  << *options.output << "\n";
    } else {
        std::cout << document << "\n";
    }

    write_tree_dumps(options, result, snapshot);
    report_unmapped_roles(result.unmapped_roles);
    return 0;
}

// ============================================================================
// Batch mode
// ============================================================================

int run_batch(const CliOptions& options) {
    const auto plan = axground::batch::plan_batch(*options.batch_dir);
    std::cerr << "Found " << plan.jobs.size() + plan.skipped.size()
              << " datasets to process.\n";
    for (const auto& skipped : plan.skipped) {
        std::cerr << "Skipping " << skipped.name << ": " << skipped.reason << "\n";
    }

    axground::batch::BatchRunner runner(options.config, options.jobs);
    runner.set_min_severity(options.verbose ? axground::core::Severity::Debug
                                            : axground::core::Severity::Warning);
    const auto summary = runner.run(plan.jobs);

    for (const auto& outcome : summary.outcomes) {
        for (const auto& event : outcome.events) {
            std::cerr << axground::core::format_diagnostic(event) << "\n";
        }
        if (outcome.ok) {
            std::cerr << "Processed " << outcome.name << ": " << outcome.sample_count
                      << " samples\n";
        } else {
            std::cerr << "Failed " << outcome.name << "\n";
        }
    }

    const size_t failed = summary.failed + plan.skipped.size();
    report_unmapped_roles(summary.unmapped_roles);
    std::cerr << "\nProcessing complete.\n"
              << "Success: " << summary.succeeded << "\n"
              << "Failed: " << failed << "\n";
    return failed == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    if (argc == 2 && argv[1] != nullptr) {
        const std::string_view arg(argv[1]);
        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            return 0;
        }
        if (arg == "-V" || arg == "--version") {
            std::cout << kVersionString << "\n";
            return 0;
        }
    }

    CliOptions options;
    if (!parse_arguments(argc, argv, options)) {
        print_usage(std::cerr);
        return 1;
    }

    try {
        return options.batch_dir ? run_batch(options) : run_single(options);
    } catch (const axground::ContractViolation& e) {
        std::cerr << "Error: malformed snapshot structure: " << e.what() << "\n";
    } catch (const axground::SnapshotReadError& e) {
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}
