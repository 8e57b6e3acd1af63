#include <axground/batch/batch_runner.h>
#include <axground/core/config.h>
#include <axground/io/sample_writer.h>
#include <axground/io/snapshot_reader.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace axground::batch {

namespace fs = std::filesystem;

namespace {

constexpr const char kModule[] = "batch";

// Last component of the dataset root, also for "data/" and ".".
std::string dataset_root_name(const fs::path& root) {
    fs::path normal = fs::absolute(root).lexically_normal();
    if (!normal.has_filename()) {
        normal = normal.parent_path();
    }
    return normal.filename().string();
}

} // anonymous namespace

// ============================================================================
// Planning
// ============================================================================

BatchPlan plan_batch(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw std::runtime_error(root.string() + " does not exist.");
    }

    std::vector<fs::path> subdirs;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (entry.is_directory()) subdirs.push_back(entry.path());
    }
    if (ec) {
        throw std::runtime_error("cannot list " + root.string() + ": " + ec.message());
    }
    std::sort(subdirs.begin(), subdirs.end());

    const fs::path root_name = dataset_root_name(root);
    BatchPlan plan;
    for (const auto& dir : subdirs) {
        std::string name = dir.filename().string();
        if (!fs::exists(dir / core::config::kUiTreeFilename)) {
            plan.skipped.push_back({name, std::string(core::config::kUiTreeFilename) + " not found"});
            continue;
        }
        if (!fs::exists(dir / core::config::kScreenshotFilename)) {
            plan.skipped.push_back({name, std::string(core::config::kScreenshotFilename) +
                                          " not found"});
            continue;
        }
        DatasetJob job;
        job.dir = dir;
        job.image_filename = (root_name / name / core::config::kScreenshotFilename).string();
        job.name = std::move(name);
        plan.jobs.push_back(std::move(job));
    }
    return plan;
}

// ============================================================================
// BatchRunner
// ============================================================================

std::size_t BatchRunner::default_workers() {
    const unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

BatchRunner::BatchRunner(pipeline::PipelineConfig config, std::size_t workers)
    : config_(std::move(config)), workers_(workers == 0 ? 1 : workers) {}

DatasetOutcome BatchRunner::run_one(const DatasetJob& job, std::uint64_t correlation_id) const {
    DatasetOutcome outcome;
    outcome.name = job.name;
    outcome.correlation_id = correlation_id;

    core::DiagnosticEmitter diagnostics;
    diagnostics.set_correlation_id(correlation_id);
    diagnostics.set_min_severity(min_severity_);
    try {
        io::SnapshotReader reader;
        reader.set_diagnostics(&diagnostics);
        const auto snapshot = reader.read_file(job.dir / core::config::kUiTreeFilename);
        auto result = pipeline::extract_samples(snapshot, config_, &diagnostics);
        const auto sample_set = pipeline::make_sample_set(result, snapshot, job.image_filename);
        io::write_text_file(job.dir / core::config::kFilteredFilename,
                            io::write_samples(sample_set));
        outcome.sample_count = sample_set.samples.size();
        outcome.unmapped_roles = std::move(result.unmapped_roles);
    } catch (const std::exception& e) {
        diagnostics.error(kModule, "dataset", e.what());
    }
    outcome.ok = !diagnostics.has_errors();
    outcome.events = diagnostics.events();
    return outcome;
}

BatchSummary BatchRunner::run(const std::vector<DatasetJob>& jobs) const {
    BatchSummary summary;
    summary.outcomes.resize(jobs.size());

    // Workers claim job positions in order; each writes only its own slots.
    std::atomic<std::size_t> next{0};
    {
        const std::size_t count = std::min(workers_, jobs.size());
        std::vector<std::jthread> threads;
        threads.reserve(count);
        for (std::size_t t = 0; t < count; ++t) {
            threads.emplace_back([this, &jobs, &summary, &next]() {
                for (std::size_t i = next++; i < jobs.size(); i = next++) {
                    summary.outcomes[i] = run_one(jobs[i], i + 1);
                }
            });
        }
    }

    for (const auto& outcome : summary.outcomes) {
        if (outcome.ok) {
            ++summary.succeeded;
            summary.unmapped_roles.merge(outcome.unmapped_roles);
        } else {
            ++summary.failed;
        }
    }
    return summary;
}

} // namespace axground::batch
