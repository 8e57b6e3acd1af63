#pragma once
#include <axground/ax/role.h>
#include <axground/core/diagnostics.h>
#include <axground/pipeline/pipeline.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace axground::batch {

// One dataset directory holding ui_tree.json and screenshot_cropped.png.
struct DatasetJob {
    std::filesystem::path dir;
    std::string name;
    // Recorded in filtered.json: "<dataset root>/<name>/screenshot_cropped.png".
    std::string image_filename;
};

struct SkippedDataset {
    std::string name;
    std::string reason;
};

// Subdirectories of a dataset root, sorted by name. Directories missing one of
// the input files are listed as skipped instead of becoming jobs.
struct BatchPlan {
    std::vector<DatasetJob> jobs;
    std::vector<SkippedDataset> skipped;
};

// Throws std::runtime_error when `root` is not a readable directory.
BatchPlan plan_batch(const std::filesystem::path& root);

struct DatasetOutcome {
    std::string name;
    std::uint64_t correlation_id = 0;
    bool ok = false;
    std::size_t sample_count = 0;
    std::vector<core::DiagnosticEvent> events;
    ax::UnmappedRoleTally unmapped_roles;
};

struct BatchSummary {
    // Same order as the jobs, whatever order the workers finished in.
    std::vector<DatasetOutcome> outcomes;
    ax::UnmappedRoleTally unmapped_roles;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
};

// Runs dataset jobs on a fixed number of worker threads. Every job gets its
// own emitter (correlation id = job position + 1) and role tally; failures
// are recorded as error events in the job's outcome and never stop the batch.
class BatchRunner {
public:
    explicit BatchRunner(pipeline::PipelineConfig config, std::size_t workers = default_workers());

    void set_min_severity(core::Severity min) { min_severity_ = min; }

    // Reads ui_tree.json, extracts samples and writes filtered.json.
    DatasetOutcome run_one(const DatasetJob& job, std::uint64_t correlation_id) const;

    BatchSummary run(const std::vector<DatasetJob>& jobs) const;

    std::size_t workers() const { return workers_; }

    // hardware_concurrency(), or 1 when the platform cannot tell.
    static std::size_t default_workers();

private:
    pipeline::PipelineConfig config_;
    std::size_t workers_;
    core::Severity min_severity_ = core::Severity::Warning;
};

} // namespace axground::batch
