#pragma once

#include <scenedl/scenedl_export.h>

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace scenedl {

struct SCENEDL_EXPORT BatchEntry {
	std::string url;
	std::optional<int> scene;
};

/// One locator per line, optionally "locator|scene". Blank lines and lines
/// starting with '#' are skipped. A malformed scene number fails the whole
/// list with errc::config_error.
SCENEDL_EXPORT Result<std::vector<BatchEntry>> parse_batch_list(
	std::istream &in);
SCENEDL_EXPORT Result<std::vector<BatchEntry>> read_batch_file(
	const std::filesystem::path &path);

struct SCENEDL_EXPORT BatchSummary {
	std::vector<JobResult> results;	 // input order

	[[nodiscard]] bool all_succeeded() const;
	[[nodiscard]] int count(JobStatus status) const;
};

// Runs one entry to completion. Called concurrently from the workers.
using JobRunner = std::function<JobResult(const BatchEntry &)>;

/// Fixed pool of `workers` threads drawing entries from a shared queue, so at
/// most `workers` jobs are in flight and a finished job is replaced by the
/// next queued one at once. A failing job never stops its siblings.
class SCENEDL_EXPORT BatchScheduler {
   public:
	BatchScheduler(int workers, JobRunner runner);

	BatchSummary run(const std::vector<BatchEntry> &entries);

   private:
	int m_workers;
	JobRunner m_runner;
};

}  // namespace scenedl
