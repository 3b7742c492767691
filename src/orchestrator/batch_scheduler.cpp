#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fstream>
#include <scenedl/batch.hpp>
#include <scenedl/manifest.hpp>
#include <set>
#include <utility>

#include "utils.hpp"

namespace scenedl {

Result<std::vector<BatchEntry>> parse_batch_list(std::istream &in) {
	std::vector<BatchEntry> entries;
	std::string line;
	int line_no = 0;
	while (std::getline(in, line)) {
		++line_no;
		auto text = utils::trim(line);
		if (text.empty() || text.front() == '#') continue;

		BatchEntry entry;
		auto bar = text.find('|');
		entry.url = std::string(utils::trim(text.substr(0, bar)));
		if (bar != std::string_view::npos) {
			auto scene = utils::to_int(utils::trim(text.substr(bar + 1)));
			if (!scene || scene.value() < 1) {
				spdlog::error("Line {}: invalid scene number '{}'", line_no,
							  text.substr(bar + 1));
				return outcome::failure(errc::config_error);
			}
			entry.scene = scene.value();
		}
		if (entry.url.empty()) {
			spdlog::error("Line {}: missing URL", line_no);
			return outcome::failure(errc::config_error);
		}
		entries.push_back(std::move(entry));
	}
	return entries;
}

Result<std::vector<BatchEntry>> read_batch_file(
	const std::filesystem::path &path) {
	std::ifstream in(path);
	if (!in) {
		spdlog::error("Cannot open list file {}", path.string());
		return outcome::failure(errc::file_open_failed);
	}
	return parse_batch_list(in);
}

bool BatchSummary::all_succeeded() const {
	return std::all_of(results.begin(), results.end(),
					   [](const JobResult &r) { return r.ok(); });
}

int BatchSummary::count(JobStatus status) const {
	return static_cast<int>(
		std::count_if(results.begin(), results.end(),
					  [status](const JobResult &r) { return r.status == status; }));
}

namespace {

// Entries that resolve to the same working directory are the same job.
// Unparseable locators fall back to the raw string and fail in the runner.
std::pair<std::string, int> entry_key(const BatchEntry &entry) {
	auto locator = parse_locator(entry.url);
	return {locator ? locator.value().id : entry.url, entry.scene.value_or(0)};
}

}  // namespace

BatchScheduler::BatchScheduler(int workers, JobRunner runner)
	: m_workers(std::max(1, workers)), m_runner(std::move(runner)) {}

BatchSummary BatchScheduler::run(const std::vector<BatchEntry> &entries) {
	BatchSummary summary;
	summary.results.resize(entries.size());

	std::set<std::pair<std::string, int>> seen;
	std::vector<std::size_t> runnable;
	for (std::size_t i = 0; i < entries.size(); ++i) {
		const auto &entry = entries[i];
		if (!seen.insert(entry_key(entry)).second) {
			auto &result = summary.results[i];
			result.url = entry.url;
			result.scene = entry.scene;
			result.status = JobStatus::failure;
			result.error = make_error_code(errc::config_error);
			result.reason = "duplicate entry";
			spdlog::warn("Skipping duplicate entry {}", entry.url);
			continue;
		}
		runnable.push_back(i);
	}

	const auto workers = std::min<std::size_t>(
		static_cast<std::size_t>(m_workers), std::max<std::size_t>(1, runnable.size()));
	spdlog::info("Running {} jobs on {} workers", runnable.size(), workers);

	boost::asio::thread_pool pool(workers);
	for (auto i : runnable) {
		boost::asio::post(pool, [this, &entries, &summary, i] {
			const auto &entry = entries[i];
			JobResult result;
			try {
				result = m_runner(entry);
			} catch (const std::exception &e) {
				result.url = entry.url;
				result.scene = entry.scene;
				result.status = JobStatus::failure;
				result.error = make_error_code(errc::unknown);
				result.reason = e.what();
			}
			if (result.status == JobStatus::failure) {
				spdlog::error("{}: {}", entry.url, result.reason);
			}
			summary.results[i] = std::move(result);
		});
	}
	pool.join();
	return summary;
}

}  // namespace scenedl
