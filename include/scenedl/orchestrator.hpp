#pragma once

#include <scenedl/scenedl_export.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "manifest.hpp"
#include "muxer.hpp"
#include "reporter.hpp"
#include "result.hpp"
#include "types.hpp"
#include "validator.hpp"

namespace scenedl {

using ReporterFactory = std::function<std::unique_ptr<IJobReporter>(
	const std::string &name, const std::filesystem::path &log_path)>;

// Capabilities shared by every job of a run. All of them must be safe to use
// from several jobs at once.
struct SCENEDL_EXPORT JobServices {
	// Page, deliver and manifest requests (through the proxy, if any).
	net::IHttpClient *metadata_http = nullptr;
	// Segment and cover downloads. Differs from metadata_http when the proxy
	// is restricted to metadata.
	net::IHttpClient *segment_http = nullptr;
	media::ISegmentValidator *validator = nullptr;
	media::IMuxer *muxer = nullptr;
	ReporterFactory make_reporter;
	ResolverOptions resolver;
};

/// Chapters for the scenes overlapping `range`, shifted to its start and
/// clipped to it.
SCENEDL_EXPORT std::vector<media::Chapter> scene_chapters(
	const Manifest &manifest, SegmentRange range);

/// Runs one DownloadJob through
/// Pending -> Resolving -> Fetching -> Assembling -> Done.
///
/// Every failure ends the job in Done with the error of the stage that
/// raised it; run() never throws.
class SCENEDL_EXPORT JobOrchestrator {
   public:
	explicit JobOrchestrator(JobServices services);

	JobResult run(const DownloadJob &job);

	[[nodiscard]] JobStage stage() const { return m_stage; }

   private:
	struct Plan;

	Result<Plan> resolve(const DownloadJob &job,
						 const std::filesystem::path &work_dir);
	Result<std::vector<SegmentDescriptor>> fetch(const DownloadJob &job,
												 const Plan &plan);
	Result<std::filesystem::path> assemble(
		const DownloadJob &job, const Plan &plan,
		std::vector<SegmentDescriptor> segments);
	bool save_covers(const TitleInfo &info,
					 const std::filesystem::path &output_dir);
	void transition(JobStage stage);

	JobServices m_services;
	std::unique_ptr<IJobReporter> m_reporter;
	JobStage m_stage = JobStage::pending;
};

}  // namespace scenedl
