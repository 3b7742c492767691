#pragma once

#include <scenedl/scenedl_export.h>

#include <chrono>
#include <vector>

#include "http_client.hpp"
#include "reporter.hpp"
#include "result.hpp"
#include "types.hpp"
#include "validator.hpp"

namespace scenedl {

struct SCENEDL_EXPORT FetchOptions {
	int threads = 5;
	bool overwrite = false;
	bool validate = false;	// deep check through the validator
	int max_retries = 3;
	std::chrono::milliseconds retry_delay{1000};
	double backoff_factor = 2.0;
};

struct SCENEDL_EXPORT FetchReport {
	// Init segments first, then data segments by stream and ascending index.
	// A tolerated missing final segment is not listed.
	std::vector<SegmentDescriptor> completed;
	int downloaded = 0;
	int skipped = 0;
	bool missing_tail = false;
};

/// Downloads the segments of one job on a fixed pool of `threads` workers.
///
/// Init segments are fetched first, one at a time, because data segments
/// are validated against them. An existing file is accepted when it passes
/// validation and overwrite is off. Transient errors (see is_transient) are
/// retried with exponential backoff; exhausting the retries fails with
/// errc::segment_fetch_failed. Any fatal error cancels the queued and
/// in-flight segments of the job and is returned as is.
class SCENEDL_EXPORT SegmentFetcher {
   public:
	SegmentFetcher(net::IHttpClient &http, media::ISegmentValidator *validator,
				   IJobReporter &reporter, FetchOptions options);

	Result<FetchReport> fetch(const std::vector<SegmentDescriptor> &descriptors);

   private:
	class CancelState;
	enum class Outcome : std::uint8_t { downloaded, skipped, absent };

	Result<Outcome> fetch_one(const SegmentDescriptor &segment,
							  const SegmentDescriptor *init,
							  CancelState &cancel);
	Result<void> download(const SegmentDescriptor &segment,
						  CancelState &cancel);
	bool is_valid(const SegmentDescriptor &segment,
				  const SegmentDescriptor *init);

	net::IHttpClient &m_http;
	media::ISegmentValidator *m_validator;
	IJobReporter &m_reporter;
	FetchOptions m_options;
};

}  // namespace scenedl
