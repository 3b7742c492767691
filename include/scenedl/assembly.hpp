#pragma once

#include <scenedl/scenedl_export.h>

#include <filesystem>
#include <optional>
#include <vector>

#include "muxer.hpp"
#include "reporter.hpp"
#include "result.hpp"
#include "types.hpp"

namespace scenedl {

struct SCENEDL_EXPORT AssemblyRequest {
	// Fetched segments of every wanted stream, in any order.
	std::vector<SegmentDescriptor> segments;
	SegmentRange range;
	int total_segments = 0;
	TargetStream target = TargetStream::both;
	CleanupPolicy cleanup = CleanupPolicy::standard;
	std::filesystem::path work_dir;
	std::filesystem::path output;
	std::optional<media::MuxMetadata> metadata;
};

/// Concatenates each stream in ascending segment order, muxes the result
/// into a temporary file next to the output and renames it into place.
///
/// Cleanup policies:
/// - standard: segments and stream artifacts are removed after a
///   successful mux only
/// - aggressive: a stream's segments are removed right after its
///   concatenation, whatever the mux outcome
/// - keep: nothing is removed
class SCENEDL_EXPORT AssemblyPipeline {
   public:
	AssemblyPipeline(media::IMuxer &muxer, IJobReporter &reporter);

	Result<std::filesystem::path> run(const AssemblyRequest &request);

	/// Init segment first, then data segments by ascending index. A missing
	/// index is errc::assembly_failed, except index total_segments when the
	/// range ends there.
	Result<void> concatenate(StreamType type,
							 std::vector<SegmentDescriptor> segments,
							 SegmentRange range, int total_segments,
							 const std::filesystem::path &artifact);

   private:
	void remove_files(const std::vector<SegmentDescriptor> &segments,
					  StreamType type);

	media::IMuxer &m_muxer;
	IJobReporter &m_reporter;
};

}  // namespace scenedl
