#pragma once

#include <scenedl/scenedl_export.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace scenedl {

struct SCENEDL_EXPORT RangeRequest {
	std::optional<int> scene;
	double padding_seconds = 0.0;  // ignored without a scene
	std::optional<int> start_segment;
	std::optional<int> end_segment;
};

/// Map a scene (or explicit bounds) onto data segment numbers.
///
/// The padded scene window is clamped to the title duration, then
/// start = floor(t0 / d) and end = ceil(t1 / d) with d the segment duration.
/// Explicit bounds replace the derived ones. The end never exceeds
/// Manifest::total_segments. Fails with errc::config_error for an unknown
/// scene, negative bounds or start > end.
SCENEDL_EXPORT Result<SegmentRange> compute_range(const Manifest &manifest,
												  const RangeRequest &request,
												  spdlog::logger &log = *spdlog::default_logger_raw());

/// Descriptors for one stream: the init segment followed by the data
/// segments of `range` in ascending order. Files live in `work_dir`.
SCENEDL_EXPORT std::vector<SegmentDescriptor> build_descriptors(
	const StreamVariant &variant, StreamType type, SegmentRange range,
	int total_segments, const std::filesystem::path &work_dir);

}  // namespace scenedl
