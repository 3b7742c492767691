#pragma once

#include <spdlog/spdlog.h>

#include <scenedl/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace scenedl::manifest {

struct Representation {
	std::string id;
	int height = 0;
	long long bandwidth = 0;
};

struct MpdVideoSet {
	double segment_duration = 0.0;	// SegmentTemplate duration / timescale
	std::vector<Representation> representations;  // ascending height
};

// Reads the video/mp4 AdaptationSet of a DASH manifest.
Result<MpdVideoSet> parse_mpd(std::string_view xml,
							  spdlog::logger &log = *spdlog::default_logger_raw());

}  // namespace scenedl::manifest
