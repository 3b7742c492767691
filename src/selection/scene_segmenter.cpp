#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <scenedl/manifest.hpp>
#include <scenedl/segmenter.hpp>

namespace scenedl {

Result<SegmentRange> compute_range(const Manifest &manifest,
								   const RangeRequest &request,
								   spdlog::logger &log) {
	if (manifest.segment_duration <= 0.0) {
		return outcome::failure(errc::manifest_error);
	}

	SegmentRange range{0, manifest.total_segments};

	if (request.scene) {
		auto scene = std::find_if(
			manifest.scenes.begin(), manifest.scenes.end(),
			[&](const SceneBoundary &s) { return s.number == *request.scene; });
		if (scene == manifest.scenes.end()) {
			log.error("Scene {} not found ({} scenes)", *request.scene,
						  manifest.scenes.size());
			return outcome::failure(errc::config_error);
		}

		const double duration =
			static_cast<double>(manifest.info.duration_seconds);
		const double padding = std::max(0.0, request.padding_seconds);
		double from = std::max(0.0, scene->start_seconds - padding);
		double to = scene->end_seconds + padding;
		if (duration > 0.0) to = std::min(duration, to);

		range.start =
			static_cast<int>(std::floor(from / manifest.segment_duration));
		range.end = static_cast<int>(std::ceil(to / manifest.segment_duration));
	}

	if (request.start_segment) range.start = *request.start_segment;
	if (request.end_segment) range.end = *request.end_segment;

	if (range.start < 0 || range.end < 0) {
		log.error("Segment bounds must not be negative");
		return outcome::failure(errc::config_error);
	}
	range.end = std::min(range.end, manifest.total_segments);

	if (range.start > range.end) {
		log.error("Start segment {} is after end segment {}", range.start,
					  range.end);
		return outcome::failure(errc::config_error);
	}
	return range;
}

std::vector<SegmentDescriptor> build_descriptors(
	const StreamVariant &variant, StreamType type, SegmentRange range,
	int total_segments, const std::filesystem::path &work_dir) {
	const auto &urls = variant.segment_urls(type);

	std::vector<SegmentDescriptor> descriptors;
	descriptors.reserve(static_cast<std::size_t>(range.size()) + 1);

	SegmentDescriptor init;
	init.type = type;
	init.init = true;
	init.url = variant.init_url(type);
	init.path = work_dir / (segment_name(type, variant.id, std::nullopt) + ".mp4");
	descriptors.push_back(std::move(init));

	for (int n = range.start; n <= range.end; ++n) {
		SegmentDescriptor segment;
		segment.type = type;
		segment.index = n;
		auto slot = static_cast<std::size_t>(n);
		if (slot < urls.size()) segment.url = urls[slot];
		segment.path = work_dir / (segment_name(type, variant.id, n) + ".mp4");
		segment.may_be_absent = n == total_segments;
		descriptors.push_back(std::move(segment));
	}
	return descriptors;
}

}  // namespace scenedl
