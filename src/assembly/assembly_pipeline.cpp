#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <scenedl/assembly.hpp>

namespace scenedl {

namespace {

constexpr std::size_t kCopyBufferSize = 1024 * 1024;

void remove_quietly(const std::filesystem::path &path) {
	std::error_code ec;
	std::filesystem::remove(path, ec);
}

std::filesystem::path with_suffix(std::filesystem::path path,
								  std::string_view suffix) {
	path += suffix;
	return path;
}

}  // namespace

AssemblyPipeline::AssemblyPipeline(media::IMuxer &muxer,
								   IJobReporter &reporter)
	: m_muxer(muxer), m_reporter(reporter) {}

Result<void> AssemblyPipeline::concatenate(
	StreamType type, std::vector<SegmentDescriptor> segments,
	SegmentRange range, int total_segments,
	const std::filesystem::path &artifact) {
	auto &log = m_reporter.log();

	auto init = std::find_if(segments.begin(), segments.end(),
							 [](const SegmentDescriptor &s) { return s.init; });
	if (init == segments.end()) {
		log.error("{} stream has no init segment", to_string(type));
		return outcome::failure(errc::assembly_failed);
	}
	const SegmentDescriptor init_segment = *init;
	segments.erase(init);

	std::sort(segments.begin(), segments.end(),
			  [](const SegmentDescriptor &a, const SegmentDescriptor &b) {
				  return a.index < b.index;
			  });

	int expected = range.start;
	for (const auto &segment : segments) {
		if (segment.index != expected) {
			log.error("{} stream: segment {} missing (next is {})",
					  to_string(type), expected, segment.index);
			return outcome::failure(errc::assembly_failed);
		}
		++expected;
	}
	// Only the final segment of the title may be absent
	const bool tail_ok = expected == range.end + 1 ||
						 (expected == range.end && range.end == total_segments);
	if (!tail_ok || segments.empty()) {
		log.error("{} stream: segments {}..{} incomplete", to_string(type),
				  range.start, range.end);
		return outcome::failure(errc::assembly_failed);
	}

	auto part = with_suffix(artifact, ".part");
	std::ofstream out(part, std::ios::binary | std::ios::trunc);
	if (!out) {
		log.error("Cannot create {}", part.string());
		return outcome::failure(errc::file_open_failed);
	}

	std::vector<char> buffer(kCopyBufferSize);
	auto append = [&](const SegmentDescriptor &segment) {
		std::ifstream in(segment.path, std::ios::binary);
		if (!in) {
			log.error("Segment file {} missing", segment.path.string());
			return false;
		}
		std::streamsize total = 0;
		while (in) {
			in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
			auto n = in.gcount();
			if (n > 0) out.write(buffer.data(), n);
			total += n;
		}
		if (total == 0) {
			log.error("Segment file {} is empty", segment.path.string());
			return false;
		}
		return static_cast<bool>(out);
	};

	bool ok = append(init_segment);
	for (auto it = segments.begin(); ok && it != segments.end(); ++it) {
		ok = append(*it);
	}
	out.close();
	if (!ok || !out) {
		remove_quietly(part);
		return outcome::failure(errc::assembly_failed);
	}

	std::error_code ec;
	std::filesystem::rename(part, artifact, ec);
	if (ec) {
		log.error("Cannot move {} into place: {}", part.string(), ec.message());
		remove_quietly(part);
		return outcome::failure(errc::file_write_failed);
	}
	return outcome::success();
}

void AssemblyPipeline::remove_files(
	const std::vector<SegmentDescriptor> &segments, StreamType type) {
	int removed = 0;
	for (const auto &segment : segments) {
		if (segment.type != type) continue;
		std::error_code ec;
		if (std::filesystem::remove(segment.path, ec)) ++removed;
	}
	m_reporter.log().debug("Deleted {} {} segment files", removed,
						   to_string(type));
}

Result<std::filesystem::path> AssemblyPipeline::run(
	const AssemblyRequest &request) {
	auto &log = m_reporter.log();

	std::vector<StreamType> streams;
	for (auto type : {StreamType::video, StreamType::audio}) {
		if (wants(request.target, type)) streams.push_back(type);
	}

	media::MuxRequest mux;
	mux.log = &m_reporter.log();
	std::vector<std::filesystem::path> artifacts;
	for (auto type : streams) {
		std::vector<SegmentDescriptor> own;
		std::copy_if(request.segments.begin(), request.segments.end(),
					 std::back_inserter(own),
					 [type](const SegmentDescriptor &s) { return s.type == type; });

		auto artifact =
			request.work_dir / fmt::format("{}.mp4", to_string(type));
		auto res = concatenate(type, std::move(own), request.range,
							   request.total_segments, artifact);
		if (!res) return res.error();

		m_reporter.stream_concatenated(type, artifact);
		artifacts.push_back(artifact);
		if (type == StreamType::video) {
			mux.video = artifact;
		} else {
			mux.audio = artifact;
		}

		if (request.cleanup == CleanupPolicy::aggressive) {
			remove_files(request.segments, type);
		}
	}

	std::error_code ec;
	if (request.output.has_parent_path()) {
		std::filesystem::create_directories(request.output.parent_path(), ec);
	}

	mux.output = with_suffix(request.output, ".part");
	mux.metadata = request.metadata;
	log.info("Muxing streams with ffmpeg");
	auto muxed = m_muxer.mux(mux);
	if (!muxed) {
		remove_quietly(mux.output);
		if (request.cleanup != CleanupPolicy::keep) {
			for (const auto &artifact : artifacts) remove_quietly(artifact);
		}
		return muxed.error();
	}

	std::filesystem::rename(mux.output, request.output, ec);
	if (ec) {
		log.error("Cannot move {} into place: {}", mux.output.string(),
				  ec.message());
		remove_quietly(mux.output);
		return outcome::failure(errc::file_write_failed);
	}
	log.info("Muxing success");

	if (request.cleanup != CleanupPolicy::keep) {
		if (request.cleanup == CleanupPolicy::standard) {
			for (auto type : streams) remove_files(request.segments, type);
		}
		for (const auto &artifact : artifacts) remove_quietly(artifact);
		log.info("Deleted temp files");
	}
	return request.output;
}

}  // namespace scenedl
