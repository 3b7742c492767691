#pragma once

#include <scenedl/scenedl_export.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace scenedl {

enum class StreamType : std::uint8_t { audio, video };

inline std::string_view to_string(StreamType type) {
	return type == StreamType::audio ? "audio" : "video";
}

// Single letter used in remote segment names ("a_<id>_<n>", "vi_<id>")
inline char stream_prefix(StreamType type) {
	return type == StreamType::audio ? 'a' : 'v';
}

// One rung of the resolution ladder. Audio and video segment lists of a
// representation share its id, so both live on the variant.
struct SCENEDL_EXPORT StreamVariant {
	std::string id;
	int height = 0;
	long long bandwidth = 0;  // bits per second, 0 when not advertised

	std::string audio_init_url;
	std::string video_init_url;
	std::vector<std::string> audio_segment_urls;  // index == segment number
	std::vector<std::string> video_segment_urls;

	[[nodiscard]] const std::string &init_url(StreamType type) const {
		return type == StreamType::audio ? audio_init_url : video_init_url;
	}
	[[nodiscard]] const std::vector<std::string> &segment_urls(
		StreamType type) const {
		return type == StreamType::audio ? audio_segment_urls
										 : video_segment_urls;
	}
};

struct SCENEDL_EXPORT SceneBoundary {
	int number = 0;	 // 1-based, document order
	double start_seconds = 0.0;
	double end_seconds = 0.0;
	std::vector<std::string> performers;
};

struct SCENEDL_EXPORT TitleInfo {
	std::string id;
	std::string section;  // "straight", "gay", ... (first path component)
	std::string studio;
	std::string title;
	long long duration_seconds = 0;
	std::vector<std::string> performers;
	std::string cover_front_url;
	std::string cover_back_url;
};

// Everything resolved from the remote documents for one title.
struct SCENEDL_EXPORT Manifest {
	TitleInfo info;
	std::string base_url;
	double segment_duration = 0.0;	// seconds
	int total_segments = 0;			// highest data segment number
	std::vector<StreamVariant> ladder;	// ascending height
	std::vector<SceneBoundary> scenes;
	// Representation whose audio stream demuxes cleanly. Some audio
	// representations are corrupt, so it can differ from the video choice.
	std::string audio_id;
};

// Inclusive range of data segment numbers.
struct SegmentRange {
	int start = 0;
	int end = 0;

	[[nodiscard]] int size() const { return end - start + 1; }
	bool operator==(const SegmentRange &) const = default;
};

struct SCENEDL_EXPORT SegmentDescriptor {
	StreamType type = StreamType::video;
	int index = 0;		// data segment number; ignored for init segments
	bool init = false;	// initialization segment, always assembled first
	std::string url;
	std::filesystem::path path;
	// The final segment number is derived from a rounded-up duration and may
	// not exist on the server; a 404 on it is not an error.
	bool may_be_absent = false;

	[[nodiscard]] std::string name() const {
		return path.stem().string();
	}
};

enum class TargetStream : std::uint8_t { both, audio, video };

inline bool wants(TargetStream target, StreamType type) {
	if (target == TargetStream::both) return true;
	return (target == TargetStream::audio) == (type == StreamType::audio);
}

enum class CleanupPolicy : std::uint8_t { standard, aggressive, keep };

struct SCENEDL_EXPORT ProxySettings {
	std::string url;  // http://, socks5:// or socks5h://, optional user:pass@
	bool metadata_only = false;
};

// Configuration snapshot taken when a job is created.
struct SCENEDL_EXPORT JobConfig {
	std::optional<int> target_height;  // nullopt = highest, 0 = lowest
	bool force_resolution = false;
	int threads = 5;
	ProxySettings proxy;
	bool overwrite = false;
	CleanupPolicy cleanup = CleanupPolicy::standard;
	TargetStream target_stream = TargetStream::both;
	bool validate_segments = false;

	double scene_padding = 0.0;	 // seconds
	std::optional<int> start_segment;
	std::optional<int> end_segment;

	bool inject_metadata = true;
	bool include_performer_names = false;
	bool download_covers = false;
	bool keep_logs = false;

	int max_retries = 3;
	std::chrono::milliseconds retry_delay{1000};
	double backoff_factor = 2.0;

	std::string ffmpeg = "ffmpeg";
};

struct SCENEDL_EXPORT DownloadJob {
	std::string url;
	std::optional<int> scene;
	std::filesystem::path output_dir;
	std::filesystem::path work_dir;
	// Resolved by the orchestrator from the title metadata when empty.
	std::filesystem::path output_path;
	JobConfig config;
};

enum class JobStatus : std::uint8_t { success, partial_failure, failure };

inline std::string_view to_string(JobStatus status) {
	switch (status) {
		case JobStatus::success: return "success";
		case JobStatus::partial_failure: return "partial failure";
		case JobStatus::failure: return "failure";
	}
	return "unknown";
}

struct SCENEDL_EXPORT JobResult {
	std::string url;
	std::optional<int> scene;
	JobStatus status = JobStatus::failure;
	std::filesystem::path output_path;
	std::error_code error;
	std::string reason;

	[[nodiscard]] bool ok() const { return status == JobStatus::success; }
};

}  // namespace scenedl
