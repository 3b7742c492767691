#pragma once

#include <scenedl/scenedl_export.h>
#include <spdlog/logger.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "types.hpp"

namespace scenedl {

enum class JobStage : std::uint8_t {
	pending,
	resolving,
	fetching,
	assembling,
	done
};

inline std::string_view to_string(JobStage stage) {
	switch (stage) {
		case JobStage::pending: return "pending";
		case JobStage::resolving: return "resolving";
		case JobStage::fetching: return "fetching";
		case JobStage::assembling: return "assembling";
		case JobStage::done: return "done";
	}
	return "unknown";
}

// Progress and log sink handed to one job and its segment tasks. Methods
// may be called from several worker threads.
class SCENEDL_EXPORT IJobReporter {
   public:
	virtual ~IJobReporter() = default;

	virtual void stage_changed(JobStage stage) = 0;
	virtual void segments_planned(StreamType type, int count) = 0;
	// downloaded == false: an existing file was accepted
	virtual void segment_completed(const SegmentDescriptor &segment,
								   bool downloaded) = 0;
	virtual void stream_concatenated(StreamType type,
									 const std::filesystem::path &artifact) = 0;
	virtual spdlog::logger &log() = 0;
	// End of the job. The persistent log, if any, survives when keep_log.
	virtual void close(bool keep_log) { (void)keep_log; }
};

// spdlog-backed reporter. Logs to the shared console sink at the user's
// level and to a per-job debug log file.
class SCENEDL_EXPORT LogReporter final : public IJobReporter {
   public:
	LogReporter(std::string name, spdlog::sink_ptr console,
				std::filesystem::path log_path);
	~LogReporter() override;

	LogReporter(const LogReporter &) = delete;
	LogReporter &operator=(const LogReporter &) = delete;

	void stage_changed(JobStage stage) override;
	void segments_planned(StreamType type, int count) override;
	void segment_completed(const SegmentDescriptor &segment,
						   bool downloaded) override;
	void stream_concatenated(StreamType type,
							 const std::filesystem::path &artifact) override;
	spdlog::logger &log() override { return *m_logger; }

	// Detach the file sink; the log file is deleted unless keep_log.
	void close(bool keep_log) override;

   private:
	struct StreamProgress {
		std::atomic<int> planned{0};
		std::atomic<int> done{0};
		std::atomic<int> last_decile{0};
	};

	StreamProgress &progress(StreamType type) {
		return type == StreamType::audio ? m_audio : m_video;
	}

	std::shared_ptr<spdlog::logger> m_logger;
	std::filesystem::path m_log_path;
	bool m_has_file_sink = false;
	bool m_closed = false;
	StreamProgress m_audio;
	StreamProgress m_video;
};

}  // namespace scenedl
