#pragma once

#include <scenedl/scenedl_export.h>
#include <spdlog/logger.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "result.hpp"

namespace scenedl::media {

struct SCENEDL_EXPORT Chapter {
	double start_seconds = 0.0;
	double end_seconds = 0.0;
	std::string title;
};

struct SCENEDL_EXPORT MuxMetadata {
	std::string title;
	std::vector<Chapter> chapters;	// ascending start
};

struct SCENEDL_EXPORT MuxRequest {
	std::optional<std::filesystem::path> video;
	std::optional<std::filesystem::path> audio;
	std::filesystem::path output;
	std::optional<MuxMetadata> metadata;
	// Job log; the default logger when null.
	spdlog::logger *log = nullptr;
};

// Stream-copies the given inputs into one MP4 file at request.output.
class SCENEDL_EXPORT IMuxer {
   public:
	virtual ~IMuxer() = default;
	virtual Result<void> mux(const MuxRequest &request) = 0;
};

// ";FFMETADATA1" document with TIMEBASE=1/1000 chapters.
SCENEDL_EXPORT std::string to_ffmetadata(const MuxMetadata &metadata);

// Argument list (without the program name) for the given request.
SCENEDL_EXPORT std::vector<std::string> ffmpeg_arguments(
	const MuxRequest &request, const std::filesystem::path &metadata_file);

class SCENEDL_EXPORT FfmpegMuxer final : public IMuxer {
   public:
	explicit FfmpegMuxer(std::filesystem::path executable);

	Result<void> mux(const MuxRequest &request) override;

	// Resolves a bare program name through PATH. Fails with
	// errc::config_error when nothing executable is found.
	static Result<std::filesystem::path> locate(std::string_view program);

   private:
	std::filesystem::path m_executable;
};

}  // namespace scenedl::media
