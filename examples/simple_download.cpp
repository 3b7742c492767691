#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <scenedl/http_client.hpp>
#include <scenedl/manifest.hpp>
#include <scenedl/muxer.hpp>
#include <scenedl/orchestrator.hpp>
#include <scenedl/validator.hpp>

using namespace scenedl;

int main(int argc, char *argv[]) {
	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("scenedl", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	std::string url =
		argc > 1 ? argv[1]
				 : "https://straight.aebn.com/straight/movies/12345/example";

	auto ffmpeg = media::FfmpegMuxer::locate("ffmpeg");
	if (!ffmpeg) {
		std::cerr << "ffmpeg not found in PATH\n";
		return 1;
	}

	// Components
	net::HttpClientOptions http_options;
	http_options.default_headers = default_request_headers();
	net::HttpClient http(http_options);
	media::AvSegmentValidator validator;
	media::FfmpegMuxer muxer(ffmpeg.value());

	JobServices services;
	services.metadata_http = &http;
	services.segment_http = &http;
	services.validator = &validator;
	services.muxer = &muxer;
	services.make_reporter = [console_sink](const std::string &name,
											const std::filesystem::path &log) {
		return std::make_unique<LogReporter>(name, console_sink, log);
	};

	// First scene at 480p or the nearest lower rung
	DownloadJob job;
	job.url = url;
	job.scene = 1;
	job.output_dir = std::filesystem::current_path();
	job.work_dir = std::filesystem::temp_directory_path() / "scenedl";
	job.config.target_height = 480;
	job.config.scene_padding = 5.0;

	JobOrchestrator orchestrator(services);
	auto result = orchestrator.run(job);

	if (!result.ok()) {
		std::cerr << "Download failed: " << result.reason << "\n";
		return 1;
	}
	std::cout << "Saved " << result.output_path.string() << "\n";
	return 0;
}
