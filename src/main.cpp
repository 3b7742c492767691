#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <scenedl/batch.hpp>
#include <scenedl/http_client.hpp>
#include <scenedl/manifest.hpp>
#include <scenedl/muxer.hpp>
#include <scenedl/orchestrator.hpp>
#include <scenedl/reporter.hpp>
#include <scenedl/validator.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitJobFailed = 1;
constexpr int kExitConfigError = 2;
constexpr int kDefaultBatchWorkers = 3;

// Invalid option combination, detected before any job starts
struct ConfigError : std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct CliOptions {
	std::vector<scenedl::BatchEntry> entries;
	std::filesystem::path output_dir;
	std::filesystem::path work_dir;
	std::optional<int> batch_workers;
	scenedl::JobConfig config;
};

// =============================================================================
// Option parsing
// =============================================================================

po::options_description make_options() {
	po::options_description desc("Options");
	// clang-format off
	desc.add_options()
		("help,h", "Print help message")
		("url", po::value<std::string>(), "Title URL to download")
		("list,l", po::value<std::string>(),
		 "File with one URL per line, optionally URL|scene")
		("config", po::value<std::string>(), "INI file with default options")
		// Output
		("output-dir,o", po::value<std::string>(), "Output directory")
		("work-dir,w", po::value<std::string>(), "Directory for segments")
		// Selection
		("resolution,r", po::value<int>(),
		 "Target height, 0 for the lowest (default: highest)")
		("resolution-force,f", po::bool_switch(),
		 "Fail unless the exact resolution exists")
		("scene,s", po::value<int>(), "Download only this scene (1-based)")
		("scene-padding", po::value<double>(),
		 "Seconds added before and after the scene")
		("start-segment", po::value<int>(), "First data segment")
		("end-segment", po::value<int>(), "Last data segment")
		("target-stream,t", po::value<std::string>(),
		 "Download only 'audio' or 'video'")
		// Network
		("proxy,p", po::value<std::string>(),
		 "Proxy (http://, socks5://, socks5h://, user:pass@ allowed)")
		("proxy-metadata", po::bool_switch(),
		 "Use the proxy for metadata requests only")
		("threads", po::value<int>(), "Segment downloads per job (default 5)")
		("jobs,j", po::value<int>(),
		 "Concurrent jobs in list mode (default: min(entries, 3))")
		("retries", po::value<int>(), "Retries for transient segment errors")
		// Files
		("overwrite", po::bool_switch(), "Re-download existing segments")
		("validate", po::bool_switch(), "Decode-check every segment")
		("keep,k", po::bool_switch(), "Keep segments after muxing")
		("aggressive-cleanup,a", po::bool_switch(),
		 "Delete segments right after each stream is concatenated")
		("no-metadata", po::bool_switch(),
		 "Do not write title and chapters into the output")
		("include-performer-names", po::bool_switch(),
		 "Add performer names to the output file name")
		("covers,c", po::bool_switch(), "Save front and back covers")
		("keep-logs", po::bool_switch(), "Keep per-job log files")
		("ffmpeg", po::value<std::string>(), "ffmpeg executable")
		// Logging
		("log-level", po::value<std::string>(),
		 "trace, debug, info, warn, error or critical")
		("verbose,v", po::bool_switch(), "Same as --log-level debug");
	// clang-format on
	return desc;
}

template <typename T>
std::optional<T> optional_value(const po::variables_map &vm,
								const char *name) {
	if (!vm.count(name)) return std::nullopt;
	return vm[name].as<T>();
}

CliOptions build_options(const po::variables_map &vm) {
	CliOptions opts;
	auto &config = opts.config;

	if (vm.count("list")) {
		auto entries = scenedl::read_batch_file(vm["list"].as<std::string>());
		if (!entries) {
			throw ConfigError(fmt::format("invalid list file: {}",
										  entries.error().message()));
		}
		opts.entries = std::move(entries.value());
		if (vm.count("url")) {
			opts.entries.insert(
				opts.entries.begin(),
				scenedl::BatchEntry{vm["url"].as<std::string>(),
									optional_value<int>(vm, "scene")});
		}
	} else if (vm.count("url")) {
		opts.entries.push_back(scenedl::BatchEntry{
			vm["url"].as<std::string>(), optional_value<int>(vm, "scene")});
	}
	if (opts.entries.empty()) throw ConfigError("no URL given");
	if (vm.count("scene") && vm["scene"].as<int>() < 1) {
		throw ConfigError("--scene starts at 1");
	}

	opts.output_dir = vm.count("output-dir")
						  ? std::filesystem::path(vm["output-dir"].as<std::string>())
						  : std::filesystem::current_path();
	opts.work_dir = vm.count("work-dir")
						? std::filesystem::path(vm["work-dir"].as<std::string>())
						: std::filesystem::current_path();

	config.target_height = optional_value<int>(vm, "resolution");
	if (config.target_height && *config.target_height < 0) {
		throw ConfigError("--resolution must not be negative");
	}
	config.force_resolution = vm["resolution-force"].as<bool>();
	if (config.force_resolution && !config.target_height) {
		throw ConfigError("--resolution-force needs --resolution");
	}

	config.scene_padding = optional_value<double>(vm, "scene-padding").value_or(0.0);
	if (config.scene_padding < 0.0) {
		throw ConfigError("--scene-padding must not be negative");
	}
	config.start_segment = optional_value<int>(vm, "start-segment");
	config.end_segment = optional_value<int>(vm, "end-segment");
	if ((config.start_segment && *config.start_segment < 0) ||
		(config.end_segment && *config.end_segment < 0)) {
		throw ConfigError("segment numbers must not be negative");
	}
	if (config.start_segment && config.end_segment &&
		*config.start_segment > *config.end_segment) {
		throw ConfigError("--start-segment is after --end-segment");
	}

	if (vm.count("target-stream")) {
		auto target = vm["target-stream"].as<std::string>();
		if (target == "audio") {
			config.target_stream = scenedl::TargetStream::audio;
		} else if (target == "video") {
			config.target_stream = scenedl::TargetStream::video;
		} else {
			throw ConfigError(
				fmt::format("unknown target stream '{}'", target));
		}
	}

	if (vm.count("proxy")) {
		config.proxy.url = vm["proxy"].as<std::string>();
		if (!scenedl::net::parse_proxy(config.proxy.url)) {
			throw ConfigError(
				fmt::format("unsupported proxy '{}'", config.proxy.url));
		}
	}
	config.proxy.metadata_only = vm["proxy-metadata"].as<bool>();
	if (config.proxy.metadata_only && config.proxy.url.empty()) {
		throw ConfigError("--proxy-metadata needs --proxy");
	}

	config.threads = optional_value<int>(vm, "threads").value_or(config.threads);
	if (config.threads < 1) throw ConfigError("--threads must be at least 1");
	opts.batch_workers = optional_value<int>(vm, "jobs");
	if (opts.batch_workers && *opts.batch_workers < 1) {
		throw ConfigError("--jobs must be at least 1");
	}
	config.max_retries =
		optional_value<int>(vm, "retries").value_or(config.max_retries);
	if (config.max_retries < 0) throw ConfigError("--retries must not be negative");

	const bool keep = vm["keep"].as<bool>();
	const bool aggressive = vm["aggressive-cleanup"].as<bool>();
	if (keep && aggressive) {
		throw ConfigError("--keep and --aggressive-cleanup exclude each other");
	}
	config.cleanup = keep		  ? scenedl::CleanupPolicy::keep
					 : aggressive ? scenedl::CleanupPolicy::aggressive
								  : scenedl::CleanupPolicy::standard;
	config.overwrite = vm["overwrite"].as<bool>();
	config.validate_segments = vm["validate"].as<bool>();
	config.inject_metadata = !vm["no-metadata"].as<bool>();
	config.include_performer_names = vm["include-performer-names"].as<bool>();
	config.download_covers = vm["covers"].as<bool>();
	config.keep_logs = vm["keep-logs"].as<bool>();
	if (vm.count("ffmpeg")) config.ffmpeg = vm["ffmpeg"].as<std::string>();

	return opts;
}

spdlog::level::level_enum log_level(const po::variables_map &vm) {
	if (vm["verbose"].as<bool>()) return spdlog::level::debug;
	if (!vm.count("log-level")) return spdlog::level::info;
	auto name = vm["log-level"].as<std::string>();
	auto level = spdlog::level::from_str(name);
	// from_str maps unknown names to off
	if (level == spdlog::level::off && name != "off") {
		throw ConfigError(fmt::format("unknown log level '{}'", name));
	}
	return level;
}

// =============================================================================
// Run
// =============================================================================

int run(const CliOptions &opts, const spdlog::sink_ptr &console) {
	const auto &config = opts.config;

	auto ffmpeg = scenedl::media::FfmpegMuxer::locate(config.ffmpeg);
	if (!ffmpeg) {
		spdlog::error("ffmpeg not found: {}", config.ffmpeg);
		return kExitConfigError;
	}
	scenedl::media::FfmpegMuxer muxer(ffmpeg.value());
	scenedl::media::AvSegmentValidator validator;

	scenedl::net::HttpClientOptions http_options;
	http_options.default_headers = scenedl::default_request_headers();
	auto direct_options = http_options;
	if (!config.proxy.url.empty()) {
		http_options.proxy = scenedl::net::parse_proxy(config.proxy.url).value();
	}
	scenedl::net::HttpClient metadata_http(http_options);
	std::unique_ptr<scenedl::net::HttpClient> direct_http;
	if (config.proxy.metadata_only) {
		direct_http =
			std::make_unique<scenedl::net::HttpClient>(direct_options);
	}

	scenedl::JobServices services;
	services.metadata_http = &metadata_http;
	services.segment_http =
		direct_http ? static_cast<scenedl::net::IHttpClient *>(direct_http.get())
					: &metadata_http;
	services.validator = &validator;
	services.muxer = &muxer;
	services.make_reporter = [console](const std::string &name,
									   const std::filesystem::path &log_path) {
		return std::make_unique<scenedl::LogReporter>(name, console, log_path);
	};

	spdlog::info("Output dir: {}", opts.output_dir.string());
	spdlog::info("Work dir: {}", opts.work_dir.string());
	spdlog::info("Proxy: {}", config.proxy.url.empty() ? "none" : config.proxy.url);
	spdlog::info("Threads: {}", config.threads);

	auto run_job = [&](const scenedl::BatchEntry &entry) {
		scenedl::DownloadJob job;
		job.url = entry.url;
		job.scene = entry.scene;
		job.output_dir = opts.output_dir;
		job.work_dir = opts.work_dir;
		job.config = config;
		scenedl::JobOrchestrator orchestrator(services);
		return orchestrator.run(job);
	};

	int exit_code = kExitOk;
	if (opts.entries.size() == 1) {
		auto result = run_job(opts.entries.front());
		if (result.status != scenedl::JobStatus::success) {
			spdlog::error("{}: {}", to_string(result.status), result.reason);
			exit_code = kExitJobFailed;
		}
	} else {
		const int workers = opts.batch_workers.value_or(
			std::min(static_cast<int>(opts.entries.size()), kDefaultBatchWorkers));
		scenedl::BatchScheduler scheduler(workers, run_job);
		auto summary = scheduler.run(opts.entries);

		for (const auto &result : summary.results) {
			auto label = result.scene
							 ? fmt::format("{} (scene {})", result.url, *result.scene)
							 : result.url;
			if (result.ok()) {
				spdlog::info("[ok] {}: {}", label, result.output_path.string());
			} else {
				spdlog::error("[{}] {}: {}", to_string(result.status), label,
							  result.reason);
			}
		}
		spdlog::info("{} succeeded, {} partial, {} failed",
					 summary.count(scenedl::JobStatus::success),
					 summary.count(scenedl::JobStatus::partial_failure),
					 summary.count(scenedl::JobStatus::failure));
		if (!summary.all_succeeded()) exit_code = kExitJobFailed;
	}

	metadata_http.shutdown();
	if (direct_http) direct_http->shutdown();
	return exit_code;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char *argv[]) {
	auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
	console->set_pattern("%H:%M:%S|%l|%v");
	spdlog::set_default_logger(
		std::make_shared<spdlog::logger>("scenedl", console));

	try {
		auto desc = make_options();
		po::positional_options_description p;
		p.add("url", 1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(desc)
					  .positional(p)
					  .run(),
				  vm);
		// Values already given on the command line take precedence
		if (vm.count("config")) {
			po::store(po::parse_config_file<char>(
						  vm["config"].as<std::string>().c_str(), desc),
					  vm);
		}
		po::notify(vm);

		if (vm.count("help")) {
			std::cout << "Usage: scenedl [options] <url>\n" << desc << "\n";
			return kExitOk;
		}

		auto level = log_level(vm);
		console->set_level(level);
		spdlog::set_level(level);

		auto opts = build_options(vm);
		return run(opts, console);

	} catch (const ConfigError &e) {
		spdlog::error("{}", e.what());
		return kExitConfigError;
	} catch (const po::error &e) {
		spdlog::error("{}", e.what());
		return kExitConfigError;
	} catch (const std::exception &e) {
		spdlog::error("{}", e.what());
		return kExitJobFailed;
	}
}
