#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/beast/core/string.hpp>
#include <chrono>
#include <fstream>
#include <scenedl/assembly.hpp>
#include <scenedl/fetcher.hpp>
#include <scenedl/orchestrator.hpp>
#include <scenedl/output_template.hpp>
#include <scenedl/segmenter.hpp>
#include <scenedl/selector.hpp>

#include "utils.hpp"

namespace scenedl {

struct JobOrchestrator::Plan {
	Manifest manifest;
	StreamVariant video;
	StreamVariant audio;
	SegmentRange range;
	std::filesystem::path work_dir;
	std::filesystem::path output;
	bool covers_failed = false;
};

std::vector<media::Chapter> scene_chapters(const Manifest &manifest,
										   SegmentRange range) {
	std::vector<media::Chapter> chapters;
	const double window_start = range.start * manifest.segment_duration;
	double window_end = (range.end + 1) * manifest.segment_duration;
	if (manifest.info.duration_seconds > 0) {
		window_end = std::min(
			window_end, static_cast<double>(manifest.info.duration_seconds));
	}

	for (const auto &scene : manifest.scenes) {
		if (scene.end_seconds <= window_start ||
			scene.start_seconds >= window_end) {
			continue;
		}
		media::Chapter chapter;
		chapter.start_seconds =
			std::max(scene.start_seconds, window_start) - window_start;
		chapter.end_seconds =
			std::min(scene.end_seconds, window_end) - window_start;
		chapter.title = fmt::format("Scene {}", scene.number);
		if (!scene.performers.empty()) {
			chapter.title +=
				fmt::format(": {}", fmt::join(scene.performers, ", "));
		}
		chapters.push_back(std::move(chapter));
	}
	std::sort(chapters.begin(), chapters.end(),
			  [](const media::Chapter &a, const media::Chapter &b) {
				  return a.start_seconds < b.start_seconds;
			  });
	return chapters;
}

JobOrchestrator::JobOrchestrator(JobServices services)
	: m_services(std::move(services)) {}

void JobOrchestrator::transition(JobStage stage) {
	m_stage = stage;
	if (m_reporter) m_reporter->stage_changed(stage);
}

Result<JobOrchestrator::Plan> JobOrchestrator::resolve(
	const DownloadJob &job, const std::filesystem::path &work_dir) {
	auto &log = m_reporter->log();
	const auto &config = job.config;

	ResolverOptions options = m_services.resolver;
	options.probe_audio = wants(config.target_stream, StreamType::audio);
	options.segment_http = m_services.segment_http;
	options.log = &log;
	ManifestResolver resolver(*m_services.metadata_http,
							  m_services.validator, options);
	auto manifest = resolver.resolve(job.url);
	if (!manifest) return manifest.error();

	Plan plan;
	plan.manifest = std::move(manifest.value());
	plan.work_dir = work_dir;
	const auto &info = plan.manifest.info;
	log.info("{} ({})", title_stem(info), duration_string(info.duration_seconds));

	if (!config.target_height) {
		log.info("Target resolution: Highest");
	} else if (*config.target_height == 0) {
		log.info("Target resolution: Lowest");
	} else {
		log.info("Target resolution: {}", *config.target_height);
	}
	auto video = select_variant(plan.manifest.ladder, config.target_height,
								config.force_resolution, log);
	if (!video) {
		log.error("Resolution {}p is not available",
				  config.target_height.value_or(0));
		return video.error();
	}
	plan.video = std::move(video.value());

	if (wants(config.target_stream, StreamType::audio)) {
		const auto *audio = find_variant(plan.manifest, plan.manifest.audio_id);
		if (!audio) return outcome::failure(errc::manifest_error);
		plan.audio = *audio;
	}

	RangeRequest range_request;
	range_request.scene = job.scene;
	range_request.padding_seconds = config.scene_padding;
	range_request.start_segment = config.start_segment;
	range_request.end_segment = config.end_segment;
	auto range = compute_range(plan.manifest, range_request, log);
	if (!range) return range.error();
	plan.range = range.value();

	if (!job.output_path.empty()) {
		plan.output = job.output_path;
	} else {
		std::vector<std::string> performers;
		if (config.include_performer_names) {
			if (job.scene) {
				const auto &scenes = plan.manifest.scenes;
				auto it = std::find_if(scenes.begin(), scenes.end(),
									   [&](const SceneBoundary &s) {
										   return s.number == *job.scene;
									   });
				if (it != scenes.end()) performers = it->performers;
			} else {
				performers = info.performers;
			}
		}
		std::optional<int> height;
		if (wants(config.target_stream, StreamType::video)) {
			height = plan.video.height;
		}
		plan.output = job.output_dir / output_file_name(info, job.scene,
														config.target_stream,
														height, performers);
	}
	log.info("Output file name: {}", plan.output.filename().string());

	if (config.download_covers) {
		plan.covers_failed = !save_covers(info, plan.output.parent_path());
	}
	return plan;
}

bool JobOrchestrator::save_covers(const TitleInfo &info,
								  const std::filesystem::path &output_dir) {
	auto &log = m_reporter->log();
	std::error_code ec;
	if (!output_dir.empty()) std::filesystem::create_directories(output_dir, ec);

	bool ok = true;
	auto save = [&](const std::string &url, std::string_view side) {
		if (url.empty()) {
			log.warn("No {} cover advertised", side);
			ok = false;
			return;
		}
		auto ext = std::filesystem::path(url).extension().string();
		auto path = output_dir / (sanitize_filename(fmt::format(
									  "{} {}", title_stem(info), side)) +
								  ext);
		if (std::filesystem::is_regular_file(path, ec)) return;

		auto res = m_services.segment_http->get(url, {});
		std::error_code status_ec;
		if (res) status_ec = net::status_to_error(res.value().status_code);
		if (!res || status_ec) {
			log.warn("Cover {} failed: {}", url,
					 (res ? status_ec : res.error()).message());
			ok = false;
			return;
		}

		auto part = path;
		part += ".part";
		{
			std::ofstream out(part, std::ios::binary | std::ios::trunc);
			out.write(res.value().body.data(),
					  static_cast<std::streamsize>(res.value().body.size()));
			if (!out) {
				log.warn("Cannot write {}", part.string());
				std::filesystem::remove(part, ec);
				ok = false;
				return;
			}
		}
		std::filesystem::rename(part, path, ec);
		if (ec) {
			log.warn("Cannot rename {}: {}", part.string(), ec.message());
			ok = false;
			return;
		}

		// Keep the server's modification time, like a browser download
		for (const auto &[name, value] : res.value().headers) {
			if (!boost::beast::iequals(name, "Last-Modified")) continue;
			if (auto modified = utils::parse_http_date(value)) {
				std::filesystem::last_write_time(
					path, std::chrono::file_clock::from_sys(*modified), ec);
				if (ec) log.debug("Cannot set mtime of {}", path.string());
			}
		}
		log.info("Saved cover: {}", path.string());
	};
	save(info.cover_front_url, "front");
	save(info.cover_back_url, "back");
	return ok;
}

Result<std::vector<SegmentDescriptor>> JobOrchestrator::fetch(
	const DownloadJob &job, const Plan &plan) {
	auto &log = m_reporter->log();
	const auto &config = job.config;
	log.info("Downloading segments {} - {}", plan.range.start, plan.range.end);

	std::vector<SegmentDescriptor> descriptors;
	for (auto type : {StreamType::video, StreamType::audio}) {
		if (!wants(config.target_stream, type)) continue;
		const auto &variant =
			type == StreamType::video ? plan.video : plan.audio;
		auto own = build_descriptors(variant, type, plan.range,
									 plan.manifest.total_segments,
									 plan.work_dir);
		m_reporter->segments_planned(type, plan.range.size());
		descriptors.insert(descriptors.end(),
						   std::make_move_iterator(own.begin()),
						   std::make_move_iterator(own.end()));
	}

	FetchOptions options;
	options.threads = config.threads;
	options.overwrite = config.overwrite;
	options.validate = config.validate_segments;
	options.max_retries = config.max_retries;
	options.retry_delay = config.retry_delay;
	options.backoff_factor = config.backoff_factor;

	SegmentFetcher fetcher(*m_services.segment_http,
						   config.validate_segments ? m_services.validator
													: nullptr,
						   *m_reporter, options);
	auto report = fetcher.fetch(descriptors);
	if (!report) return report.error();

	log.info("Segments: {} downloaded, {} found on disk",
			 report.value().downloaded, report.value().skipped);
	return std::move(report.value().completed);
}

Result<std::filesystem::path> JobOrchestrator::assemble(
	const DownloadJob &job, const Plan &plan,
	std::vector<SegmentDescriptor> segments) {
	const auto &config = job.config;

	AssemblyRequest request;
	request.segments = std::move(segments);
	request.range = plan.range;
	request.total_segments = plan.manifest.total_segments;
	request.target = config.target_stream;
	request.cleanup = config.cleanup;
	request.work_dir = plan.work_dir;
	request.output = plan.output;
	if (config.inject_metadata) {
		media::MuxMetadata metadata;
		metadata.title = title_stem(plan.manifest.info);
		if (job.scene) metadata.title += fmt::format(" Scene {}", *job.scene);
		metadata.chapters = scene_chapters(plan.manifest, plan.range);
		request.metadata = std::move(metadata);
	}

	AssemblyPipeline pipeline(*m_services.muxer, *m_reporter);
	return pipeline.run(request);
}

JobResult JobOrchestrator::run(const DownloadJob &job) {
	JobResult result;
	result.url = job.url;
	result.scene = job.scene;
	m_stage = JobStage::pending;

	auto fail = [&](std::error_code ec, std::string_view detail = {}) {
		result.status = JobStatus::failure;
		result.error = ec;
		result.reason = fmt::format("{} failed: {}", to_string(m_stage),
									detail.empty() ? ec.message()
												   : std::string(detail));
		if (m_reporter) {
			m_reporter->log().error("{}", result.reason);
		} else {
			spdlog::error("{}: {}", job.url, result.reason);
		}
	};

	transition(JobStage::resolving);
	if (!m_services.metadata_http || !m_services.segment_http ||
		!m_services.muxer || !m_services.make_reporter) {
		fail(make_error_code(errc::config_error), "incomplete job services");
		m_stage = JobStage::done;
		return result;
	}
	auto locator = parse_locator(job.url);
	if (!locator) {
		fail(locator.error());
		m_stage = JobStage::done;
		return result;
	}

	const auto name = job_name(locator.value().id, job.scene);
	const auto work_dir =
		job_work_dir(job.work_dir, locator.value().id, job.scene);
	std::error_code ec;
	std::filesystem::create_directories(work_dir, ec);
	if (ec) {
		fail(make_error_code(errc::file_write_failed),
			 fmt::format("cannot create {}: {}", work_dir.string(),
						 ec.message()));
		m_stage = JobStage::done;
		return result;
	}

	m_reporter = m_services.make_reporter(name, work_dir / (name + ".log"));
	m_reporter->log().info("Input URL: {}", job.url);
	m_reporter->log().info("Target stream: {}",
						   job.config.target_stream == TargetStream::both
							   ? "both"
							   : job.config.target_stream == TargetStream::audio
									 ? "audio"
									 : "video");
	if (job.config.cleanup == CleanupPolicy::aggressive) {
		m_reporter->log().info(
			"Aggressive cleanup enabled, segments will be deleted before "
			"stream muxing");
	}
	m_reporter->stage_changed(JobStage::resolving);

	try {
		auto plan = resolve(job, work_dir);
		if (!plan) {
			fail(plan.error());
		} else {
			transition(JobStage::fetching);
			auto segments = fetch(job, plan.value());
			if (!segments) {
				fail(segments.error());
			} else {
				transition(JobStage::assembling);
				auto output =
					assemble(job, plan.value(), std::move(segments.value()));
				if (!output) {
					fail(output.error());
				} else {
					result.output_path = output.value();
					if (plan.value().covers_failed) {
						result.status = JobStatus::partial_failure;
						result.reason = "cover download failed";
					} else {
						result.status = JobStatus::success;
					}
				}
			}
		}
	} catch (const std::exception &e) {
		fail(make_error_code(errc::unknown), e.what());
	}

	transition(JobStage::done);
	if (result.status != JobStatus::failure) {
		m_reporter->log().info("Done: {}", result.output_path.string());
	}
	m_reporter->close(job.config.keep_logs ||
					  result.status == JobStatus::failure);

	if (std::filesystem::is_empty(work_dir, ec) && !ec) {
		std::filesystem::remove(work_dir, ec);
	}
	return result;
}

}  // namespace scenedl
