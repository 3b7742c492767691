#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <scenedl/reporter.hpp>

namespace scenedl {

LogReporter::LogReporter(std::string name, spdlog::sink_ptr console,
						 std::filesystem::path log_path)
	: m_log_path(std::move(log_path)) {
	std::vector<spdlog::sink_ptr> sinks;
	if (console) sinks.push_back(console);

	try {
		auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
			m_log_path.string(), true);
		file_sink->set_level(spdlog::level::debug);
		file_sink->set_pattern("%H:%M:%S|%l|%v");
		sinks.push_back(std::move(file_sink));
		m_has_file_sink = true;
	} catch (const spdlog::spdlog_ex &e) {
		spdlog::warn("Job log {} unavailable: {}", m_log_path.string(),
					 e.what());
		m_log_path.clear();
	}

	m_logger = std::make_shared<spdlog::logger>(
		std::move(name), sinks.begin(), sinks.end());
	m_logger->set_level(spdlog::level::debug);
	m_logger->flush_on(spdlog::level::warn);
}

LogReporter::~LogReporter() {
	if (!m_closed) close(true);
}

void LogReporter::stage_changed(JobStage stage) {
	m_logger->debug("Stage: {}", to_string(stage));
}

void LogReporter::segments_planned(StreamType type, int count) {
	auto &p = progress(type);
	p.planned.store(count);
	p.done.store(0);
	p.last_decile.store(0);
	m_logger->info("{}: {} segments", to_string(type), count);
}

void LogReporter::segment_completed(const SegmentDescriptor &segment,
									bool downloaded) {
	m_logger->debug("{} {}", segment.name(),
					downloaded ? "saved to disk" : "found on disk");
	if (segment.init) return;

	auto &p = progress(segment.type);
	const int done = p.done.fetch_add(1) + 1;
	const int planned = p.planned.load();
	if (planned <= 0) return;

	// One info line per completed tenth
	int decile = done * 10 / planned;
	int last = p.last_decile.load();
	while (decile > last) {
		if (p.last_decile.compare_exchange_weak(last, decile)) {
			m_logger->info("{} download: {}/{} ({}%)", to_string(segment.type),
						   done, planned, decile * 10);
			break;
		}
	}
}

void LogReporter::stream_concatenated(StreamType type,
									  const std::filesystem::path &artifact) {
	m_logger->info("{} stream concatenated: {}", to_string(type),
				   artifact.filename().string());
}

void LogReporter::close(bool keep_log) {
	m_closed = true;
	m_logger->flush();
	// Drop the file sink so the handle is closed before deleting
	if (m_has_file_sink) {
		m_logger->sinks().pop_back();
		m_has_file_sink = false;
	}

	if (!keep_log && !m_log_path.empty()) {
		std::error_code ec;
		std::filesystem::remove(m_log_path, ec);
		if (ec) {
			spdlog::debug("Could not delete {}: {}", m_log_path.string(),
						  ec.message());
		}
	}
}

}  // namespace scenedl
