#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <boost/process/search_path.hpp>
#include <boost/scope_exit.hpp>
#include <cmath>
#include <fstream>
#include <scenedl/muxer.hpp>

namespace bp = boost::process;

namespace scenedl::media {

namespace {

// '=', ';', '#', '\' and newlines are special in FFMETADATA values
std::string escape_metadata(std::string_view value) {
	std::string out;
	out.reserve(value.size());
	for (char c : value) {
		if (c == '=' || c == ';' || c == '#' || c == '\\' || c == '\n') {
			out += '\\';
		}
		out += c;
	}
	return out;
}

long long to_millis(double seconds) {
	return std::llround(seconds * 1000.0);
}

}  // namespace

std::string to_ffmetadata(const MuxMetadata &metadata) {
	std::string doc = ";FFMETADATA1\n";
	if (!metadata.title.empty()) {
		doc += fmt::format("title={}\n", escape_metadata(metadata.title));
	}
	for (const auto &chapter : metadata.chapters) {
		doc += fmt::format(
			"\n[CHAPTER]\nTIMEBASE=1/1000\nSTART={}\nEND={}\ntitle={}\n",
			to_millis(chapter.start_seconds), to_millis(chapter.end_seconds),
			escape_metadata(chapter.title));
	}
	return doc;
}

std::vector<std::string> ffmpeg_arguments(
	const MuxRequest &request, const std::filesystem::path &metadata_file) {
	std::vector<std::string> args{"-y", "-loglevel", "warning"};
	std::vector<std::string> maps;
	int input = 0;

	if (request.video) {
		args.insert(args.end(), {"-i", request.video->string()});
		maps.insert(maps.end(), {"-map", fmt::format("{}:v:0", input++)});
	}
	if (request.audio) {
		args.insert(args.end(), {"-i", request.audio->string()});
		maps.insert(maps.end(), {"-map", fmt::format("{}:a:0", input++)});
	}
	args.insert(args.end(), maps.begin(), maps.end());

	if (request.metadata) {
		args.insert(args.end(),
					{"-f", "ffmetadata", "-i", metadata_file.string()});
		auto index = std::to_string(input++);
		args.insert(args.end(),
					{"-map_metadata", index, "-map_chapters", index});
	}

	args.insert(args.end(), {"-c", "copy", "-f", "mp4", request.output.string()});
	return args;
}

FfmpegMuxer::FfmpegMuxer(std::filesystem::path executable)
	: m_executable(std::move(executable)) {}

Result<std::filesystem::path> FfmpegMuxer::locate(std::string_view program) {
	std::filesystem::path candidate{std::string(program)};
	if (candidate.has_parent_path()) {
		std::error_code ec;
		if (std::filesystem::is_regular_file(candidate, ec)) return candidate;
		return outcome::failure(errc::config_error);
	}
	auto found = bp::search_path(std::string(program));
	if (found.empty()) return outcome::failure(errc::config_error);
	return std::filesystem::path(found.string());
}

Result<void> FfmpegMuxer::mux(const MuxRequest &request) {
	if (!request.video && !request.audio) {
		return outcome::failure(errc::assembly_failed);
	}
	auto &log = request.log ? *request.log : *spdlog::default_logger_raw();

	std::filesystem::path metadata_file;
	if (request.metadata) {
		metadata_file = request.output;
		metadata_file += ".ffmeta";
		std::ofstream meta(metadata_file, std::ios::binary | std::ios::trunc);
		meta << to_ffmetadata(*request.metadata);
		if (!meta) {
			log.error("Cannot write {}", metadata_file.string());
			return outcome::failure(errc::file_write_failed);
		}
	}
	BOOST_SCOPE_EXIT_ALL(&metadata_file) {
		if (!metadata_file.empty()) {
			std::error_code ec;
			std::filesystem::remove(metadata_file, ec);
		}
	};

	auto args = ffmpeg_arguments(request, metadata_file);
	log.debug("{} {}", m_executable.string(), fmt::join(args, " "));

	int exit_code = -1;
	try {
		bp::ipstream err;
		bp::child ffmpeg(bp::exe = m_executable.string(), bp::args = args,
						 bp::std_in < bp::null, bp::std_out > bp::null,
						 bp::std_err > err);

		std::string line;
		while (std::getline(err, line)) {
			if (!line.empty()) log.debug("ffmpeg: {}", line);
		}
		ffmpeg.wait();
		exit_code = ffmpeg.exit_code();
	} catch (const bp::process_error &e) {
		log.error("Cannot run {}: {}", m_executable.string(), e.what());
		return outcome::failure(errc::muxer_failed);
	}

	if (exit_code != 0) {
		log.error("ffmpeg exited with status {}", exit_code);
		return outcome::failure(errc::muxer_failed);
	}
	return outcome::success();
}

}  // namespace scenedl::media
