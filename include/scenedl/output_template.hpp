#pragma once

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace scenedl {

namespace detail {
constexpr int SECONDS_PER_HOUR = 3600;
constexpr int SECONDS_PER_MINUTE = 60;
constexpr std::string_view REMOVED_CHARS = "#?!:<>\"/\\|*";
}  // namespace detail

/// "H:MM:SS" for durations of an hour or more, "M:SS" otherwise.
inline std::string duration_string(long long seconds) {
	const auto hours = seconds / detail::SECONDS_PER_HOUR;
	const auto minutes =
		(seconds % detail::SECONDS_PER_HOUR) / detail::SECONDS_PER_MINUTE;
	const auto secs = seconds % detail::SECONDS_PER_MINUTE;
	if (hours > 0) return fmt::format("{}:{:02}:{:02}", hours, minutes, secs);
	return fmt::format("{}:{:02}", minutes, secs);
}

/// Sanitize filename - drop characters that are reserved on common
/// filesystems, turn control whitespace into spaces
inline std::string sanitize_filename(std::string_view filename) {
	std::string result;
	result.reserve(filename.size());

	for (char c : filename) {
		if (detail::REMOVED_CHARS.find(c) != std::string_view::npos ||
			c == '\0') {
			continue;
		}
		if (c == '\n' || c == '\r' || c == '\t') {
			result += ' ';
		} else {
			result += c;
		}
	}

	// Trim trailing spaces and dots (Windows issues)
	while (!result.empty() && (result.back() == ' ' || result.back() == '.')) {
		result.pop_back();
	}
	while (!result.empty() && result.front() == ' ') result.erase(0, 1);

	if (result.empty()) { result = "title"; }

	return result;
}

/// "<studio> - <title>", the common stem of output and cover names.
inline std::string title_stem(const TitleInfo &info) {
	if (info.studio.empty()) return info.title;
	return fmt::format("{} - {}", info.studio, info.title);
}

/// [<target>] <studio> - <title>[ Scene N][ <performers>][ <height>p].mp4
inline std::string output_file_name(const TitleInfo &info,
									std::optional<int> scene,
									TargetStream target,
									std::optional<int> height,
									const std::vector<std::string> &performers) {
	std::vector<std::string> parts;
	if (target != TargetStream::both) {
		parts.push_back(fmt::format(
			"[{}]", target == TargetStream::audio ? "audio" : "video"));
	}
	parts.push_back(title_stem(info));
	if (scene) parts.push_back(fmt::format("Scene {}", *scene));
	if (!performers.empty()) {
		parts.push_back(fmt::format("{}", fmt::join(performers, ", ")));
	}
	if (height && target != TargetStream::audio) {
		parts.push_back(fmt::format("{}p", *height));
	}
	return sanitize_filename(fmt::format("{}", fmt::join(parts, " "))) + ".mp4";
}

/// Logger and log file name: "<id>" or "<id>_<scene>".
inline std::string job_name(std::string_view title_id,
							std::optional<int> scene) {
	if (scene) return fmt::format("{}_{}", title_id, *scene);
	return std::string(title_id);
}

/// Per-job working directory; full-title and scene jobs never share one.
inline std::filesystem::path job_work_dir(const std::filesystem::path &root,
										  std::string_view title_id,
										  std::optional<int> scene) {
	if (scene) return root / fmt::format("{}_scene{}", title_id, *scene);
	return root / std::string(title_id);
}

}  // namespace scenedl
