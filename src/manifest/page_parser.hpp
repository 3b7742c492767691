#pragma once

#include <spdlog/spdlog.h>

#include <scenedl/result.hpp>
#include <scenedl/types.hpp>
#include <string_view>
#include <vector>

namespace scenedl::manifest {

struct TitlePage {
	TitleInfo info;
	// Performer lists of the scene strip, in document order. Timings come
	// from the scene page.
	std::vector<std::vector<std::string>> scene_performers;
};

// Title and running time are required; everything else is optional.
Result<TitlePage> parse_title_page(
	std::string_view html, spdlog::logger &log = *spdlog::default_logger_raw());

// One boundary per div.scroller, numbered from 1.
Result<std::vector<SceneBoundary>> parse_scene_page(
	std::string_view html, spdlog::logger &log = *spdlog::default_logger_raw());

}  // namespace scenedl::manifest
