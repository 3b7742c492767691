#include "page_parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/regex.hpp>

#include "markup.hpp"
#include "utils.hpp"

namespace scenedl::manifest {

namespace {

using Match = boost::match_results<std::string_view::const_iterator>;

std::optional<std::string> first_capture(std::string_view html,
										 const boost::regex &re) {
	Match m;
	if (!boost::regex_search(html.begin(), html.end(), m, re)) {
		return std::nullopt;
	}
	auto text = inner_text(m[1].str());
	if (text.empty()) return std::nullopt;
	return text;
}

// Text between the opening tag matched by `start` and the next `end_tag`.
std::string_view block(std::string_view html, const boost::regex &start,
					   std::string_view end_tag) {
	Match m;
	if (!boost::regex_search(html.begin(), html.end(), m, start)) return {};
	auto from = static_cast<std::size_t>(m[0].second - html.begin());
	auto to = html.find(end_tag, from);
	if (to == std::string_view::npos) to = html.size();
	return html.substr(from, to - from);
}

std::string cover_url(std::string_view html, const boost::regex &wrapper) {
	static const boost::regex img("<img\\b[^>]*>", boost::regex::icase);
	auto body = block(html, wrapper, "</div>");
	Match m;
	if (!boost::regex_search(body.begin(), body.end(), m, img)) return {};
	auto src = attribute(m[0].str(), "src");
	if (!src) return {};

	std::string url = decode_entities(*src);
	if (auto q = url.find('?'); q != std::string::npos) url.resize(q);
	if (url.rfind("//", 0) == 0) url = "https:" + url;
	return url;
}

void push_unique(std::vector<std::string> &names, std::string name) {
	if (name.empty()) return;
	if (std::find(names.begin(), names.end(), name) == names.end()) {
		names.push_back(std::move(name));
	}
}

}  // namespace

Result<TitlePage> parse_title_page(std::string_view html,
								   spdlog::logger &log) {
	static const boost::regex studio_re(
		"class=\"dts-studio-name-wrapper\"[^>]*>.*?<a\\b[^>]*>(.*?)</a>");
	static const boost::regex title_re(
		"class=\"dts-section-page-heading-title\"[^>]*>.*?<h1\\b[^>]*>(.*?)</"
		"h1>");
	static const boost::regex duration_re(
		"class=\"section-detail-list-item-duration\"[^>]*>(.*?)</");
	static const boost::regex stars_section_re(
		"<section\\b[^>]*id=\"dtsPanelStarsDetailMovie\"[^>]*>");
	static const boost::regex anchor_re("<a\\b[^>]*>");
	static const boost::regex scene_stars_re(
		"<li\\b[^>]*class=\"dts-scene-strip-stars\"[^>]*>(.*?)</li>");
	static const boost::regex anchor_text_re("<a\\b[^>]*>(.*?)</a>");
	static const boost::regex cover_front_re(
		"class=\"dts-movie-boxcover-front\"[^>]*>");
	static const boost::regex cover_back_re(
		"class=\"dts-movie-boxcover-back\"[^>]*>");

	TitlePage page;
	auto &info = page.info;

	auto title = first_capture(html, title_re);
	if (!title) {
		log.error("Title page has no title heading");
		return outcome::failure(errc::manifest_error);
	}
	info.title = std::move(*title);

	if (auto studio = first_capture(html, studio_re)) {
		// Commas in studio names break "studio - title" naming
		studio->erase(std::remove(studio->begin(), studio->end(), ','),
					  studio->end());
		info.studio = std::string(utils::trim(*studio));
	}

	// The first duration item is a label; the running time follows it
	bool have_duration = false;
	for (boost::regex_iterator<std::string_view::const_iterator> it(
			 html.begin(), html.end(), duration_re),
		 end;
		 it != end; ++it) {
		auto text = inner_text((*it)[1].str());
		if (text.find(':') == std::string::npos) continue;
		if (auto seconds = utils::duration_to_seconds(text)) {
			info.duration_seconds = seconds.value();
			have_duration = true;
			break;
		}
	}
	if (!have_duration || info.duration_seconds <= 0) {
		log.error("Title page has no running time");
		return outcome::failure(errc::manifest_error);
	}

	auto stars = block(html, stars_section_re, "</section>");
	for (boost::regex_iterator<std::string_view::const_iterator> it(
			 stars.begin(), stars.end(), anchor_re),
		 end;
		 it != end; ++it) {
		if (auto name = attribute((*it)[0].str(), "title")) {
			push_unique(info.performers,
						std::string(utils::trim(decode_entities(*name))));
		}
	}

	for (boost::regex_iterator<std::string_view::const_iterator> it(
			 html.begin(), html.end(), scene_stars_re),
		 end;
		 it != end; ++it) {
		std::vector<std::string> names;
		auto item = (*it)[1].str();
		for (boost::sregex_iterator a(item.begin(), item.end(), anchor_text_re),
			 a_end;
			 a != a_end; ++a) {
			push_unique(names, inner_text((*a)[1].str()));
		}
		page.scene_performers.push_back(std::move(names));
	}

	info.cover_front_url = cover_url(html, cover_front_re);
	info.cover_back_url = cover_url(html, cover_back_re);

	return page;
}

Result<std::vector<SceneBoundary>> parse_scene_page(std::string_view html,
													spdlog::logger &log) {
	static const boost::regex scroller_re(
		"<div\\b[^>]*class=\"scroller\"[^>]*>");

	std::vector<SceneBoundary> scenes;
	for (boost::regex_iterator<std::string_view::const_iterator> it(
			 html.begin(), html.end(), scroller_re),
		 end;
		 it != end; ++it) {
		auto tag = (*it)[0].str();
		auto start = attribute(tag, "data-time-start");
		auto duration = attribute(tag, "data-time-duration");
		if (!start || !duration) {
			log.debug("Scene marker without timings: {}", tag);
			return outcome::failure(errc::manifest_error);
		}
		auto start_s = utils::to_double(utils::trim(*start));
		auto duration_s = utils::to_double(utils::trim(*duration));
		if (!start_s || !duration_s || start_s.value() < 0 ||
			duration_s.value() < 0) {
			return outcome::failure(errc::manifest_error);
		}

		SceneBoundary scene;
		scene.number = static_cast<int>(scenes.size()) + 1;
		scene.start_seconds = start_s.value();
		scene.end_seconds = start_s.value() + duration_s.value();
		scenes.push_back(std::move(scene));
	}
	return scenes;
}

}  // namespace scenedl::manifest
