#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/regex.hpp>
#include <cmath>
#include <nlohmann/json.hpp>
#include <scenedl/manifest.hpp>

#include "manifest/mpd_parser.hpp"
#include "manifest/page_parser.hpp"
#include "utils.hpp"

namespace scenedl {

Result<TitleLocator> parse_locator(std::string_view url) {
	static const boost::regex locator_re(
		"^(https?://[^/?#]+)/([^/?#]+)/movies/(\\d+)(?:[/?#].*)?$");
	boost::match_results<std::string_view::const_iterator> m;
	if (!boost::regex_match(url.begin(), url.end(), m, locator_re)) {
		return outcome::failure(errc::invalid_url);
	}
	return TitleLocator{m[1].str(), m[2].str(), m[3].str()};
}

std::string segment_name(StreamType type, std::string_view variant_id,
						 std::optional<int> index) {
	if (!index) return fmt::format("{}i_{}", stream_prefix(type), variant_id);
	return fmt::format("{}_{}_{}", stream_prefix(type), variant_id, *index);
}

net::Headers default_request_headers() {
	return {
		{"User-Agent",
		 "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
		 "(KHTML, like Gecko) Chrome/130.0.0.0 Safari/537.36"},
		{"Cookie", "ageGated=; terms="},
	};
}

const StreamVariant *find_variant(const Manifest &manifest,
								  std::string_view id) {
	for (const auto &variant : manifest.ladder) {
		if (variant.id == id) return &variant;
	}
	return nullptr;
}

ManifestResolver::ManifestResolver(net::IHttpClient &http,
								   media::ISegmentValidator *probe,
								   ResolverOptions options)
	: m_http(http),
	  m_probe(probe),
	  m_log(options.log ? *options.log : *spdlog::default_logger_raw()),
	  m_options(std::move(options)) {}

Result<std::string> ManifestResolver::fetch_text(std::string_view url,
												  net::IHttpClient &http) {
	auto res = http.get(url, m_options.headers);
	if (!res) {
		m_log.debug("GET {} failed: {}", url, res.error().message());
		return res.error();
	}
	if (auto ec = net::status_to_error(res.value().status_code)) {
		m_log.debug("GET {} -> {}", url, res.value().status_code);
		return ec;
	}
	return std::move(res.value().body);
}

Result<std::string> ManifestResolver::fetch_manifest_url(
	const TitleLocator &locator) {
	auto deliver_url =
		fmt::format("{}/{}/deliver", locator.origin, locator.section);
	auto headers = m_options.headers;
	headers["Content-Type"] = "application/x-www-form-urlencoded";

	auto res = m_http.post(
		deliver_url,
		fmt::format("movieId={}&isPreview=true&format=DASH", locator.id),
		headers);
	if (!res) return res.error();
	if (auto ec = net::status_to_error(res.value().status_code)) {
		m_log.error("Manifest request rejected with HTTP {}",
					  res.value().status_code);
		return ec;
	}

	auto json = nlohmann::json::parse(res.value().body, nullptr, false);
	if (json.is_discarded()) {
		m_log.error("Manifest reply is not JSON");
		return outcome::failure(errc::json_parse_error);
	}
	auto url = utils::traverse_obj<std::string>(json, {"url"});
	if (!url || url->empty()) {
		m_log.error("Manifest reply carries no url");
		return outcome::failure(errc::manifest_error);
	}
	return std::move(*url);
}

void ManifestResolver::attach_scene_timings(
	Manifest &manifest, std::vector<SceneBoundary> &performer_scenes) {
	auto page = fetch_text(m_options.scene_page_base + manifest.info.id);
	if (!page) {
		m_log.warn("Scene page unavailable ({}), scene data skipped",
					 page.error().message());
		return;
	}
	auto timings = manifest::parse_scene_page(page.value(), m_log);
	if (!timings) {
		m_log.warn("Scene page unreadable, scene data skipped");
		return;
	}

	const double duration = static_cast<double>(manifest.info.duration_seconds);
	for (auto &scene : timings.value()) {
		scene.end_seconds = std::min(scene.end_seconds, duration);
		auto slot = static_cast<std::size_t>(scene.number - 1);
		if (slot < performer_scenes.size()) {
			scene.performers = std::move(performer_scenes[slot].performers);
		}
	}
	manifest.scenes = std::move(timings.value());
}

Result<void> ManifestResolver::pick_audio(Manifest &manifest) {
	if (!m_options.probe_audio || !m_probe) {
		manifest.audio_id = manifest.ladder.back().id;
		return outcome::success();
	}

	// Walk down from the best variant; the middle segment is representative
	const int probe_index = manifest.total_segments / 2;
	auto &segment_http =
		m_options.segment_http ? *m_options.segment_http : m_http;
	for (auto it = manifest.ladder.rbegin(); it != manifest.ladder.rend();
		 ++it) {
		auto init = fetch_text(it->audio_init_url, segment_http);
		if (!init) continue;
		auto data = fetch_text(
			it->audio_segment_urls.at(static_cast<std::size_t>(probe_index)),
			segment_http);
		if (!data) continue;

		if (m_probe->probe(init.value(), data.value())) {
			m_log.debug("Audio stream {} probed clean", it->id);
			manifest.audio_id = it->id;
			return outcome::success();
		}
		m_log.debug("Audio stream {} is corrupt, trying next", it->id);
	}
	m_log.error("No valid audio stream found");
	return outcome::failure(errc::manifest_error);
}

Result<Manifest> ManifestResolver::resolve(std::string_view url) {
	auto locator = parse_locator(url);
	if (!locator) {
		m_log.error("Not a title URL: {}", url);
		return locator.error();
	}

	// 1. Title page
	auto html = fetch_text(url);
	if (!html) {
		m_log.error("Title page unavailable: {}", html.error().message());
		return outcome::failure(errc::manifest_error);
	}
	auto page = manifest::parse_title_page(html.value(), m_log);
	if (!page) return page.error();

	Manifest manifest;
	manifest.info = std::move(page.value().info);
	manifest.info.id = locator.value().id;
	manifest.info.section = locator.value().section;

	std::vector<SceneBoundary> performer_scenes;
	for (auto &names : page.value().scene_performers) {
		SceneBoundary scene;
		scene.performers = std::move(names);
		performer_scenes.push_back(std::move(scene));
	}

	// 2. Deliver endpoint -> manifest URL
	auto manifest_url = fetch_manifest_url(locator.value());
	if (!manifest_url) return outcome::failure(errc::manifest_error);
	auto slash = manifest_url.value().rfind('/');
	if (slash == std::string::npos) return outcome::failure(errc::manifest_error);
	manifest.base_url = manifest_url.value().substr(0, slash);

	// 3. DASH manifest
	auto mpd_text = fetch_text(manifest_url.value());
	if (!mpd_text) {
		m_log.error("Manifest download failed: {}",
					  mpd_text.error().message());
		return outcome::failure(errc::manifest_error);
	}
	auto mpd = manifest::parse_mpd(mpd_text.value(), m_log);
	if (!mpd) return mpd.error();

	manifest.segment_duration = mpd.value().segment_duration;
	manifest.total_segments = static_cast<int>(
		std::ceil(static_cast<double>(manifest.info.duration_seconds) /
				  manifest.segment_duration));

	for (const auto &rep : mpd.value().representations) {
		StreamVariant variant;
		variant.id = rep.id;
		variant.height = rep.height;
		variant.bandwidth = rep.bandwidth;
		for (auto type : {StreamType::audio, StreamType::video}) {
			auto &init = type == StreamType::audio ? variant.audio_init_url
												   : variant.video_init_url;
			auto &urls = type == StreamType::audio ? variant.audio_segment_urls
												   : variant.video_segment_urls;
			init = fmt::format("{}/{}.mp4d", manifest.base_url,
							   segment_name(type, rep.id, std::nullopt));
			urls.reserve(static_cast<std::size_t>(manifest.total_segments) + 1);
			for (int n = 0; n <= manifest.total_segments; ++n) {
				urls.push_back(fmt::format("{}/{}.mp4d", manifest.base_url,
										   segment_name(type, rep.id, n)));
			}
		}
		manifest.ladder.push_back(std::move(variant));
	}
	m_log.debug("Ladder: {} variants, {} segments of {:.3f}s",
				  manifest.ladder.size(), manifest.total_segments,
				  manifest.segment_duration);

	// 4. Scene timings (optional)
	attach_scene_timings(manifest, performer_scenes);

	auto audio = pick_audio(manifest);
	if (!audio) return audio.error();

	return manifest;
}

}  // namespace scenedl
