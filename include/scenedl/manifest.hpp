#pragma once

#include <scenedl/scenedl_export.h>
#include <spdlog/logger.h>

#include <optional>
#include <string>
#include <string_view>

#include "http_client.hpp"
#include "result.hpp"
#include "types.hpp"
#include "validator.hpp"

namespace scenedl {

// https://<section>.<host>/<section>/movies/<id>/<slug>
struct SCENEDL_EXPORT TitleLocator {
	std::string origin;	 // scheme://host
	std::string section;
	std::string id;
};

SCENEDL_EXPORT Result<TitleLocator> parse_locator(std::string_view url);

// Remote segment name without extension: "vi_<id>", "a_<id>_<n>".
SCENEDL_EXPORT std::string segment_name(StreamType type,
										std::string_view variant_id,
										std::optional<int> index);

struct SCENEDL_EXPORT ResolverOptions {
	std::string scene_page_base = "https://m.aebn.net/movie/";
	// Probe audio representations for corruption. Not needed when only the
	// video stream is downloaded.
	bool probe_audio = true;
	// Client for the probe's segment downloads; the resolver's own client
	// when null.
	net::IHttpClient *segment_http = nullptr;
	// Job log; the default logger when null.
	spdlog::logger *log = nullptr;
	net::Headers headers;
};

// Browser-like headers and the age gate cookies the site expects.
SCENEDL_EXPORT net::Headers default_request_headers();

class SCENEDL_EXPORT ManifestResolver {
   public:
	// probe may be null; the highest variant then supplies the audio stream.
	ManifestResolver(net::IHttpClient &http, media::ISegmentValidator *probe,
					 ResolverOptions options = {});

	Result<Manifest> resolve(std::string_view url);

   private:
	Result<std::string> fetch_text(std::string_view url) {
		return fetch_text(url, m_http);
	}
	Result<std::string> fetch_text(std::string_view url,
								   net::IHttpClient &http);
	Result<std::string> fetch_manifest_url(const TitleLocator &locator);
	void attach_scene_timings(Manifest &manifest,
							  std::vector<SceneBoundary> &performer_scenes);
	Result<void> pick_audio(Manifest &manifest);

	net::IHttpClient &m_http;
	media::ISegmentValidator *m_probe;
	spdlog::logger &m_log;
	ResolverOptions m_options;
};

// Ladder entry with the given representation id, or nullptr.
SCENEDL_EXPORT const StreamVariant *find_variant(const Manifest &manifest,
												 std::string_view id);

}  // namespace scenedl
