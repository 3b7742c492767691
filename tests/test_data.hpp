#pragma once

#include <string>

#include "fakes.hpp"

// A 40 s title with two 20 s scenes, 10 s segments (numbers 0..4) and two
// representations, r1 (480p) and r2 (720p).
namespace scenedl::testing::data {

inline constexpr const char *kTitleUrl =
	"https://straight.aebn.com/straight/movies/123/sample-title";
inline constexpr const char *kDeliverUrl =
	"https://straight.aebn.com/straight/deliver";
inline constexpr const char *kMpdUrl = "https://cdn.example/123/manifest.mpd";
inline constexpr const char *kScenePageUrl = "https://m.aebn.net/movie/123";
inline constexpr const char *kCdn = "https://cdn.example/123/";

inline constexpr const char *kTitlePage = R"(<html><body>
<div class="dts-studio-name-wrapper">Studio: <a href="/studios/9">Big, Studio</a></div>
<div class="dts-section-page-heading-title"><h1>Sample &amp; Title</h1></div>
<ul>
  <li><span class="section-detail-list-item-duration">Running Time</span>
      <span class="section-detail-list-item-duration">0:00:40</span></li>
</ul>
<section class="dts-panel" id="dtsPanelStarsDetailMovie">
  <a href="/stars/1" title="Ann A"><img src="a.jpg"></a>
  <a href="/stars/2" title="Bob B"><img src="b.jpg"></a>
</section>
<ul class="dts-scene-strip">
  <li class="dts-scene-strip-stars"><a href="/stars/1">Ann A</a></li>
  <li class="dts-scene-strip-stars"><a href="/stars/1">Ann A</a>, <a href="/stars/2">Bob B</a></li>
</ul>
<div class="dts-movie-boxcover-front"><img src="//pics.example/front.jpg?w=300" alt=""></div>
<div class="dts-movie-boxcover-back"><img src="//pics.example/back.jpg?w=300" alt=""></div>
</body></html>)";

inline constexpr const char *kScenePage = R"(<html><body>
<div class="scroller" data-time-start="0" data-time-duration="20"></div>
<div class="scroller" data-time-start="20" data-time-duration="20"></div>
</body></html>)";

inline constexpr const char *kMpd = R"(<?xml version="1.0"?>
<MPD xmlns="urn:mpeg:dash:schema:mpd:2011">
 <Period>
  <AdaptationSet mimeType="audio/mp4">
   <SegmentTemplate timescale="48000" duration="480000"/>
   <Representation id="r1" bandwidth="128000"/>
  </AdaptationSet>
  <AdaptationSet mimeType="video/mp4" segmentAlignment="true">
   <SegmentTemplate timescale="1000" duration="10000" media="$RepresentationID$_$Number$.mp4d"/>
   <Representation id="r1" width="854" height="480" bandwidth="1000000"/>
   <Representation id="r2" width="1280" height="720" bandwidth="2000000"/>
  </AdaptationSet>
 </Period>
</MPD>)";

// Body of a segment: "<name>" so concatenation order is visible.
inline std::string segment_body(const std::string &name) { return name + ";"; }

// Everything except data segment 4, which does not exist upstream.
inline void serve_title(FakeHttpClient &http) {
	http.serve(kTitleUrl, kTitlePage);
	http.serve(kDeliverUrl, R"({"url":"https://cdn.example/123/manifest.mpd"})");
	http.serve(kMpdUrl, kMpd);
	http.serve(kScenePageUrl, kScenePage);
	for (std::string id : {"r1", "r2"}) {
		for (std::string p : {"a", "v"}) {
			auto init = p + "i_" + id;
			http.serve(kCdn + init + ".mp4d", segment_body(init));
			for (int n = 0; n < 4; ++n) {
				auto name = p + "_" + id + "_" + std::to_string(n);
				http.serve(kCdn + name + ".mp4d", segment_body(name));
			}
		}
	}
}

}  // namespace scenedl::testing::data
