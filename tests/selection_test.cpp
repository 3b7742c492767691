#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <scenedl/segmenter.hpp>
#include <scenedl/selector.hpp>
#include <sstream>

using namespace scenedl;

namespace {

std::vector<StreamVariant> ladder_of(std::initializer_list<int> heights) {
	std::vector<StreamVariant> ladder;
	for (int h : heights) {
		StreamVariant v;
		v.id = "r" + std::to_string(h);
		v.height = h;
		ladder.push_back(v);
	}
	return ladder;
}

// Three scenes over a 400 s title cut into 10 s segments.
Manifest three_scene_manifest() {
	Manifest m;
	m.info.duration_seconds = 400;
	m.segment_duration = 10.0;
	m.total_segments = 40;
	m.scenes = {{1, 0.0, 100.0, {}}, {2, 100.0, 250.0, {}}, {3, 250.0, 400.0, {}}};
	return m;
}

}  // namespace

TEST(ResolutionSelectorTest, ExactMatch) {
	auto v = select_variant(ladder_of({240, 480, 720, 1080}), 720, false);
	ASSERT_TRUE(v);
	EXPECT_EQ(v.value().height, 720);
}

TEST(ResolutionSelectorTest, NearestLower) {
	auto v = select_variant(ladder_of({240, 480, 1080}), 720, false);
	ASSERT_TRUE(v);
	EXPECT_EQ(v.value().height, 480);
}

TEST(ResolutionSelectorTest, LogsToGivenLogger) {
	std::ostringstream out;
	auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
	sink->set_pattern("%v");
	spdlog::logger job_log("job", sink);

	EXPECT_EQ(
		select_variant(ladder_of({240, 480, 1080}), 720, false, job_log).value().height,
		480);
	EXPECT_EQ(select_variant(ladder_of({240, 480}), 720, true, job_log).error(),
			  errc::resolution_unavailable);
	EXPECT_EQ(out.str(),
			  "720p not offered, using 480p\nResolution 720p not offered\n");
}

TEST(ResolutionSelectorTest, ForcedMissingHeightIsUnavailable) {
	auto v = select_variant(ladder_of({240, 480, 1080}), 720, true);
	ASSERT_FALSE(v);
	EXPECT_EQ(v.error(), errc::resolution_unavailable);
}

TEST(ResolutionSelectorTest, ForcedExactHeight) {
	auto v = select_variant(ladder_of({240, 480, 1080}), 1080, true);
	ASSERT_TRUE(v);
	EXPECT_EQ(v.value().height, 1080);
}

TEST(ResolutionSelectorTest, ZeroPicksLowest) {
	auto ladder = ladder_of({720, 240, 1080});
	EXPECT_EQ(select_variant(ladder, 0, false).value().height, 240);
	EXPECT_EQ(select_variant(ladder, 0, true).value().height, 240);
}

TEST(ResolutionSelectorTest, UnspecifiedPicksHighest) {
	auto ladder = ladder_of({720, 240, 1080, 480});
	EXPECT_EQ(select_variant(ladder, std::nullopt, false).value().height, 1080);
}

TEST(ResolutionSelectorTest, RequestAboveLadderUsesHighestBelow) {
	auto v = select_variant(ladder_of({240, 480}), 2160, false);
	EXPECT_EQ(v.value().height, 480);
}

TEST(ResolutionSelectorTest, RequestBelowLadderFallsBackToLowest) {
	auto v = select_variant(ladder_of({480, 720}), 360, false);
	EXPECT_EQ(v.value().height, 480);
}

TEST(ResolutionSelectorTest, EmptyLadder) {
	auto v = select_variant({}, 720, false);
	ASSERT_FALSE(v);
	EXPECT_EQ(v.error(), errc::resolution_unavailable);
}

TEST(SceneSegmenterTest, PaddedSceneRange) {
	auto m = three_scene_manifest();
	RangeRequest req;
	req.scene = 2;
	req.padding_seconds = 5.0;
	auto range = compute_range(m, req);
	ASSERT_TRUE(range);
	EXPECT_EQ(range.value(), (SegmentRange{9, 26}));
}

TEST(SceneSegmenterTest, PaddingClampedToTitle) {
	auto m = three_scene_manifest();
	RangeRequest req;
	req.scene = 1;
	req.padding_seconds = 30.0;
	EXPECT_EQ(compute_range(m, req).value().start, 0);

	req.scene = 3;
	EXPECT_EQ(compute_range(m, req).value().end, 40);
}

TEST(SceneSegmenterTest, FullTitleWithoutScene) {
	auto m = three_scene_manifest();
	EXPECT_EQ(compute_range(m, {}).value(), (SegmentRange{0, 40}));
}

TEST(SceneSegmenterTest, PaddingIgnoredWithoutScene) {
	auto m = three_scene_manifest();
	RangeRequest req;
	req.padding_seconds = 50.0;
	EXPECT_EQ(compute_range(m, req).value(), (SegmentRange{0, 40}));
}

TEST(SceneSegmenterTest, OverridesWin) {
	auto m = three_scene_manifest();
	RangeRequest req;
	req.scene = 2;
	req.start_segment = 12;
	auto range = compute_range(m, req);
	EXPECT_EQ(range.value(), (SegmentRange{12, 25}));

	req.end_segment = 14;
	EXPECT_EQ(compute_range(m, req).value(), (SegmentRange{12, 14}));
}

TEST(SceneSegmenterTest, EndClampedToTotal) {
	auto m = three_scene_manifest();
	RangeRequest req;
	req.end_segment = 500;
	EXPECT_EQ(compute_range(m, req).value().end, 40);
}

TEST(SceneSegmenterTest, StartAfterEndIsConfigError) {
	auto m = three_scene_manifest();
	RangeRequest req;
	req.start_segment = 30;
	req.end_segment = 20;
	auto range = compute_range(m, req);
	ASSERT_FALSE(range);
	EXPECT_EQ(range.error(), errc::config_error);
}

TEST(SceneSegmenterTest, UnknownSceneIsConfigError) {
	auto m = three_scene_manifest();
	RangeRequest req;
	req.scene = 4;
	EXPECT_EQ(compute_range(m, req).error(), errc::config_error);
}

TEST(SceneSegmenterTest, DescriptorsStartWithInit) {
	StreamVariant v;
	v.id = "720p";
	v.video_init_url = "https://cdn/vi_720p.mp4d";
	for (int n = 0; n <= 5; ++n) {
		v.video_segment_urls.push_back("https://cdn/v_720p_" + std::to_string(n) +
									   ".mp4d");
	}

	auto d = build_descriptors(v, StreamType::video, {3, 5}, 5, "/work");
	ASSERT_EQ(d.size(), 4u);
	EXPECT_TRUE(d[0].init);
	EXPECT_EQ(d[0].url, "https://cdn/vi_720p.mp4d");
	EXPECT_EQ(d[0].path, std::filesystem::path("/work/vi_720p.mp4"));
	EXPECT_EQ(d[1].index, 3);
	EXPECT_EQ(d[1].url, "https://cdn/v_720p_3.mp4d");
	EXPECT_EQ(d[1].path, std::filesystem::path("/work/v_720p_3.mp4"));
	EXPECT_EQ(d[1].name(), "v_720p_3");
	EXPECT_FALSE(d[2].may_be_absent);
	EXPECT_TRUE(d[3].may_be_absent);
}
