#include <gtest/gtest.h>

#include <algorithm>
#include <scenedl/orchestrator.hpp>

#include "fakes.hpp"
#include "test_data.hpp"

using namespace scenedl;
using namespace scenedl::testing;

namespace {

// Hands the orchestrator a reporter while the test keeps the recording.
class ForwardingReporter : public IJobReporter {
   public:
	explicit ForwardingReporter(RecordingReporter &target) : m_target(target) {}

	void stage_changed(JobStage stage) override { m_target.stage_changed(stage); }
	void segments_planned(StreamType type, int count) override {
		m_target.segments_planned(type, count);
	}
	void segment_completed(const SegmentDescriptor &segment,
						   bool downloaded) override {
		m_target.segment_completed(segment, downloaded);
	}
	void stream_concatenated(StreamType type,
							 const std::filesystem::path &artifact) override {
		m_target.stream_concatenated(type, artifact);
	}
	spdlog::logger &log() override { return m_target.log(); }
	void close(bool keep_log) override { m_target.close(keep_log); }

   private:
	RecordingReporter &m_target;
};

class JobOrchestratorTest : public ::testing::Test {
   protected:
	void SetUp() override { data::serve_title(http); }

	JobServices services(media::IMuxer &mux) {
		JobServices s;
		s.metadata_http = &http;
		s.segment_http = &http;
		s.validator = &validator;
		s.muxer = &mux;
		s.make_reporter = [this](const std::string &name,
								 const std::filesystem::path &log_path) {
			reporter_name = name;
			reporter_log = log_path;
			return std::make_unique<ForwardingReporter>(reporter);
		};
		return s;
	}

	DownloadJob job(std::optional<int> scene = std::nullopt) {
		DownloadJob j;
		j.url = data::kTitleUrl;
		j.scene = scene;
		j.output_dir = dir / "out";
		j.work_dir = dir / "work";
		j.config.threads = 2;
		j.config.retry_delay = std::chrono::milliseconds(1);
		return j;
	}

	int video_segment_requests() const {
		auto requests = http.requests();
		return static_cast<int>(std::count_if(
			requests.begin(), requests.end(), [](const auto &r) {
				return r.url.find("/v_") != std::string::npos ||
					   r.url.find("/vi_") != std::string::npos;
			}));
	}

	TempDir dir;
	FakeHttpClient http;
	FakeValidator validator;
	FakeMuxer muxer;
	RecordingReporter reporter;
	std::string reporter_name;
	std::filesystem::path reporter_log;
};

std::string stream_content(const std::string &p, const std::string &id,
						   int first, int last) {
	std::string out = data::segment_body(p + "i_" + id);
	for (int n = first; n <= last; ++n) {
		out += data::segment_body(p + "_" + id + "_" + std::to_string(n));
	}
	return out;
}

}  // namespace

TEST_F(JobOrchestratorTest, DownloadsFullTitle) {
	JobOrchestrator orchestrator(services(muxer));
	auto result = orchestrator.run(job());

	ASSERT_EQ(result.status, JobStatus::success) << result.reason;
	EXPECT_EQ(orchestrator.stage(), JobStage::done);
	EXPECT_EQ(result.output_path,
			  dir / "out" / "Big Studio - Sample & Title 720p.mp4");
	EXPECT_EQ(read_file(result.output_path),
			  stream_content("v", "r2", 0, 3) + stream_content("a", "r2", 0, 3));

	EXPECT_EQ(reporter.stages(),
			  (std::vector<JobStage>{JobStage::resolving, JobStage::fetching,
									 JobStage::assembling, JobStage::done}));
	EXPECT_EQ(reporter_name, "123");
	EXPECT_EQ(reporter_log, dir / "work" / "123" / "123.log");
	ASSERT_TRUE(reporter.closed_keep_log());
	EXPECT_FALSE(*reporter.closed_keep_log());
	EXPECT_FALSE(std::filesystem::exists(dir / "work" / "123"));

	auto mux = muxer.requests();
	ASSERT_EQ(mux.size(), 1u);
	ASSERT_TRUE(mux[0].metadata);
	EXPECT_EQ(mux[0].metadata->title, "Big Studio - Sample & Title");
	EXPECT_EQ(mux[0].metadata->chapters.size(), 2u);
}

TEST_F(JobOrchestratorTest, SceneJob) {
	JobOrchestrator orchestrator(services(muxer));
	auto result = orchestrator.run(job(2));

	ASSERT_EQ(result.status, JobStatus::success) << result.reason;
	EXPECT_EQ(result.output_path.filename(),
			  "Big Studio - Sample & Title Scene 2 720p.mp4");
	EXPECT_EQ(read_file(result.output_path),
			  stream_content("v", "r2", 2, 3) + stream_content("a", "r2", 2, 3));
	EXPECT_EQ(reporter_name, "123_2");
	EXPECT_EQ(http.requests_for(std::string(data::kCdn) + "v_r2_1.mp4d"), 0);

	auto mux = muxer.requests();
	ASSERT_EQ(mux.size(), 1u);
	ASSERT_TRUE(mux[0].metadata);
	EXPECT_EQ(mux[0].metadata->title, "Big Studio - Sample & Title Scene 2");
	ASSERT_EQ(mux[0].metadata->chapters.size(), 1u);
	EXPECT_EQ(mux[0].metadata->chapters[0].title, "Scene 2: Ann A, Bob B");
	EXPECT_DOUBLE_EQ(mux[0].metadata->chapters[0].start_seconds, 0.0);
	EXPECT_DOUBLE_EQ(mux[0].metadata->chapters[0].end_seconds, 20.0);
}

TEST_F(JobOrchestratorTest, PerformerNamesAndLowerResolution) {
	auto j = job(1);
	j.config.target_height = 600;
	j.config.include_performer_names = true;
	j.config.inject_metadata = false;

	JobOrchestrator orchestrator(services(muxer));
	auto result = orchestrator.run(j);
	ASSERT_EQ(result.status, JobStatus::success) << result.reason;
	EXPECT_EQ(result.output_path.filename(),
			  "Big Studio - Sample & Title Scene 1 Ann A 480p.mp4");
	EXPECT_EQ(read_file(result.output_path),
			  stream_content("v", "r1", 0, 2) + stream_content("a", "r2", 0, 2));
	EXPECT_FALSE(muxer.requests().at(0).metadata);
}

TEST_F(JobOrchestratorTest, ForcedMissingResolutionFailsBeforeFetching) {
	auto j = job();
	j.config.target_height = 1080;
	j.config.force_resolution = true;

	JobOrchestrator orchestrator(services(muxer));
	auto result = orchestrator.run(j);
	EXPECT_EQ(result.status, JobStatus::failure);
	EXPECT_EQ(result.error, errc::resolution_unavailable);
	EXPECT_EQ(result.reason.rfind("resolving failed", 0), 0u);
	EXPECT_EQ(video_segment_requests(), 0);
	EXPECT_TRUE(muxer.requests().empty());
	ASSERT_TRUE(reporter.closed_keep_log());
	EXPECT_TRUE(*reporter.closed_keep_log());
}

TEST_F(JobOrchestratorTest, ForbiddenSegmentFailsFetching) {
	http.fail(std::string(data::kCdn) + "v_r2_1.mp4d",
			  make_error_code(errc::forbidden));

	JobOrchestrator orchestrator(services(muxer));
	auto result = orchestrator.run(job());
	EXPECT_EQ(result.status, JobStatus::failure);
	EXPECT_EQ(result.error, errc::forbidden);
	EXPECT_EQ(result.reason.rfind("fetching failed", 0), 0u);
	EXPECT_TRUE(muxer.requests().empty());
	EXPECT_EQ(reporter.stages().back(), JobStage::done);
}

TEST_F(JobOrchestratorTest, MuxFailureFailsAssembling) {
	FakeMuxer failing(false);
	JobOrchestrator orchestrator(services(failing));
	auto result = orchestrator.run(job());
	EXPECT_EQ(result.status, JobStatus::failure);
	EXPECT_EQ(result.error, errc::muxer_failed);
	EXPECT_EQ(result.reason.rfind("assembling failed", 0), 0u);
	EXPECT_FALSE(std::filesystem::exists(
		dir / "out" / "Big Studio - Sample & Title 720p.mp4"));
	// Standard cleanup keeps the segments for a retry
	EXPECT_TRUE(std::filesystem::exists(dir / "work" / "123" / "v_r2_0.mp4"));
}

TEST_F(JobOrchestratorTest, ResumeSkipsSegmentsOnDisk) {
	auto j = job();
	j.config.cleanup = CleanupPolicy::keep;
	{
		JobOrchestrator first(services(muxer));
		ASSERT_TRUE(first.run(j).ok());
	}
	const int before = http.requests_for(std::string(data::kCdn) + "v_r2_2.mp4d");

	JobOrchestrator second(services(muxer));
	ASSERT_TRUE(second.run(j).ok());
	EXPECT_EQ(http.requests_for(std::string(data::kCdn) + "v_r2_2.mp4d"), before);
	EXPECT_GT(reporter.skipped(), 0);
}

TEST_F(JobOrchestratorTest, MissingCoverIsPartialFailure) {
	http.serve("https://pics.example/front.jpg", "jpeg");
	auto j = job();
	j.config.download_covers = true;

	JobOrchestrator orchestrator(services(muxer));
	auto result = orchestrator.run(j);
	EXPECT_EQ(result.status, JobStatus::partial_failure);
	EXPECT_EQ(result.reason, "cover download failed");
	EXPECT_TRUE(std::filesystem::exists(result.output_path));
	EXPECT_EQ(read_file(dir / "out" / "Big Studio - Sample & Title front.jpg"),
			  "jpeg");
}

TEST_F(JobOrchestratorTest, SegmentsBypassMetadataClient) {
	FakeHttpClient direct;
	data::serve_title(direct);
	auto s = services(muxer);
	s.segment_http = &direct;

	JobOrchestrator orchestrator(std::move(s));
	auto result = orchestrator.run(job());
	ASSERT_EQ(result.status, JobStatus::success) << result.reason;

	auto is_segment = [](const FakeHttpClient::Request &r) {
		return r.url.ends_with(".mp4d");
	};
	auto metadata = http.requests();
	EXPECT_TRUE(std::none_of(metadata.begin(), metadata.end(), is_segment));
	EXPECT_EQ(http.requests_for(data::kTitleUrl), 1);
	EXPECT_EQ(http.requests_for(data::kMpdUrl), 1);

	auto segments = direct.requests();
	ASSERT_FALSE(segments.empty());
	EXPECT_TRUE(std::all_of(segments.begin(), segments.end(), is_segment));
	EXPECT_EQ(direct.requests_for(std::string(data::kCdn) + "v_r2_3.mp4d"), 1);
}

TEST_F(JobOrchestratorTest, CoverKeepsServerModificationTime) {
	http.serve("https://pics.example/front.jpg", "front",
			   {{"last-modified", "Sun, 06 Nov 1994 08:49:37 GMT"}});
	http.serve("https://pics.example/back.jpg", "back");
	auto j = job();
	j.config.download_covers = true;

	JobOrchestrator orchestrator(services(muxer));
	ASSERT_EQ(orchestrator.run(j).status, JobStatus::success);

	auto front = dir / "out" / "Big Studio - Sample & Title front.jpg";
	EXPECT_EQ(read_file(front), "front");
	EXPECT_FALSE(std::filesystem::exists(front.string() + ".part"));
	auto mtime = std::chrono::file_clock::to_sys(
		std::filesystem::last_write_time(front));
	EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(
				  mtime.time_since_epoch())
				  .count(),
			  784111777);
	EXPECT_EQ(read_file(dir / "out" / "Big Studio - Sample & Title back.jpg"),
			  "back");
}

TEST_F(JobOrchestratorTest, InvalidUrlFails) {
	auto j = job();
	j.url = "https://straight.aebn.com/straight/stars/55";

	JobOrchestrator orchestrator(services(muxer));
	auto result = orchestrator.run(j);
	EXPECT_EQ(result.status, JobStatus::failure);
	EXPECT_EQ(result.error, errc::invalid_url);
	EXPECT_EQ(result.reason.rfind("resolving failed", 0), 0u);
	EXPECT_TRUE(reporter_name.empty());
}

TEST(SceneChaptersTest, ClipsToWindow) {
	Manifest m;
	m.info.duration_seconds = 400;
	m.segment_duration = 10.0;
	m.total_segments = 40;
	m.scenes = {{1, 0.0, 100.0, {}},
				{2, 100.0, 250.0, {"Ann A"}},
				{3, 250.0, 400.0, {}}};

	auto chapters = scene_chapters(m, {9, 26});
	ASSERT_EQ(chapters.size(), 3u);
	EXPECT_EQ(chapters[0].title, "Scene 1");
	EXPECT_DOUBLE_EQ(chapters[0].start_seconds, 0.0);
	EXPECT_DOUBLE_EQ(chapters[0].end_seconds, 10.0);
	EXPECT_EQ(chapters[1].title, "Scene 2: Ann A");
	EXPECT_DOUBLE_EQ(chapters[1].start_seconds, 10.0);
	EXPECT_DOUBLE_EQ(chapters[1].end_seconds, 160.0);
	EXPECT_DOUBLE_EQ(chapters[2].start_seconds, 160.0);
	EXPECT_DOUBLE_EQ(chapters[2].end_seconds, 180.0);

	EXPECT_EQ(scene_chapters(m, {12, 20}).size(), 1u);
}
