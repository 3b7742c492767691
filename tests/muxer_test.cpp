#include <gtest/gtest.h>

#include <scenedl/muxer.hpp>
#include <scenedl/output_template.hpp>

#include "fakes.hpp"

using namespace scenedl;
using namespace scenedl::testing;

TEST(FfmpegArgumentsTest, VideoAudioAndMetadata) {
	media::MuxRequest req;
	req.video = "v.mp4";
	req.audio = "a.mp4";
	req.output = "out.mp4";
	req.metadata = media::MuxMetadata{"T", {}};

	auto args = media::ffmpeg_arguments(req, "meta.txt");
	std::vector<std::string> expected{
		"-y",	 "-loglevel",  "warning",	   "-i",			 "v.mp4",
		"-i",	 "a.mp4",	   "-map",		   "0:v:0",			 "-map",
		"1:a:0", "-f",		   "ffmetadata",   "-i",			 "meta.txt",
		"-map_metadata",	   "2",			   "-map_chapters",	 "2",
		"-c",	 "copy",	   "-f",		   "mp4",			 "out.mp4"};
	EXPECT_EQ(args, expected);
}

TEST(FfmpegArgumentsTest, AudioOnlyWithoutMetadata) {
	media::MuxRequest req;
	req.audio = "a.mp4";
	req.output = "out.mp4";

	auto args = media::ffmpeg_arguments(req, {});
	std::vector<std::string> expected{"-y",	   "-loglevel", "warning", "-i",
									  "a.mp4", "-map",		"0:a:0",   "-c",
									  "copy",  "-f",		"mp4",	   "out.mp4"};
	EXPECT_EQ(args, expected);
}

TEST(FfmetadataTest, ChaptersInMilliseconds) {
	media::MuxMetadata meta;
	meta.title = "A=B; #1";
	meta.chapters.push_back({0.0, 12.3456, "Scene 1: Ann"});
	meta.chapters.push_back({12.3456, 40.0, "Scene 2"});

	EXPECT_EQ(media::to_ffmetadata(meta),
			  ";FFMETADATA1\n"
			  "title=A\\=B\\; \\#1\n"
			  "\n[CHAPTER]\nTIMEBASE=1/1000\nSTART=0\nEND=12346\ntitle=Scene 1: Ann\n"
			  "\n[CHAPTER]\nTIMEBASE=1/1000\nSTART=12346\nEND=40000\ntitle=Scene 2\n");
}

TEST(FfmpegMuxerTest, LocateUnknownProgramIsConfigError) {
	auto res = media::FfmpegMuxer::locate("scenedl-no-such-program-xyz");
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error(), errc::config_error);

	res = media::FfmpegMuxer::locate("/nonexistent/dir/ffmpeg");
	EXPECT_EQ(res.error(), errc::config_error);
}

TEST(FfmpegMuxerTest, NoInputsIsAssemblyFailure) {
	TempDir dir;
	media::FfmpegMuxer muxer("/nonexistent/ffmpeg");
	media::MuxRequest req;
	req.output = dir / "out.mp4";
	EXPECT_EQ(muxer.mux(req).error(), errc::assembly_failed);
}

TEST(OutputTemplateTest, DurationString) {
	EXPECT_EQ(duration_string(40), "0:40");
	EXPECT_EQ(duration_string(754), "12:34");
	EXPECT_EQ(duration_string(3723), "1:02:03");
}

TEST(OutputTemplateTest, SanitizeFilename) {
	EXPECT_EQ(sanitize_filename("What? A/B: \"C\"|*"), "What AB C");
	EXPECT_EQ(sanitize_filename("line\nbreak\ttab"), "line break tab");
	EXPECT_EQ(sanitize_filename("  trailing dots... "), "trailing dots");
	EXPECT_EQ(sanitize_filename("???"), "title");
}

TEST(OutputTemplateTest, OutputFileName) {
	TitleInfo info;
	info.studio = "Big Studio";
	info.title = "Sample: Title";

	EXPECT_EQ(output_file_name(info, std::nullopt, TargetStream::both, 720, {}),
			  "Big Studio - Sample Title 720p.mp4");
	EXPECT_EQ(output_file_name(info, 2, TargetStream::video, 1080,
							   {"Ann A", "Bob B"}),
			  "[video] Big Studio - Sample Title Scene 2 Ann A, Bob B 1080p.mp4");
	EXPECT_EQ(output_file_name(info, 1, TargetStream::audio, 720, {}),
			  "[audio] Big Studio - Sample Title Scene 1.mp4");

	info.studio.clear();
	EXPECT_EQ(output_file_name(info, std::nullopt, TargetStream::both,
							   std::nullopt, {}),
			  "Sample Title.mp4");
}

TEST(OutputTemplateTest, JobNamesKeepScenesApart) {
	EXPECT_EQ(job_name("123", std::nullopt), "123");
	EXPECT_EQ(job_name("123", 4), "123_4");
	EXPECT_EQ(job_work_dir("/w", "123", std::nullopt),
			  std::filesystem::path("/w/123"));
	EXPECT_EQ(job_work_dir("/w", "123", 4),
			  std::filesystem::path("/w/123_scene4"));
}
