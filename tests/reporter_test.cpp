#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <scenedl/reporter.hpp>
#include <sstream>

#include "fakes.hpp"

using namespace scenedl;
using namespace scenedl::testing;

TEST(LogReporterTest, LogFileRemovedUnlessKept) {
	TempDir dir;
	{
		LogReporter reporter("job", nullptr, dir / "job.log");
		reporter.log().info("hello");
		reporter.close(false);
	}
	EXPECT_FALSE(std::filesystem::exists(dir / "job.log"));

	{
		LogReporter reporter("job", nullptr, dir / "job.log");
		reporter.log().info("hello");
		reporter.close(true);
	}
	ASSERT_TRUE(std::filesystem::exists(dir / "job.log"));
	EXPECT_NE(read_file(dir / "job.log").find("|info|hello"), std::string::npos);
}

TEST(LogReporterTest, ProgressReportedPerTenth) {
	TempDir dir;
	std::ostringstream console;
	auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(console);
	sink->set_pattern("%v");
	sink->set_level(spdlog::level::info);

	LogReporter reporter("job", sink, dir / "job.log");
	reporter.segments_planned(StreamType::video, 20);
	SegmentDescriptor segment;
	segment.type = StreamType::video;
	for (int n = 0; n < 20; ++n) {
		segment.index = n;
		reporter.segment_completed(segment, true);
	}
	reporter.close(false);

	auto text = console.str();
	EXPECT_NE(text.find("video: 20 segments"), std::string::npos);
	EXPECT_NE(text.find("video download: 2/20 (10%)"), std::string::npos);
	EXPECT_NE(text.find("video download: 20/20 (100%)"), std::string::npos);
	EXPECT_EQ(text.find("video download: 3/20"), std::string::npos);
}
