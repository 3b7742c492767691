#include <gtest/gtest.h>

#include <scenedl/fetcher.hpp>
#include <stdexcept>

#include "fakes.hpp"

using namespace scenedl;
using namespace scenedl::testing;

namespace {

const std::string kCdn = "https://cdn.example/9/";

class SegmentFetcherTest : public ::testing::Test {
   protected:
	// Init segment plus data segments [0, count) of the video stream; the
	// last one may be flagged as possibly absent.
	std::vector<SegmentDescriptor> descriptors(int count,
											   bool last_may_be_absent = false) {
		std::vector<SegmentDescriptor> out;
		SegmentDescriptor init;
		init.type = StreamType::video;
		init.init = true;
		init.url = kCdn + "vi_r.mp4d";
		init.path = dir / "vi_r.mp4";
		http.serve(init.url, "init");
		out.push_back(init);

		for (int n = 0; n < count; ++n) {
			SegmentDescriptor d;
			d.type = StreamType::video;
			d.index = n;
			d.url = kCdn + "v_r_" + std::to_string(n) + ".mp4d";
			d.path = dir / ("v_r_" + std::to_string(n) + ".mp4");
			d.may_be_absent = last_may_be_absent && n == count - 1;
			http.serve(d.url, "data" + std::to_string(n));
			out.push_back(d);
		}
		return out;
	}

	FetchOptions options() {
		FetchOptions o;
		o.threads = 3;
		o.retry_delay = std::chrono::milliseconds(1);
		o.backoff_factor = 1.0;
		return o;
	}

	TempDir dir;
	FakeHttpClient http;
	FakeValidator validator;
	RecordingReporter reporter;
};

class ThrowingHttpClient : public FakeHttpClient {
   public:
	explicit ThrowingHttpClient(std::string url) : m_url(std::move(url)) {}

	Result<void> download_file(std::string_view url,
							   const std::filesystem::path &output_path,
							   const net::Headers &headers,
							   net::ProgressCallback progress_cb) override {
		if (url == m_url) throw std::runtime_error("disk went away");
		return FakeHttpClient::download_file(url, output_path, headers,
											 std::move(progress_cb));
	}

   private:
	std::string m_url;
};

}  // namespace

TEST_F(SegmentFetcherTest, DownloadsEverySegment) {
	auto segs = descriptors(6);
	SegmentFetcher fetcher(http, nullptr, reporter, options());
	auto report = fetcher.fetch(segs);
	ASSERT_TRUE(report);
	EXPECT_EQ(report.value().downloaded, 7);
	EXPECT_EQ(report.value().skipped, 0);
	EXPECT_EQ(report.value().completed.size(), 7u);
	EXPECT_EQ(read_file(segs[3].path), "data2");
	EXPECT_EQ(reporter.downloaded(), 7);
}

TEST_F(SegmentFetcherTest, CompletedListIsOrdered) {
	auto segs = descriptors(12);
	std::reverse(segs.begin(), segs.end());
	SegmentFetcher fetcher(http, nullptr, reporter, options());
	auto report = fetcher.fetch(segs);
	ASSERT_TRUE(report);
	const auto &done = report.value().completed;
	ASSERT_EQ(done.size(), 13u);
	EXPECT_TRUE(done.front().init);
	for (std::size_t i = 1; i < done.size(); ++i) {
		EXPECT_EQ(done[i].index, static_cast<int>(i) - 1);
	}
}

TEST_F(SegmentFetcherTest, ValidExistingFileIsNotFetchedAgain) {
	auto segs = descriptors(3);
	write_file(segs[2].path, "already here");

	SegmentFetcher fetcher(http, nullptr, reporter, options());
	auto report = fetcher.fetch(segs);
	ASSERT_TRUE(report);
	EXPECT_EQ(http.requests_for(segs[2].url), 0);
	EXPECT_EQ(report.value().skipped, 1);
	EXPECT_EQ(read_file(segs[2].path), "already here");
}

TEST_F(SegmentFetcherTest, OverwriteFetchesExistingFile) {
	auto segs = descriptors(3);
	write_file(segs[2].path, "already here");

	auto o = options();
	o.overwrite = true;
	SegmentFetcher fetcher(http, nullptr, reporter, o);
	auto report = fetcher.fetch(segs);
	ASSERT_TRUE(report);
	EXPECT_EQ(http.requests_for(segs[2].url), 1);
	EXPECT_EQ(report.value().skipped, 0);
	EXPECT_EQ(read_file(segs[2].path), "data1");
}

TEST_F(SegmentFetcherTest, EmptyExistingFileIsFetchedAgain) {
	auto segs = descriptors(2);
	write_file(segs[1].path, "");

	SegmentFetcher fetcher(http, nullptr, reporter, options());
	ASSERT_TRUE(fetcher.fetch(segs));
	EXPECT_EQ(http.requests_for(segs[1].url), 1);
	EXPECT_EQ(read_file(segs[1].path), "data0");
}

TEST_F(SegmentFetcherTest, CorruptExistingFileIsFetchedAgain) {
	auto segs = descriptors(2);
	write_file(segs[0].path, "init");
	write_file(segs[1].path, "garbage");
	validator.reject_content("garbage");

	auto o = options();
	o.validate = true;
	SegmentFetcher fetcher(http, &validator, reporter, o);
	auto report = fetcher.fetch(segs);
	ASSERT_TRUE(report);
	EXPECT_EQ(http.requests_for(segs[1].url), 1);
	EXPECT_EQ(read_file(segs[1].path), "data0");
	EXPECT_EQ(report.value().skipped, 1);  // the init segment
}

TEST_F(SegmentFetcherTest, TransientErrorsAreRetried) {
	auto segs = descriptors(2);
	http.fail(segs[2].url, make_error_code(errc::server_error), 2);

	SegmentFetcher fetcher(http, nullptr, reporter, options());
	auto report = fetcher.fetch(segs);
	ASSERT_TRUE(report);
	EXPECT_EQ(http.requests_for(segs[2].url), 3);
}

TEST_F(SegmentFetcherTest, ExhaustedRetriesFailTheJob) {
	auto segs = descriptors(2);
	http.fail(segs[1].url, make_error_code(errc::timeout));

	auto o = options();
	o.max_retries = 2;
	SegmentFetcher fetcher(http, nullptr, reporter, o);
	auto report = fetcher.fetch(segs);
	ASSERT_FALSE(report);
	EXPECT_EQ(report.error(), errc::segment_fetch_failed);
	EXPECT_EQ(http.requests_for(segs[1].url), 3);
}

TEST_F(SegmentFetcherTest, NotFoundIsFatal) {
	auto segs = descriptors(30);
	http.fail(segs[5].url, make_error_code(errc::not_found));

	auto o = options();
	o.threads = 1;
	SegmentFetcher fetcher(http, nullptr, reporter, o);
	auto report = fetcher.fetch(segs);
	ASSERT_FALSE(report);
	EXPECT_EQ(report.error(), errc::not_found);
	// One worker: everything queued after the failure is cancelled
	EXPECT_EQ(http.requests_for(segs[29].url), 0);
	EXPECT_EQ(http.requests_for(segs[5].url), 1);
}

TEST_F(SegmentFetcherTest, ForbiddenIsNotRetried) {
	auto segs = descriptors(2);
	http.fail(segs[1].url, make_error_code(errc::forbidden));

	SegmentFetcher fetcher(http, nullptr, reporter, options());
	auto report = fetcher.fetch(segs);
	EXPECT_EQ(report.error(), errc::forbidden);
	EXPECT_EQ(http.requests_for(segs[1].url), 1);
}

TEST_F(SegmentFetcherTest, MissingInitCancelsDataSegments) {
	auto segs = descriptors(4);
	http.fail(segs[0].url, make_error_code(errc::not_found));

	SegmentFetcher fetcher(http, nullptr, reporter, options());
	EXPECT_EQ(fetcher.fetch(segs).error(), errc::not_found);
	for (std::size_t i = 1; i < segs.size(); ++i) {
		EXPECT_EQ(http.requests_for(segs[i].url), 0);
	}
}

TEST_F(SegmentFetcherTest, MissingFinalSegmentIsTolerated) {
	auto segs = descriptors(4, true);
	http.fail(segs.back().url, make_error_code(errc::not_found));

	SegmentFetcher fetcher(http, nullptr, reporter, options());
	auto report = fetcher.fetch(segs);
	ASSERT_TRUE(report);
	EXPECT_TRUE(report.value().missing_tail);
	EXPECT_EQ(report.value().completed.size(), 4u);
	EXPECT_EQ(report.value().completed.back().index, 2);
}

TEST_F(SegmentFetcherTest, InvalidDownloadIsFetchedOnceMore) {
	auto segs = descriptors(2);
	http.serve(segs[2].url, "broken");
	validator.reject_content("broken");

	auto o = options();
	o.validate = true;
	SegmentFetcher fetcher(http, &validator, reporter, o);
	auto report = fetcher.fetch(segs);
	ASSERT_FALSE(report);
	EXPECT_EQ(report.error(), errc::validation_failed);
	EXPECT_EQ(http.requests_for(segs[2].url), 2);
	EXPECT_FALSE(std::filesystem::exists(segs[2].path));
}

TEST_F(SegmentFetcherTest, ConcurrencyIsBounded) {
	auto segs = descriptors(24);
	http.set_latency(std::chrono::milliseconds(10));

	SegmentFetcher fetcher(http, nullptr, reporter, options());
	ASSERT_TRUE(fetcher.fetch(segs));
	EXPECT_LE(http.max_in_flight(), 3);
	EXPECT_GE(http.max_in_flight(), 2);
}

TEST_F(SegmentFetcherTest, ExceptionInWorkerFailsTheJob) {
	auto segs = descriptors(5);
	ThrowingHttpClient throwing(segs[3].url);
	for (const auto &s : segs) throwing.serve(s.url, "data");

	SegmentFetcher fetcher(throwing, nullptr, reporter, options());
	auto report = fetcher.fetch(segs);
	ASSERT_FALSE(report);
	EXPECT_EQ(report.error(), errc::unknown);
}

TEST_F(SegmentFetcherTest, UnstatableSegmentPathFailsTheJob) {
	auto segs = descriptors(2);
	// stat() fails with ENAMETOOLONG
	segs[2].path = dir / std::string(400, 'x');

	SegmentFetcher fetcher(http, nullptr, reporter, options());
	auto report = fetcher.fetch(segs);
	ASSERT_FALSE(report);
	EXPECT_EQ(report.error(), errc::validation_failed);
}
