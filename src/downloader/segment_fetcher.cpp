#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cmath>
#include <exception>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <scenedl/fetcher.hpp>

namespace scenedl {

// First fatal error of a job. Backoff waits wake up as soon as it is set.
class SegmentFetcher::CancelState {
   public:
	void fail(std::error_code ec) {
		{
			std::lock_guard lock(m_mutex);
			if (m_cancelled) return;
			m_cancelled = true;
			m_error = ec;
		}
		m_cv.notify_all();
	}

	bool cancelled() const {
		std::lock_guard lock(m_mutex);
		return m_cancelled;
	}

	std::error_code error() const {
		std::lock_guard lock(m_mutex);
		return m_error;
	}

	// false when the job was cancelled during the wait
	bool wait_for(std::chrono::milliseconds delay) {
		std::unique_lock lock(m_mutex);
		return !m_cv.wait_for(lock, delay, [this] { return m_cancelled; });
	}

   private:
	mutable std::mutex m_mutex;
	std::condition_variable m_cv;
	bool m_cancelled = false;
	std::error_code m_error;
};

SegmentFetcher::SegmentFetcher(net::IHttpClient &http,
							   media::ISegmentValidator *validator,
							   IJobReporter &reporter, FetchOptions options)
	: m_http(http),
	  m_validator(validator),
	  m_reporter(reporter),
	  m_options(options) {
	m_options.threads = std::max(1, m_options.threads);
	m_options.max_retries = std::max(0, m_options.max_retries);
}

bool SegmentFetcher::is_valid(const SegmentDescriptor &segment,
							  const SegmentDescriptor *init) {
	std::error_code ec;
	auto size = std::filesystem::file_size(segment.path, ec);
	if (ec || size == 0) return false;

	if (!m_options.validate || !m_validator || segment.init || !init) {
		return true;
	}
	auto res = m_validator->validate_file(init->path, segment.path);
	if (!res) {
		m_reporter.log().debug("{} failed validation", segment.name());
		return false;
	}
	return true;
}

Result<void> SegmentFetcher::download(const SegmentDescriptor &segment,
									  CancelState &cancel) {
	auto delay = m_options.retry_delay;
	for (int attempt = 0;; ++attempt) {
		if (cancel.cancelled()) return outcome::failure(errc::cancelled);

		auto res = m_http.download_file(
			segment.url, segment.path, {},
			[&cancel](long long, long long) { return !cancel.cancelled(); });
		if (res) return outcome::success();

		const auto ec = res.error();
		if (ec == errc::cancelled) return ec;
		if (!is_transient(ec)) return ec;

		if (attempt >= m_options.max_retries) {
			m_reporter.log().error("{}: giving up after {} attempts ({})",
								   segment.name(), attempt + 1, ec.message());
			return outcome::failure(errc::segment_fetch_failed);
		}

		m_reporter.log().debug("{}: {} (attempt {}), retrying in {}ms",
							   segment.name(), ec.message(), attempt + 1,
							   delay.count());
		if (!cancel.wait_for(delay)) return outcome::failure(errc::cancelled);
		delay = std::chrono::milliseconds(static_cast<long long>(
			std::llround(static_cast<double>(delay.count()) *
						 m_options.backoff_factor)));
	}
}

Result<SegmentFetcher::Outcome> SegmentFetcher::fetch_one(
	const SegmentDescriptor &segment, const SegmentDescriptor *init,
	CancelState &cancel) {
	std::error_code ec;
	if (!m_options.overwrite && std::filesystem::exists(segment.path, ec)) {
		if (is_valid(segment, init)) return Outcome::skipped;
		m_reporter.log().info("{} on disk is invalid, downloading again",
							  segment.name());
	}

	// A fresh download that fails validation gets one more try
	for (int round = 0; round < 2; ++round) {
		auto res = download(segment, cancel);
		if (!res) {
			if (res.error() == errc::not_found && segment.may_be_absent) {
				m_reporter.log().debug("Last segment {} is 404, skipping",
									   segment.name());
				return Outcome::absent;
			}
			return res.error();
		}
		if (is_valid(segment, init)) return Outcome::downloaded;

		m_reporter.log().warn("{} failed validation after download",
							  segment.name());
		std::filesystem::remove(segment.path, ec);
	}
	return outcome::failure(errc::validation_failed);
}

Result<FetchReport> SegmentFetcher::fetch(
	const std::vector<SegmentDescriptor> &descriptors) {
	CancelState cancel;
	std::vector<std::optional<Result<Outcome>>> outcomes(descriptors.size());

	auto init_of = [&](StreamType type) -> const SegmentDescriptor * {
		for (const auto &d : descriptors) {
			if (d.init && d.type == type) return &d;
		}
		return nullptr;
	};

	// Runs on pool threads: nothing may escape, or the whole process dies
	auto run = [&](std::size_t i) {
		const auto &segment = descriptors[i];
		if (cancel.cancelled()) return;
		Result<Outcome> res = outcome::failure(errc::unknown);
		try {
			res = fetch_one(segment, init_of(segment.type), cancel);
		} catch (const std::exception &e) {
			m_reporter.log().error("{}: {}", segment.name(), e.what());
		}
		if (!res) {
			if (res.error() != errc::cancelled) {
				m_reporter.log().error("{} failed: {}", segment.name(),
									   res.error().message());
				cancel.fail(res.error());
			}
		} else if (res.value() != Outcome::absent) {
			m_reporter.segment_completed(segment,
										 res.value() == Outcome::downloaded);
		}
		outcomes[i] = std::move(res);
	};

	for (std::size_t i = 0; i < descriptors.size(); ++i) {
		if (descriptors[i].init) run(i);
	}

	if (!cancel.cancelled()) {
		boost::asio::thread_pool pool(
			static_cast<std::size_t>(m_options.threads));
		for (std::size_t i = 0; i < descriptors.size(); ++i) {
			if (descriptors[i].init) continue;
			boost::asio::post(pool, [&run, i] { run(i); });
		}
		pool.join();
	}

	if (cancel.cancelled()) return cancel.error();

	FetchReport report;
	for (std::size_t i = 0; i < descriptors.size(); ++i) {
		const auto &res = outcomes[i];
		if (!res || !*res) return outcome::failure(errc::segment_fetch_failed);
		switch (res->value()) {
			case Outcome::downloaded: ++report.downloaded; break;
			case Outcome::skipped: ++report.skipped; break;
			case Outcome::absent: report.missing_tail = true; continue;
		}
		report.completed.push_back(descriptors[i]);
	}

	std::stable_sort(report.completed.begin(), report.completed.end(),
					 [](const SegmentDescriptor &a, const SegmentDescriptor &b) {
						 if (a.init != b.init) return a.init;
						 if (a.type != b.type) return a.type < b.type;
						 return a.index < b.index;
					 });
	return report;
}

}  // namespace scenedl
