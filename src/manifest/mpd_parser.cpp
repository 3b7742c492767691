#include "mpd_parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/regex.hpp>

#include "markup.hpp"
#include "utils.hpp"

namespace scenedl::manifest {

namespace {

using Iterator = std::string_view::const_iterator;

Result<double> required_number(std::string_view tag, std::string_view name,
							   spdlog::logger &log) {
	auto value = attribute(tag, name);
	if (!value) {
		log.error("MPD: missing {} attribute", name);
		return outcome::failure(errc::manifest_error);
	}
	auto number = utils::to_double(utils::trim(*value));
	if (!number) {
		log.error("MPD: bad {} attribute '{}'", name, *value);
		return outcome::failure(errc::manifest_error);
	}
	return number.value();
}

}  // namespace

Result<MpdVideoSet> parse_mpd(std::string_view xml, spdlog::logger &log) {
	// Element names may carry a namespace prefix
	static const boost::regex set_re(
		"<(?:\\w+:)?AdaptationSet\\b([^>]*)>(.*?)</(?:\\w+:)?AdaptationSet>");
	static const boost::regex template_re("<(?:\\w+:)?SegmentTemplate\\b[^>]*>");
	static const boost::regex representation_re(
		"<(?:\\w+:)?Representation\\b[^>]*>");

	boost::match_results<Iterator> video_set;
	bool found = false;
	for (boost::regex_iterator<Iterator> it(xml.begin(), xml.end(), set_re), end;
		 it != end; ++it) {
		auto mime = attribute((*it)[1].str(), "mimeType");
		if (mime && *mime == "video/mp4") {
			video_set = *it;
			found = true;
			break;
		}
	}
	if (!found) {
		log.error("MPD: no video/mp4 AdaptationSet");
		return outcome::failure(errc::manifest_error);
	}

	const auto body = video_set[2].str();

	boost::smatch tmpl;
	if (!boost::regex_search(body, tmpl, template_re)) {
		log.error("MPD: video AdaptationSet has no SegmentTemplate");
		return outcome::failure(errc::manifest_error);
	}
	auto timescale = required_number(tmpl[0].str(), "timescale", log);
	if (!timescale) return timescale.error();
	auto duration = required_number(tmpl[0].str(), "duration", log);
	if (!duration) return duration.error();
	if (timescale.value() <= 0 || duration.value() <= 0) {
		log.error("MPD: non-positive segment timing");
		return outcome::failure(errc::manifest_error);
	}

	MpdVideoSet set;
	set.segment_duration = duration.value() / timescale.value();

	for (boost::sregex_iterator it(body.begin(), body.end(), representation_re),
		 end;
		 it != end; ++it) {
		const auto tag = (*it)[0].str();
		Representation rep;
		auto id = attribute(tag, "id");
		auto height = attribute(tag, "height");
		if (!id || id->empty() || !height) {
			log.error("MPD: Representation without id/height: {}", tag);
			return outcome::failure(errc::manifest_error);
		}
		auto height_value = utils::to_int(utils::trim(*height));
		if (!height_value || height_value.value() <= 0) {
			log.error("MPD: bad Representation height '{}'", *height);
			return outcome::failure(errc::manifest_error);
		}
		rep.id = *id;
		rep.height = height_value.value();
		if (auto bandwidth = attribute(tag, "bandwidth")) {
			rep.bandwidth = utils::to_number_default<long long>(*bandwidth, 0);
		}
		set.representations.push_back(std::move(rep));
	}

	if (set.representations.empty()) {
		log.error("MPD: video AdaptationSet has no Representation");
		return outcome::failure(errc::manifest_error);
	}

	std::stable_sort(set.representations.begin(), set.representations.end(),
					 [](const Representation &a, const Representation &b) {
						 return a.height < b.height;
					 });
	return set;
}

}  // namespace scenedl::manifest
