#include <spdlog/spdlog.h>

#include <algorithm>
#include <scenedl/selector.hpp>

namespace scenedl {

Result<StreamVariant> select_variant(const std::vector<StreamVariant> &ladder,
									 std::optional<int> requested, bool force,
									 spdlog::logger &log) {
	if (ladder.empty()) {
		return outcome::failure(errc::resolution_unavailable);
	}

	auto by_height = [](const StreamVariant &a, const StreamVariant &b) {
		return a.height < b.height;
	};
	const auto &lowest = *std::min_element(ladder.begin(), ladder.end(), by_height);
	const auto &highest =
		*std::max_element(ladder.begin(), ladder.end(), by_height);

	if (!requested) return highest;
	if (*requested == 0) return lowest;

	if (force) {
		auto exact = std::find_if(
			ladder.begin(), ladder.end(),
			[&](const StreamVariant &v) { return v.height == *requested; });
		if (exact == ladder.end()) {
			log.error("Resolution {}p not offered", *requested);
			return outcome::failure(errc::resolution_unavailable);
		}
		return *exact;
	}

	const StreamVariant *best = nullptr;
	for (const auto &variant : ladder) {
		if (variant.height <= *requested &&
			(!best || variant.height > best->height)) {
			best = &variant;
		}
	}
	if (!best) {
		log.info("No variant at or below {}p, using {}p", *requested,
					 lowest.height);
		return lowest;
	}
	if (best->height != *requested) {
		log.info("{}p not offered, using {}p", *requested, best->height);
	}
	return *best;
}

}  // namespace scenedl
