#pragma once

#include <scenedl/scenedl_export.h>

#include <spdlog/spdlog.h>

#include <optional>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace scenedl {

/// Pick a rung of the resolution ladder.
///
/// - requested == 0: lowest variant
/// - requested unset: highest variant
/// - force: exact height match or errc::resolution_unavailable
/// - otherwise: greatest height <= requested, falling back to the lowest
///   variant when every height is above the request
///
/// The ladder does not need to be sorted.
SCENEDL_EXPORT Result<StreamVariant> select_variant(
	const std::vector<StreamVariant> &ladder, std::optional<int> requested,
	bool force, spdlog::logger &log = *spdlog::default_logger_raw());

}  // namespace scenedl
