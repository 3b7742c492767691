#pragma once

#include <scenedl/scenedl_export.h>

#include <filesystem>
#include <string_view>

#include "result.hpp"

namespace scenedl::media {

// Integrity check for fragmented MP4 segments. A data segment is only
// decodable together with the init segment of its stream.
class SCENEDL_EXPORT ISegmentValidator {
   public:
	virtual ~ISegmentValidator() = default;

	// Demux init + data bytes held in memory.
	virtual Result<void> probe(std::string_view init_bytes,
							   std::string_view data_bytes) = 0;

	virtual Result<void> validate_file(const std::filesystem::path &init,
									   const std::filesystem::path &segment) = 0;
};

// libavformat-backed validator: every packet of the concatenated input must
// demux without error.
class SCENEDL_EXPORT AvSegmentValidator final : public ISegmentValidator {
   public:
	Result<void> probe(std::string_view init_bytes,
					   std::string_view data_bytes) override;
	Result<void> validate_file(const std::filesystem::path &init,
							   const std::filesystem::path &segment) override;
};

}  // namespace scenedl::media
