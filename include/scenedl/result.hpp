#pragma once

#include <scenedl/scenedl_export.h>

#include <boost/outcome.hpp>
#include <system_error>

namespace scenedl {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// HTTP/Net errors
	request_failed = 10,
	timeout,
	http_error,	   // Non-2xx status not covered below
	not_found,	   // 404
	forbidden,	   // 403
	server_error,  // 5xx
	proxy_failed,

	// Parsing errors
	json_parse_error = 20,
	invalid_url,
	invalid_number_format,

	// Pipeline
	manifest_error = 30,
	resolution_unavailable,
	config_error,
	segment_fetch_failed,
	validation_failed,
	assembly_failed,
	muxer_failed,
	cancelled,

	// I/O
	file_open_failed = 50,
	file_write_failed,

	unknown = 100
};

SCENEDL_EXPORT const std::error_category &scenedl_category();
SCENEDL_EXPORT std::error_code make_error_code(errc e);

/// Retryable transport failures. Everything else is fatal for a segment.
SCENEDL_EXPORT bool is_transient(const std::error_code &ec);

}  // namespace scenedl

namespace std {
template <>
struct is_error_code_enum<scenedl::errc> : true_type {};
}  // namespace std

namespace scenedl {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace scenedl
