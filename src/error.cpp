#include <scenedl/result.hpp>
#include <string>

namespace scenedl {

struct scenedl_error_category : std::error_category {
	const char *name() const noexcept override { return "scenedl"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::request_failed: return "Request failed";
			case errc::timeout: return "Request timed out";
			case errc::http_error: return "HTTP error";
			case errc::not_found: return "Not found (HTTP 404)";
			case errc::forbidden: return "Forbidden (HTTP 403)";
			case errc::server_error: return "Server error (HTTP 5xx)";
			case errc::proxy_failed: return "Proxy negotiation failed";
			case errc::json_parse_error: return "JSON parse error";
			case errc::invalid_url: return "Invalid URL";
			case errc::invalid_number_format: return "Invalid number format";
			case errc::manifest_error: return "Manifest unavailable or malformed";
			case errc::resolution_unavailable:
				return "Requested resolution unavailable";
			case errc::config_error: return "Invalid configuration";
			case errc::segment_fetch_failed:
				return "Segment download failed after retries";
			case errc::validation_failed: return "Segment failed validation";
			case errc::assembly_failed: return "Stream assembly failed";
			case errc::muxer_failed: return "Muxer exited with an error";
			case errc::cancelled: return "Cancelled";
			case errc::file_open_failed: return "File open failed";
			case errc::file_write_failed: return "File write failed";
			default: return "Unknown error";
		}
	}
};

const std::error_category &scenedl_category() {
	static scenedl_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), scenedl_category()};
}

bool is_transient(const std::error_code &ec) {
	return ec == errc::request_failed || ec == errc::timeout ||
		   ec == errc::server_error || ec == errc::proxy_failed;
}

}  // namespace scenedl
