#pragma once

#include <scenedl/scenedl_export.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"

namespace scenedl::net {

using Headers = std::map<std::string, std::string>;

struct SCENEDL_EXPORT HttpResponse {
	int status_code;
	std::string body;
	std::map<std::string, std::string> headers;
};

// Returning false from the callback aborts the transfer with errc::cancelled.
using ProgressCallback =
	std::function<bool(long long dl_now, long long dl_total)>;

// Blocking HTTP capability. Implementations must be safe to call from
// several worker threads at once.
class SCENEDL_EXPORT IHttpClient {
   public:
	virtual ~IHttpClient() = default;

	virtual Result<HttpResponse> get(std::string_view url,
									 const Headers &headers) = 0;
	virtual Result<HttpResponse> post(std::string_view url, std::string body,
									  const Headers &headers) = 0;

	// Streams the body to "<output_path>.part" and renames it to output_path
	// once the transfer completed. Non-2xx statuses map through
	// status_to_error().
	virtual Result<void> download_file(std::string_view url,
									   const std::filesystem::path &output_path,
									   const Headers &headers,
									   ProgressCallback progress_cb) = 0;
};

// 404 -> not_found, 403 -> forbidden, 5xx -> server_error, other non-2xx ->
// http_error. Empty error_code for 2xx.
SCENEDL_EXPORT std::error_code status_to_error(int status);

enum class ProxyKind : std::uint8_t { http, socks5, socks5h };

struct SCENEDL_EXPORT ProxyEndpoint {
	ProxyKind kind = ProxyKind::http;
	std::string host;
	std::string port;
	std::string username;
	std::string password;
};

// Accepts http://, socks5:// and socks5h:// with optional user:pass@.
// A missing port defaults to 8080 for http and 1080 for socks.
SCENEDL_EXPORT Result<ProxyEndpoint> parse_proxy(std::string_view url);

struct SCENEDL_EXPORT HttpClientOptions {
	std::optional<ProxyEndpoint> proxy;
	std::string user_agent = "scenedl/1.0";
	std::chrono::seconds timeout{30};
	Headers default_headers;
};

class SCENEDL_EXPORT HttpClient final : public IHttpClient {
   public:
	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;
	HttpClient(HttpClient &&) noexcept;
	HttpClient &operator=(HttpClient &&) noexcept;
	~HttpClient() override;

	explicit HttpClient(HttpClientOptions options = {});

	Result<HttpResponse> get(std::string_view url,
							 const Headers &headers) override;
	Result<HttpResponse> post(std::string_view url, std::string body,
							  const Headers &headers) override;
	Result<void> download_file(std::string_view url,
							   const std::filesystem::path &output_path,
							   const Headers &headers,
							   ProgressCallback progress_cb) override;

	// Close all pooled connections.
	void shutdown();

	struct Impl;

   private:
	std::unique_ptr<Impl> m_impl;
};

}  // namespace scenedl::net
