#include <spdlog/spdlog.h>
#include <zlib.h>

#include <array>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/extensions.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <chrono>
#include <fstream>
#include <mutex>
#include <scenedl/http_client.hpp>
#include <unordered_map>
#include <vector>

#include "utils.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace scenedl::net {

// =============================================================================
// GZIP/DEFLATE DECOMPRESSION
// =============================================================================

namespace {

// window_bits: 16 + MAX_WBITS for gzip, -MAX_WBITS for raw deflate
std::optional<std::string> inflate_body(const std::string &compressed,
										int window_bits) {
	if (compressed.empty()) return std::string{};

	z_stream zs{};
	if (inflateInit2(&zs, window_bits) != Z_OK) {
		spdlog::warn("Failed to init zlib (window bits {})", window_bits);
		return std::nullopt;
	}

	zs.next_in =
		reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
	zs.avail_in = static_cast<uInt>(compressed.size());

	std::string decompressed;
	decompressed.reserve(compressed.size() * 4);

	constexpr size_t kChunkSize = 32768;
	char outbuffer[kChunkSize];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
		zs.avail_out = kChunkSize;

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
			(ret == Z_BUF_ERROR && zs.avail_in == 0)) {
			inflateEnd(&zs);
			spdlog::warn("zlib inflate error: {}", ret);
			return std::nullopt;
		}

		size_t have = kChunkSize - zs.avail_out;
		decompressed.append(outbuffer, have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

std::string decompress_body(const std::string &body,
							const std::string &content_encoding) {
	if (content_encoding.empty() || content_encoding == "identity") {
		return body;
	}

	if (content_encoding == "gzip" || content_encoding == "x-gzip") {
		if (auto result = inflate_body(body, 16 + MAX_WBITS)) {
			spdlog::debug("Decompressed gzip: {} -> {} bytes", body.size(),
						  result->size());
			return *result;
		}
		spdlog::warn("gzip decompression failed, returning raw body");
		return body;
	}

	if (content_encoding == "deflate") {
		// Some servers send zlib-wrapped data as deflate
		if (auto result = inflate_body(body, MAX_WBITS + 32)) {
			return *result;
		}
		if (auto result = inflate_body(body, -MAX_WBITS)) { return *result; }
		spdlog::warn("deflate decompression failed, returning raw body");
		return body;
	}

	spdlog::debug(
		"Unknown Content-Encoding: {}, returning raw body", content_encoding);
	return body;
}

struct Target {
	std::string host;
	std::string port;
	std::string path;
};

Result<Target> parse_target(std::string_view url_str) {
	auto u_res = boost::urls::parse_uri(url_str);
	if (u_res.has_error()) return outcome::failure(errc::invalid_url);
	boost::urls::url_view u = u_res.value();

	if (u.scheme() != "https") return outcome::failure(errc::invalid_url);

	Target target;
	target.host = u.host();
	target.port = u.port();
	target.path = std::string(u.encoded_path());
	if (u.has_query()) {
		target.path += "?";
		target.path += std::string(u.encoded_query());
	}
	if (target.path.empty()) target.path = "/";
	if (target.port.empty()) target.port = "443";
	if (target.host.empty()) return outcome::failure(errc::invalid_url);
	return target;
}

std::error_code transport_error(const beast::error_code &ec,
								std::string_view what,
								const std::string &host) {
	spdlog::debug("{} {} failed: {}", what, host, ec.message());
	if (ec == beast::error::timeout) return make_error_code(errc::timeout);
	return make_error_code(errc::request_failed);
}

// Starts one asynchronous operation and blocks until it completes. The
// tcp_stream deadline bounds the wait, so every blocking call honors the
// configured timeout.
template <typename Initiate>
beast::error_code run_op(asio::io_context &ioc, Initiate &&initiate) {
	beast::error_code result;
	std::forward<Initiate>(initiate)(
		[&result](beast::error_code ec, auto &&...) { result = ec; });
	ioc.restart();
	ioc.run();
	return result;
}

}  // namespace

std::error_code status_to_error(int status) {
	if (status >= 200 && status < 300) return {};
	if (status == 404) return make_error_code(errc::not_found);
	if (status == 403) return make_error_code(errc::forbidden);
	if (status >= 500 && status < 600) return make_error_code(errc::server_error);
	return make_error_code(errc::http_error);
}

Result<ProxyEndpoint> parse_proxy(std::string_view url) {
	auto u_res = boost::urls::parse_uri(url);
	if (u_res.has_error()) return outcome::failure(errc::config_error);
	boost::urls::url_view u = u_res.value();

	ProxyEndpoint proxy;
	auto scheme = u.scheme();
	if (scheme == "http") {
		proxy.kind = ProxyKind::http;
	} else if (scheme == "socks5") {
		proxy.kind = ProxyKind::socks5;
	} else if (scheme == "socks5h") {
		proxy.kind = ProxyKind::socks5h;
	} else {
		spdlog::error("Unsupported proxy scheme: {}", scheme);
		return outcome::failure(errc::config_error);
	}

	proxy.host = u.host();
	if (proxy.host.empty()) return outcome::failure(errc::config_error);
	proxy.port = u.port();
	if (proxy.port.empty()) {
		proxy.port = proxy.kind == ProxyKind::http ? "8080" : "1080";
	}
	if (u.has_userinfo()) {
		proxy.username = u.user();
		proxy.password = u.password();
	}
	return proxy;
}

// =============================================================================
// DNS CACHE
// =============================================================================
// Caches DNS lookup results to avoid repeated resolution for the same hosts.
// Segment downloads hit the same CDN host hundreds of times per job.
// =============================================================================

struct DnsCacheEntry {
	tcp::resolver::results_type results;
	std::chrono::steady_clock::time_point expires_at;
};

class DnsCache {
   public:
	static constexpr auto kDefaultTTL = std::chrono::minutes(5);
	static constexpr size_t kMaxCacheSize = 64;

	std::optional<tcp::resolver::results_type> get(const std::string &host,
												   const std::string &port) {
		std::lock_guard lock(mutex_);
		auto key = host + ":" + port;
		auto it = cache_.find(key);
		if (it == cache_.end()) { return std::nullopt; }
		if (std::chrono::steady_clock::now() > it->second.expires_at) {
			cache_.erase(it);
			return std::nullopt;
		}
		return it->second.results;
	}

	void put(const std::string &host, const std::string &port,
			 const tcp::resolver::results_type &results,
			 std::chrono::steady_clock::duration ttl = kDefaultTTL) {
		std::lock_guard lock(mutex_);
		auto key = host + ":" + port;

		if (cache_.size() >= kMaxCacheSize) { evict_expired(); }

		// If still full, evict oldest entry
		if (cache_.size() >= kMaxCacheSize) {
			auto oldest = cache_.begin();
			for (auto it = cache_.begin(); it != cache_.end(); ++it) {
				if (it->second.expires_at < oldest->second.expires_at) {
					oldest = it;
				}
			}
			cache_.erase(oldest);
		}

		cache_[key] =
			DnsCacheEntry{results, std::chrono::steady_clock::now() + ttl};
		spdlog::debug(
			"DNS cached {} ({} results, TTL {}s)", key,
			std::distance(results.begin(), results.end()),
			std::chrono::duration_cast<std::chrono::seconds>(ttl).count());
	}

	void invalidate(const std::string &host, const std::string &port) {
		std::lock_guard lock(mutex_);
		cache_.erase(host + ":" + port);
	}

   private:
	void evict_expired() {
		auto now = std::chrono::steady_clock::now();
		for (auto it = cache_.begin(); it != cache_.end();) {
			if (now > it->second.expires_at) {
				it = cache_.erase(it);
			} else {
				++it;
			}
		}
	}

	std::mutex mutex_;
	std::unordered_map<std::string, DnsCacheEntry> cache_;
};

// Global DNS cache (shared across all HttpClient instances)
static DnsCache &get_dns_cache() {
	static DnsCache instance;
	return instance;
}

using Stream = beast::ssl_stream<beast::tcp_stream>;

struct PooledConnection {
	std::unique_ptr<Stream> stream;
	std::chrono::steady_clock::time_point last_used;
};

// An io_context plus the connections opened on it. A lane is checked out by
// one calling thread at a time, so its pool needs no locking.
struct Lane {
	asio::io_context ioc;
	std::unordered_map<std::string, std::vector<PooledConnection>> conn_pool;
};

struct HttpClient::Impl {
	HttpClientOptions options;
	ssl::context ssl_ctx;

	std::mutex lanes_mutex_;
	std::vector<std::unique_ptr<Lane>> idle_lanes_;
	std::atomic<bool> shutdown_requested_{false};

	static constexpr auto kConnectionTimeout = std::chrono::seconds(30);
	static constexpr size_t kMaxPoolSize = 4;
	static constexpr size_t kReadBufferSize = 256 * 1024;

	explicit Impl(HttpClientOptions opts)
		: options(std::move(opts)), ssl_ctx(ssl::context::tlsv12_client) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(
			ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}

		boost::certify::enable_native_https_server_verification(ssl_ctx);
	}

	// Returns the lane to the idle list when the request is over.
	class LaneLease {
	   public:
		explicit LaneLease(Impl &impl) : impl_(impl) {
			std::lock_guard lock(impl_.lanes_mutex_);
			if (!impl_.idle_lanes_.empty()) {
				lane_ = std::move(impl_.idle_lanes_.back());
				impl_.idle_lanes_.pop_back();
			} else {
				lane_ = std::make_unique<Lane>();
			}
		}
		LaneLease(const LaneLease &) = delete;
		LaneLease &operator=(const LaneLease &) = delete;
		~LaneLease() {
			if (impl_.shutdown_requested_.load(std::memory_order_acquire)) {
				lane_->conn_pool.clear();
			}
			std::lock_guard lock(impl_.lanes_mutex_);
			impl_.idle_lanes_.push_back(std::move(lane_));
		}

		Lane &operator*() { return *lane_; }

	   private:
		Impl &impl_;
		std::unique_ptr<Lane> lane_;
	};

	void shutdown() {
		shutdown_requested_.store(true, std::memory_order_release);
		std::lock_guard lock(lanes_mutex_);
		for (auto &lane : idle_lanes_) { lane->conn_pool.clear(); }
	}

	std::unique_ptr<Stream> acquire_connection(Lane &lane,
											   const std::string &key) {
		auto it = lane.conn_pool.find(key);
		if (it == lane.conn_pool.end()) return nullptr;
		auto now = std::chrono::steady_clock::now();
		while (!it->second.empty()) {
			auto conn = std::move(it->second.back());
			it->second.pop_back();
			if (now - conn.last_used < kConnectionTimeout) {
				spdlog::trace("Reusing pooled connection for {}", key);
				return std::move(conn.stream);
			}
		}
		return nullptr;
	}

	void release_connection(Lane &lane, const std::string &key,
							std::unique_ptr<Stream> stream) {
		if (!stream || shutdown_requested_.load(std::memory_order_acquire)) {
			return;
		}
		auto &conns = lane.conn_pool[key];
		if (conns.size() < kMaxPoolSize) {
			conns.push_back(
				{std::move(stream), std::chrono::steady_clock::now()});
		}
	}

	Result<tcp::resolver::results_type> resolve(Lane &lane,
												const std::string &host,
												const std::string &port) {
		if (auto cached = get_dns_cache().get(host, port)) { return *cached; }
		boost::system::error_code ec;
		tcp::resolver resolver(lane.ioc);
		auto results = resolver.resolve(host, port, ec);
		if (ec) {
			spdlog::debug("Resolve {} failed: {}", host, ec.message());
			return outcome::failure(errc::request_failed);
		}
		get_dns_cache().put(host, port, results);
		return results;
	}

	// =========================================================================
	// PROXY TUNNELS
	// =========================================================================

	Result<void> http_tunnel(Lane &lane, beast::tcp_stream &sock,
							 const Target &target) {
		const auto &proxy = *options.proxy;
		auto authority = target.host + ":" + target.port;

		http::request<http::empty_body> req{http::verb::connect, authority, 11};
		req.set(http::field::host, authority);
		req.set(http::field::user_agent, options.user_agent);
		if (!proxy.username.empty()) {
			auto credentials = proxy.username + ":" + proxy.password;
			std::string encoded(
				beast::detail::base64::encoded_size(credentials.size()), '\0');
			encoded.resize(beast::detail::base64::encode(
				encoded.data(), credentials.data(), credentials.size()));
			req.set(http::field::proxy_authorization, "Basic " + encoded);
		}

		sock.expires_after(options.timeout);
		auto ec = run_op(lane.ioc, [&](auto handler) {
			http::async_write(sock, req, std::move(handler));
		});
		if (ec) return transport_error(ec, "Proxy CONNECT", proxy.host);

		beast::flat_buffer buffer;
		http::response_parser<http::empty_body> parser;
		parser.skip(true);	// a CONNECT response carries no body
		ec = run_op(lane.ioc, [&](auto handler) {
			http::async_read(sock, buffer, parser, std::move(handler));
		});
		if (ec) return transport_error(ec, "Proxy CONNECT", proxy.host);

		auto status = parser.get().result_int();
		if (status != 200) {
			spdlog::warn("Proxy refused CONNECT to {}: {}", authority, status);
			return outcome::failure(errc::proxy_failed);
		}
		return outcome::success();
	}

	Result<void> socks5_tunnel(Lane &lane, beast::tcp_stream &sock,
							   const Target &target) {
		const auto &proxy = *options.proxy;
		const bool has_auth = !proxy.username.empty();

		auto exchange = [&](const std::vector<unsigned char> &out,
							unsigned char *in,
							std::size_t in_size) -> beast::error_code {
			sock.expires_after(options.timeout);
			if (!out.empty()) {
				auto ec = run_op(lane.ioc, [&](auto handler) {
					asio::async_write(sock, asio::buffer(out), std::move(handler));
				});
				if (ec) return ec;
			}
			if (in_size == 0) return {};
			return run_op(lane.ioc, [&](auto handler) {
				asio::async_read(
					sock, asio::buffer(in, in_size), std::move(handler));
			});
		};

		std::array<unsigned char, 2> reply{};
		std::vector<unsigned char> greeting =
			has_auth ? std::vector<unsigned char>{0x05, 0x02, 0x00, 0x02}
					 : std::vector<unsigned char>{0x05, 0x01, 0x00};
		if (auto ec = exchange(greeting, reply.data(), reply.size())) {
			return transport_error(ec, "SOCKS5 greeting", proxy.host);
		}
		if (reply[0] != 0x05 || reply[1] == 0xFF) {
			spdlog::warn("SOCKS5 proxy rejected all auth methods");
			return outcome::failure(errc::proxy_failed);
		}

		if (reply[1] == 0x02) {
			if (!has_auth || proxy.username.size() > 255 ||
				proxy.password.size() > 255) {
				return outcome::failure(errc::proxy_failed);
			}
			std::vector<unsigned char> auth{0x01};
			auth.push_back(static_cast<unsigned char>(proxy.username.size()));
			auth.insert(auth.end(), proxy.username.begin(), proxy.username.end());
			auth.push_back(static_cast<unsigned char>(proxy.password.size()));
			auth.insert(auth.end(), proxy.password.begin(), proxy.password.end());
			if (auto ec = exchange(auth, reply.data(), reply.size())) {
				return transport_error(ec, "SOCKS5 auth", proxy.host);
			}
			if (reply[1] != 0x00) {
				spdlog::warn("SOCKS5 authentication failed");
				return outcome::failure(errc::proxy_failed);
			}
		}

		auto port = utils::to_int(target.port);
		if (!port) return outcome::failure(errc::invalid_url);

		std::vector<unsigned char> request{0x05, 0x01, 0x00};
		if (proxy.kind == ProxyKind::socks5h) {
			if (target.host.size() > 255) {
				return outcome::failure(errc::invalid_url);
			}
			request.push_back(0x03);
			request.push_back(static_cast<unsigned char>(target.host.size()));
			request.insert(request.end(), target.host.begin(), target.host.end());
		} else {
			auto results = resolve(lane, target.host, target.port);
			if (!results || results.value().empty()) {
				return outcome::failure(errc::request_failed);
			}
			auto address = results.value().begin()->endpoint().address();
			if (address.is_v4()) {
				request.push_back(0x01);
				auto bytes = address.to_v4().to_bytes();
				request.insert(request.end(), bytes.begin(), bytes.end());
			} else {
				request.push_back(0x04);
				auto bytes = address.to_v6().to_bytes();
				request.insert(request.end(), bytes.begin(), bytes.end());
			}
		}
		request.push_back(static_cast<unsigned char>((port.value() >> 8) & 0xFF));
		request.push_back(static_cast<unsigned char>(port.value() & 0xFF));

		std::array<unsigned char, 4> head{};
		if (auto ec = exchange(request, head.data(), head.size())) {
			return transport_error(ec, "SOCKS5 connect", proxy.host);
		}
		if (head[0] != 0x05 || head[1] != 0x00) {
			spdlog::warn("SOCKS5 connect to {} refused (code {})", target.host,
						 static_cast<int>(head[1]));
			return outcome::failure(errc::proxy_failed);
		}

		// Drain the bound address: IPv4, domain or IPv6, followed by a port
		std::size_t remaining = 0;
		if (head[3] == 0x01) {
			remaining = 4 + 2;
		} else if (head[3] == 0x04) {
			remaining = 16 + 2;
		} else if (head[3] == 0x03) {
			unsigned char len = 0;
			if (auto ec = exchange({}, &len, 1)) {
				return transport_error(ec, "SOCKS5 connect", proxy.host);
			}
			remaining = std::size_t{len} + 2;
		} else {
			return outcome::failure(errc::proxy_failed);
		}
		std::vector<unsigned char> bound(remaining);
		if (auto ec = exchange({}, bound.data(), bound.size())) {
			return transport_error(ec, "SOCKS5 connect", proxy.host);
		}
		return outcome::success();
	}

	// =========================================================================
	// CONNECTIONS
	// =========================================================================

	Result<std::unique_ptr<Stream>> connect(Lane &lane, const Target &target) {
		const bool via_proxy = options.proxy.has_value();
		const auto &connect_host = via_proxy ? options.proxy->host : target.host;
		const auto &connect_port = via_proxy ? options.proxy->port : target.port;

		auto results = resolve(lane, connect_host, connect_port);
		if (!results) return results.error();

		auto stream = std::make_unique<Stream>(lane.ioc, ssl_ctx);
		auto &sock = beast::get_lowest_layer(*stream);

		sock.expires_after(options.timeout);
		auto ec = run_op(lane.ioc, [&](auto handler) {
			sock.async_connect(results.value(), std::move(handler));
		});
		if (ec) {
			get_dns_cache().invalidate(connect_host, connect_port);
			if (via_proxy) {
				spdlog::debug("Proxy connect failed: {}", ec.message());
				return outcome::failure(errc::proxy_failed);
			}
			return transport_error(ec, "Connect", connect_host);
		}

		if (via_proxy) {
			auto tunnel = options.proxy->kind == ProxyKind::http
							  ? http_tunnel(lane, sock, target)
							  : socks5_tunnel(lane, sock, target);
			if (!tunnel) return tunnel.error();
		}

		boost::certify::set_server_hostname(*stream, target.host);
		if (!SSL_set_tlsext_host_name(
				stream->native_handle(), target.host.c_str())) {
			return outcome::failure(errc::request_failed);
		}

		sock.expires_after(options.timeout);
		ec = run_op(lane.ioc, [&](auto handler) {
			stream->async_handshake(ssl::stream_base::client, std::move(handler));
		});
		if (ec) return transport_error(ec, "TLS handshake", target.host);

		return stream;
	}

	template <typename Request>
	void prepare(Request &req, const Target &target, const Headers &headers) {
		req.version(11);
		req.target(target.path);
		req.set(http::field::host, target.host);
		req.set(http::field::user_agent, options.user_agent);
		req.set(http::field::connection, "keep-alive");
		for (const auto &[key, value] : options.default_headers) {
			req.set(key, value);
		}
		for (const auto &[key, value] : headers) { req.set(key, value); }
	}

	Result<HttpResponse> perform_request(http::verb method,
										 std::string_view url_str,
										 const std::string &body_content,
										 const Headers &headers) {
		auto target_r = parse_target(url_str);
		if (!target_r) return target_r.error();
		const auto &target = target_r.value();
		const auto key = target.host + ":" + target.port;

		http::request<http::string_body> req;
		req.method(method);
		prepare(req, target, headers);
		req.set(http::field::accept_encoding, "gzip, deflate");
		if (!body_content.empty() || method == http::verb::post) {
			req.body() = body_content;
			req.prepare_payload();
		}

		LaneLease lease(*this);
		Lane &lane = *lease;

		// A pooled connection may have been closed by the server in the
		// meantime. Such a failure is retried once on a fresh connection.
		for (int attempt = 0;; ++attempt) {
			auto stream_ptr = acquire_connection(lane, key);
			const bool reused = stream_ptr != nullptr;
			if (!stream_ptr) {
				auto connected = connect(lane, target);
				if (!connected) return connected.error();
				stream_ptr = std::move(connected.value());
			}

			Stream &stream = *stream_ptr;
			auto &sock = beast::get_lowest_layer(stream);

			sock.expires_after(options.timeout);
			auto ec = run_op(lane.ioc, [&](auto handler) {
				http::async_write(stream, req, std::move(handler));
			});

			beast::flat_buffer buffer;
			http::response<http::string_body> res;
			if (!ec) {
				ec = run_op(lane.ioc, [&](auto handler) {
					http::async_read(stream, buffer, res, std::move(handler));
				});
			}
			if (ec) {
				if (reused && attempt == 0 && ec != beast::error::timeout) {
					spdlog::trace("Stale pooled connection for {}: {}", key,
								  ec.message());
					continue;
				}
				return transport_error(ec, "Request", target.host);
			}

			if (res.keep_alive()) {
				release_connection(lane, key, std::move(stream_ptr));
			}

			std::string content_encoding;
			auto encoding_it = res.find(http::field::content_encoding);
			if (encoding_it != res.end()) {
				content_encoding = std::string(encoding_it->value());
			}

			std::string response_body =
				decompress_body(res.body(), content_encoding);

			std::map<std::string, std::string> res_headers;
			for (auto const &field : res) {
				res_headers[std::string(field.name_string())] =
					std::string(field.value());
			}

			return HttpResponse{static_cast<int>(res.result_int()),
								std::move(response_body),
								std::move(res_headers)};
		}
	}

	Result<void> download(std::string_view url_str,
						  const std::filesystem::path &output_path,
						  const Headers &headers,
						  const ProgressCallback &progress_cb) {
		auto target_r = parse_target(url_str);
		if (!target_r) return target_r.error();
		const auto &target = target_r.value();
		const auto key = target.host + ":" + target.port;

		http::request<http::empty_body> req;
		req.method(http::verb::get);
		prepare(req, target, headers);
		req.set(http::field::accept, "*/*");

		LaneLease lease(*this);
		Lane &lane = *lease;

		auto part_path = output_path;
		part_path += ".part";

		for (int attempt = 0;; ++attempt) {
			auto stream_ptr = acquire_connection(lane, key);
			const bool reused = stream_ptr != nullptr;
			if (!stream_ptr) {
				auto connected = connect(lane, target);
				if (!connected) return connected.error();
				stream_ptr = std::move(connected.value());
			}

			Stream &stream = *stream_ptr;
			auto &sock = beast::get_lowest_layer(stream);

			beast::flat_buffer buffer;
			http::response_parser<http::buffer_body> parser;
			parser.body_limit(boost::none);

			sock.expires_after(options.timeout);
			auto ec = run_op(lane.ioc, [&](auto handler) {
				http::async_write(stream, req, std::move(handler));
			});
			if (!ec) {
				ec = run_op(lane.ioc, [&](auto handler) {
					http::async_read_header(
						stream, buffer, parser, std::move(handler));
				});
			}
			if (ec) {
				if (reused && attempt == 0 && ec != beast::error::timeout) {
					continue;
				}
				return transport_error(ec, "Download", target.host);
			}

			const int status = parser.get().result_int();
			if (auto status_ec = status_to_error(status)) {
				spdlog::debug("GET {} -> {}", url_str, status);
				// Drain the error body so the connection can be reused
				std::vector<char> sink(4096);
				while (!parser.is_done()) {
					parser.get().body().data = sink.data();
					parser.get().body().size = sink.size();
					sock.expires_after(options.timeout);
					ec = run_op(lane.ioc, [&](auto handler) {
						http::async_read(stream, buffer, parser, std::move(handler));
					});
					if (ec == http::error::need_buffer) ec = {};
					if (ec) break;
				}
				if (!ec && parser.get().keep_alive()) {
					release_connection(lane, key, std::move(stream_ptr));
				}
				return status_ec;
			}

			long long total_size = -1;
			if (auto len = parser.content_length()) {
				total_size = static_cast<long long>(*len);
			}

			std::ofstream outfile(part_path, std::ios::binary | std::ios::trunc);
			if (!outfile.is_open()) {
				spdlog::error("Cannot open {}", part_path.string());
				return outcome::failure(errc::file_open_failed);
			}

			std::vector<char> buf(kReadBufferSize);
			long long received = 0;
			while (!parser.is_done()) {
				parser.get().body().data = buf.data();
				parser.get().body().size = buf.size();

				sock.expires_after(options.timeout);
				ec = run_op(lane.ioc, [&](auto handler) {
					http::async_read(stream, buffer, parser, std::move(handler));
				});
				if (ec == http::error::need_buffer) ec = {};
				if (ec) {
					outfile.close();
					std::error_code ignored;
					std::filesystem::remove(part_path, ignored);
					return transport_error(ec, "Download body", target.host);
				}

				size_t bytes_read = buf.size() - parser.get().body().size;
				if (bytes_read > 0) {
					outfile.write(buf.data(),
								  static_cast<std::streamsize>(bytes_read));
					if (!outfile) {
						outfile.close();
						std::error_code ignored;
						std::filesystem::remove(part_path, ignored);
						return outcome::failure(errc::file_write_failed);
					}
					received += static_cast<long long>(bytes_read);
					if (progress_cb &&
						!progress_cb(received, total_size > 0 ? total_size : 0)) {
						outfile.close();
						std::error_code ignored;
						std::filesystem::remove(part_path, ignored);
						return outcome::failure(errc::cancelled);
					}
				}
			}

			if (parser.get().keep_alive()) {
				release_connection(lane, key, std::move(stream_ptr));
			}

			outfile.close();
			if (!outfile) return outcome::failure(errc::file_write_failed);

			std::error_code fs_ec;
			std::filesystem::rename(part_path, output_path, fs_ec);
			if (fs_ec) {
				spdlog::error("Cannot move {} into place: {}",
							  part_path.string(), fs_ec.message());
				return outcome::failure(errc::file_write_failed);
			}
			return outcome::success();
		}
	}
};

HttpClient::HttpClient(HttpClientOptions options)
	: m_impl(std::make_unique<Impl>(std::move(options))) {}

HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient &&) noexcept = default;
HttpClient &HttpClient::operator=(HttpClient &&) noexcept = default;

void HttpClient::shutdown() {
	if (m_impl) { m_impl->shutdown(); }
}

Result<HttpResponse> HttpClient::get(std::string_view url,
									 const Headers &headers) {
	try {
		return m_impl->perform_request(http::verb::get, url, {}, headers);
	} catch (const std::exception &e) {
		spdlog::error("Request exception: {}", e.what());
		return outcome::failure(errc::request_failed);
	}
}

Result<HttpResponse> HttpClient::post(std::string_view url, std::string body,
									  const Headers &headers) {
	try {
		return m_impl->perform_request(http::verb::post, url, body, headers);
	} catch (const std::exception &e) {
		spdlog::error("Request exception: {}", e.what());
		return outcome::failure(errc::request_failed);
	}
}

Result<void> HttpClient::download_file(std::string_view url,
									   const std::filesystem::path &output_path,
									   const Headers &headers,
									   ProgressCallback progress_cb) {
	try {
		return m_impl->download(url, output_path, headers, progress_cb);
	} catch (const std::exception &e) {
		spdlog::error("Download exception: {}", e.what());
		return outcome::failure(errc::request_failed);
	}
}

}  // namespace scenedl::net
