#include <spdlog/spdlog.h>
#include <zlib.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/extensions.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <optional>
#include <ytplay/http_client.hpp>

namespace ytplay::net {

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

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

	std::string out;
	out.reserve(compressed.size() * 4);

	constexpr size_t kChunkSize = 32768;
	char buffer[kChunkSize];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(buffer);
		zs.avail_out = kChunkSize;

		ret = inflate(&zs, Z_NO_FLUSH);
		if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
			(ret == Z_BUF_ERROR && zs.avail_in == 0)) {
			inflateEnd(&zs);
			spdlog::warn("zlib inflate error: {}", ret);
			return std::nullopt;
		}
		out.append(buffer, kChunkSize - zs.avail_out);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return out;
}

struct Target {
	std::string host;
	std::string port;
	std::string path;
};

Result<Target> split_url(const std::string &url) {
	auto parsed = boost::urls::parse_uri(url);
	if (parsed.has_error()) return make_error_code(errc::invalid_url);
	boost::urls::url_view u = parsed.value();

	Target t;
	t.host = u.host();
	t.port = u.port();
	t.path = u.path();
	if (u.has_query()) {
		t.path += "?";
		t.path += u.query();
	}
	if (t.path.empty()) t.path = "/";
	if (t.port.empty()) t.port = (u.scheme() == "https") ? "443" : "80";
	return t;
}

}  // namespace

std::string decompress_body(const std::string &body,
							const std::string &content_encoding) {
	if (content_encoding.empty() || content_encoding == "identity") {
		return body;
	}

	if (content_encoding == "gzip" || content_encoding == "x-gzip") {
		if (auto out = inflate_body(body, 16 + MAX_WBITS)) return *out;
		spdlog::warn("gzip decompression failed, returning raw body");
		return body;
	}

	if (content_encoding == "deflate") {
		// Some servers label zlib-wrapped data as deflate
		if (auto out = inflate_body(body, MAX_WBITS)) return *out;
		if (auto out = inflate_body(body, -MAX_WBITS)) return *out;
		spdlog::warn("deflate decompression failed, returning raw body");
		return body;
	}

	spdlog::debug("Unknown Content-Encoding: {}, returning raw body",
				  content_encoding);
	return body;
}

struct HttpClient::Impl {
	asio::any_io_executor ex;
	ssl::context ssl_ctx;
	Seconds timeout;

	Impl(asio::any_io_executor e, Seconds t)
		: ex(std::move(e)), ssl_ctx(ssl::context::tlsv12_client), timeout(t) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(
			ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error("Failed to set default SSL verify paths: {}",
						  ec.message());
		}

		boost::certify::enable_native_https_server_verification(ssl_ctx);
	}

	Result<HttpResponse> perform(http::verb method, const std::string &url,
								 const std::string &body,
								 const std::map<std::string, std::string> &headers,
								 asio::yield_context yield) {
		auto target = split_url(url);
		if (target.has_error()) return target.error();
		const auto &[host, port, path] = target.value();

		boost::system::error_code ec;
		auto fail = [&](const char *stage) -> Result<HttpResponse> {
			spdlog::debug("HTTP {} {} failed during {}: {}",
						  std::string(http::to_string(method)), url, stage,
						  ec.message());
			return make_error_code(errc::request_failed);
		};

		tcp::resolver resolver(ex);
		auto results = resolver.async_resolve(host, port, yield[ec]);
		if (ec) return fail("resolve");

		beast::ssl_stream<beast::tcp_stream> stream(ex, ssl_ctx);
		boost::certify::set_server_hostname(stream, host);
		if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
			spdlog::debug("Cannot set SNI host {}", host);
			return make_error_code(errc::request_failed);
		}

		beast::get_lowest_layer(stream).expires_after(timeout);
		beast::get_lowest_layer(stream).async_connect(results, yield[ec]);
		if (ec) return fail("connect");

		beast::get_lowest_layer(stream).expires_after(timeout);
		stream.async_handshake(ssl::stream_base::client, yield[ec]);
		if (ec) return fail("handshake");

		http::request<http::string_body> req{method, path, 11};
		req.set(http::field::host, host);
		req.set(http::field::user_agent, "ytplay/1.0");
		req.set(http::field::accept_encoding, "gzip, deflate");
		for (const auto &[key, value] : headers) { req.set(key, value); }
		if (!body.empty()) {
			req.body() = body;
			req.prepare_payload();
		}

		beast::get_lowest_layer(stream).expires_after(timeout);
		http::async_write(stream, req, yield[ec]);
		if (ec) return fail("write");

		beast::flat_buffer buffer;
		http::response<http::string_body> res;
		http::async_read(stream, buffer, res, yield[ec]);
		if (ec) return fail("read");

		// Peers often skip close_notify; the response is already complete
		stream.async_shutdown(yield[ec]);

		std::string content_encoding;
		if (auto it = res.find(http::field::content_encoding);
			it != res.end()) {
			content_encoding = std::string(it->value());
		}

		HttpResponse out;
		out.status_code = static_cast<int>(res.result_int());
		out.body = decompress_body(res.body(), content_encoding);
		for (const auto &field : res) {
			out.headers[std::string(field.name_string())] =
				std::string(field.value());
		}
		return out;
	}
};

HttpClient::HttpClient(asio::any_io_executor ex, Seconds timeout)
	: m_impl(std::make_unique<Impl>(std::move(ex), timeout)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse> HttpClient::post(
	const std::string &url, const std::string &body,
	const std::map<std::string, std::string> &headers,
	asio::yield_context yield) {
	return m_impl->perform(http::verb::post, url, body, headers, yield);
}

}  // namespace ytplay::net
