#pragma once

#include <ytplay/ytplay_export.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/spawn.hpp>
#include <map>
#include <memory>
#include <string>
#include <ytplay/config.hpp>
#include <ytplay/result.hpp>

namespace ytplay::net {

namespace asio = boost::asio;

struct YTPLAY_EXPORT HttpResponse {
	int status_code = 0;
	std::string body;
	std::map<std::string, std::string> headers;
};

/// HTTPS client for small JSON POST requests. Each call opens its own
/// connection and suspends only the calling coroutine.
class YTPLAY_EXPORT HttpClient {
   public:
	explicit HttpClient(asio::any_io_executor ex, Seconds timeout = Seconds{30});
	~HttpClient();

	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;

	Result<HttpResponse> post(const std::string &url, const std::string &body,
							  const std::map<std::string, std::string> &headers,
							  asio::yield_context yield);

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

/// Decode a response body according to its Content-Encoding. Unknown or
/// corrupt encodings return the body unchanged.
YTPLAY_EXPORT std::string decompress_body(const std::string &body,
										  const std::string &content_encoding);

}  // namespace ytplay::net
