#pragma once

#include <ytplay/ytplay_export.h>

#include <boost/asio/any_io_executor.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>
#include <ytplay/backend.hpp>
#include <ytplay/http_client.hpp>

namespace ytplay {

/// Extract up to `limit` video results from an InnerTube search response.
YTPLAY_EXPORT std::vector<SearchResult> parse_search_response(
	const nlohmann::json &response, int limit);

/// SearchProvider backed by the YouTube InnerTube search endpoint.
class YTPLAY_EXPORT InnertubeSearch final : public SearchProvider {
   public:
	explicit InnertubeSearch(asio::any_io_executor ex,
							 Seconds timeout = Seconds{30});

	Result<std::vector<SearchResult>> search(
		const std::string &text, int limit, asio::yield_context yield) override;

   private:
	net::HttpClient http_;
};

}  // namespace ytplay
