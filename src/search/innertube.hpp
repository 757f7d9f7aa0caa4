#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace ytplay::search {

struct InnertubeContext {
	std::string client_name;
	std::string client_version;
	std::string user_agent;
	std::string os_name;
	std::string os_version;
	std::string platform;  // "DESKTOP", "MOBILE"
	int client_id = 1;	   // X-YouTube-Client-Name value, 1 = WEB
};

class Innertube {
   public:
	// Search results render the same for every client; WEB needs no token
	static const InnertubeContext CLIENT_WEB;

	static constexpr const char *SEARCH_ENDPOINT =
		"https://www.youtube.com/youtubei/v1/search";

	// Base64 protobuf filter: videos only
	static constexpr const char *SEARCH_PARAMS_VIDEOS = "EgIQAfABAQ==";

	// Request body for a search query
	static nlohmann::json build_search_payload(const InnertubeContext &client,
											   const std::string &query);

	static std::map<std::string, std::string> get_headers(
		const InnertubeContext &client);
};

}  // namespace ytplay::search
