#include "innertube.hpp"

namespace ytplay::search {

// WEB client - standard desktop browser
const InnertubeContext Innertube::CLIENT_WEB = {
	"WEB",
	"2.20250925.01.00",
	"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like "
	"Gecko) Chrome/121.0.0.0 Safari/537.36",
	"Windows",
	"10.0",
	"DESKTOP",
	1};

nlohmann::json Innertube::build_search_payload(const InnertubeContext &client,
											   const std::string &query) {
	nlohmann::json payload = {
		{"context",
		 {{"client",
		   {{"clientName", client.client_name},
			{"clientVersion", client.client_version},
			{"hl", "en"},
			{"gl", "US"},
			{"timeZone", "UTC"}}}}}};

	auto &c = payload["context"]["client"];
	if (!client.os_name.empty()) c["osName"] = client.os_name;
	if (!client.os_version.empty()) c["osVersion"] = client.os_version;
	if (!client.platform.empty()) c["platform"] = client.platform;
	if (!client.user_agent.empty()) c["userAgent"] = client.user_agent;

	payload["query"] = query;
	payload["params"] = SEARCH_PARAMS_VIDEOS;
	return payload;
}

std::map<std::string, std::string> Innertube::get_headers(
	const InnertubeContext &client) {
	return {{"User-Agent", client.user_agent},
			{"Content-Type", "application/json"},
			{"X-YouTube-Client-Name", std::to_string(client.client_id)},
			{"X-YouTube-Client-Version", client.client_version},
			{"X-Goog-Api-Format-Version", "1"},
			{"Origin", "https://www.youtube.com"}};
}

}  // namespace ytplay::search
