#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>
#include <ytplay/innertube_search.hpp>

#include "innertube.hpp"
#include "utils.hpp"

namespace ytplay {

namespace {

std::optional<SearchResult> parse_video_renderer(const nlohmann::json &vr) {
	auto vid = utils::traverse_obj<std::string>(vr, {"videoId"});
	if (!vid) return std::nullopt;

	SearchResult result;
	result.video_id = *vid;
	result.url = "https://www.youtube.com/watch?v=" + *vid;
	result.title = utils::get_text_from_runs(vr, {"title", "runs"});
	result.channel = utils::get_text_from_runs(vr, {"ownerText", "runs"});

	// Live streams carry no length
	result.duration_string = utils::traverse_obj_default<std::string>(
		vr, {"lengthText", "simpleText"}, "");

	if (const auto *thumbs =
			utils::traverse_json(vr, {"thumbnail", "thumbnails"});
		thumbs && thumbs->is_array()) {
		// Largest first
		for (auto it = thumbs->rbegin(); it != thumbs->rend(); ++it) {
			if (auto url = utils::traverse_obj<std::string>(*it, {"url"})) {
				result.thumbnails.push_back(*url);
			}
		}
	}
	return result;
}

}  // namespace

std::vector<SearchResult> parse_search_response(const nlohmann::json &response,
												int limit) {
	std::vector<SearchResult> results;
	if (limit <= 0) return results;

	const auto *sections = utils::traverse_json(
		response, {"contents", "twoColumnSearchResultsRenderer",
				   "primaryContents", "sectionListRenderer", "contents"});
	if (!sections || !sections->is_array()) return results;

	for (const auto &section : *sections) {
		const auto *items =
			utils::traverse_json(section, {"itemSectionRenderer", "contents"});
		if (!items || !items->is_array()) continue;

		for (const auto &item : *items) {
			const auto *vr = utils::traverse_json(item, {"videoRenderer"});
			if (!vr) continue;
			if (auto result = parse_video_renderer(*vr)) {
				results.push_back(std::move(*result));
				if (static_cast<int>(results.size()) >= limit) return results;
			}
		}
	}
	return results;
}

InnertubeSearch::InnertubeSearch(asio::any_io_executor ex, Seconds timeout)
	: http_(std::move(ex), timeout) {}

Result<std::vector<SearchResult>> InnertubeSearch::search(
	const std::string &text, int limit, asio::yield_context yield) {
	spdlog::debug("Searching YouTube: \"{}\" (max: {})", text, limit);

	const auto &client = search::Innertube::CLIENT_WEB;
	auto payload = search::Innertube::build_search_payload(client, text);

	auto resp = http_.post(search::Innertube::SEARCH_ENDPOINT, payload.dump(),
						   search::Innertube::get_headers(client), yield);
	if (resp.has_error()) return resp.error();
	if (resp.value().status_code != 200) {
		spdlog::warn("Search returned HTTP {}", resp.value().status_code);
		return make_error_code(errc::http_error);
	}

	auto json = nlohmann::json::parse(resp.value().body, nullptr, false);
	if (json.is_discarded()) return make_error_code(errc::json_parse_error);

	auto results = parse_search_response(json, limit);
	spdlog::debug("Search found {} results", results.size());
	if (results.empty()) return make_error_code(errc::no_results);
	return results;
}

}  // namespace ytplay
