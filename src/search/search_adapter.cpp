#include <spdlog/spdlog.h>

#include <ytplay/duration.hpp>
#include <ytplay/search_adapter.hpp>

namespace ytplay {

std::string strip_query(std::string_view url) {
	auto end = url.find_first_of("?#");
	return std::string(url.substr(0, end));
}

Metadata to_metadata(const SearchResult &result) {
	Metadata md;
	md.title = result.title.empty() ? std::string(kUnknownTitle) : result.title;
	md.video_id = result.video_id;

	if (!result.duration_string.empty()) {
		auto seconds = parse_duration(result.duration_string);
		if (seconds) {
			md.duration_seconds = seconds.value();
		} else {
			spdlog::debug("Unparseable duration \"{}\" for {}",
						  result.duration_string, result.video_id);
		}
	}

	if (!result.thumbnails.empty()) {
		md.thumbnail_url = strip_query(result.thumbnails.front());
	}
	return md;
}

TrackDetails to_track_details(const Metadata &metadata,
							  std::string_view watch_base_url) {
	TrackDetails details;
	details.title = metadata.title;
	details.video_id = metadata.video_id;
	if (!metadata.video_id.empty()) {
		details.link = std::string(watch_base_url) + metadata.video_id;
	}
	details.duration_display = metadata.duration_display();
	details.thumbnail = metadata.thumbnail_url;
	return details;
}

}  // namespace ytplay
