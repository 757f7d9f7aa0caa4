#pragma once

#include <ytplay/ytplay_export.h>

#include <string>
#include <string_view>
#include <ytplay/types.hpp>

namespace ytplay {

/// URL without its query string and fragment.
YTPLAY_EXPORT std::string strip_query(std::string_view url);

/// Normalize a secondary search result. Duration "M:SS" becomes seconds
/// (unparseable or missing durations become 0); the first thumbnail is used
/// with its query string stripped.
YTPLAY_EXPORT Metadata to_metadata(const SearchResult &result);

/// Track details for presentation; link is `watch_base_url` + video id.
YTPLAY_EXPORT TrackDetails to_track_details(const Metadata &metadata,
											std::string_view watch_base_url);

}  // namespace ytplay
