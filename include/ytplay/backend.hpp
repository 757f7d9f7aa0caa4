#pragma once

#include <ytplay/ytplay_export.h>

#include <boost/asio/spawn.hpp>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <ytplay/config.hpp>
#include <ytplay/format_selector.hpp>
#include <ytplay/result.hpp>
#include <ytplay/types.hpp>
#include <ytplay/worker_pool.hpp>

namespace ytplay {

// =============================================================================
// Backend options
// =============================================================================

/// Every option the extraction backend recognizes, with explicit defaults.
struct YTPLAY_EXPORT BackendOptions {
	// Format selection and output
	std::string format = "best";
	std::string output_template;  // empty: backend default
	std::string output_dir;
	std::optional<std::string> merge_output_format;

	// Post-processing
	bool extract_audio = false;
	std::string audio_format;
	std::string audio_quality;

	// Verbosity
	bool quiet = true;
	bool no_warnings = true;
	bool ignore_errors = true;

	// Transport and anti-detection
	int retries = 3;
	bool geo_bypass = true;
	bool force_ipv4 = true;
	Seconds socket_timeout{30};
	std::vector<std::string> skip_streams;
	std::vector<std::string> player_clients;
	std::string user_agent;
	std::string referer;
	std::string throttled_rate;
	int sleep_interval = 0;	 // seconds, 0 disables

	// Playlists
	bool flat_playlist = false;
	int playlist_end = 0;  // 0: unbounded
	bool no_playlist = false;

	// Whole-call bound, 0 disables
	Seconds process_timeout{0};
};

/// Builds one BackendOptions per attempt so repeated attempts differ in
/// user agent and sleep interval.
class YTPLAY_EXPORT BackendOptionsBuilder {
   public:
	explicit BackendOptionsBuilder(const BackendSettings &settings);

	/// Draw a fresh user agent and sleep interval.
	BackendOptionsBuilder &randomize(std::mt19937 &rng);

	BackendOptionsBuilder &format(std::string selector);

	/// Apply a format selection; `audio_ext`/`audio_quality` feed the
	/// transcoding directive when the selection asks for one.
	BackendOptionsBuilder &selection(const FormatSelection &sel,
									 const std::string &audio_ext,
									 const std::string &audio_quality);

	BackendOptionsBuilder &output_dir(std::string dir);
	BackendOptionsBuilder &flat_playlist(int limit);
	BackendOptionsBuilder &no_playlist();
	BackendOptionsBuilder &timeout(Seconds t);

	[[nodiscard]] BackendOptions build() const { return opts_; }

   private:
	const BackendSettings &settings_;
	BackendOptions opts_;
};

// =============================================================================
// Backend results
// =============================================================================

struct YTPLAY_EXPORT BackendFormat {
	std::string format_id;
	std::string ext;
	std::string format_note;
	std::string url;
	std::string vcodec;
	std::string acodec;
	std::string protocol;
	int width = 0;
	int height = 0;
	long long filesize = 0;
};

struct YTPLAY_EXPORT BackendInfo {
	std::string id;
	std::string title;
	long long duration = 0;
	std::string thumbnail;
	std::string webpage_url;
	std::string url;	   // direct media URL of the selected format
	std::string ext;
	std::string filepath;  // final path when downloaded
	std::vector<BackendFormat> formats;

	// Search and playlist responses carry entries instead of an item
	bool has_entries = false;
	std::vector<BackendInfo> entries;
};

// =============================================================================
// Collaborators
// =============================================================================

/// Primary extraction backend. Calls block; run them on a WorkerPool.
class YTPLAY_EXPORT ExtractionBackend {
   public:
	virtual ~ExtractionBackend() = default;

	/// Extract info for a URL, bare video id or search-prefixed query.
	/// With `download` set the selected format is written to the templated
	/// path and BackendInfo::filepath names it.
	virtual Result<BackendInfo> extract_info(const std::string &query,
											 const BackendOptions &options,
											 bool download,
											 const CancellationToken &cancel) = 0;
};

/// Resolves a direct streamable URL (<=720p) without downloading. Blocking.
class YTPLAY_EXPORT DirectUrlResolver {
   public:
	virtual ~DirectUrlResolver() = default;

	virtual Result<std::string> resolve(const std::string &link,
										Seconds timeout,
										const CancellationToken &cancel) = 0;
};

/// Secondary search provider used when the backend cannot resolve a query.
class YTPLAY_EXPORT SearchProvider {
   public:
	virtual ~SearchProvider() = default;

	virtual Result<std::vector<SearchResult>> search(
		const std::string &text, int limit, asio::yield_context yield) = 0;
};

/// Host configuration query: is direct-link mode enabled?
using DirectLinkFlag = std::function<bool()>;

}  // namespace ytplay
