#pragma once

#include <ytplay/ytplay_export.h>

#include <chrono>
#include <string>
#include <vector>

namespace ytplay {

using Millis = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

struct YTPLAY_EXPORT PacerSettings {
	Millis min_delay{1500};
	Millis max_delay{3000};
};

struct YTPLAY_EXPORT RetryPolicy {
	int max_attempts = 3;
	// Backoff before attempt n+1 is seed + n * step + uniform(0, jitter)
	Millis backoff_seed{1000};
	Millis backoff_step{1000};
	Millis backoff_jitter{500};
};

/// Anti-detection and transport knobs shared by every backend call.
struct YTPLAY_EXPORT BackendSettings {
	std::string executable = "yt-dlp";
	Seconds socket_timeout{30};
	int retries = 3;
	bool geo_bypass = true;
	bool force_ipv4 = true;
	bool ignore_errors = true;
	std::vector<std::string> skip_streams = {"dash", "hls"};
	std::vector<std::string> player_clients = {"android", "web"};
	std::vector<std::string> user_agents = {
		"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
		"(KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36",
		"Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) "
		"AppleWebKit/605.1.15 (KHTML, like Gecko) Version/14.0.3 "
		"Safari/605.1.15",
		"Mozilla/5.0 (iPhone; CPU iPhone OS 14_6 like Mac OS X) "
		"AppleWebKit/605.1.15 (KHTML, like Gecko) Version/14.0 "
		"Mobile/15E148 Safari/604.1"};
	std::string referer = "https://www.youtube.com/";
	std::string throttled_rate = "1M";
	int sleep_interval_min = 1;	 // seconds, drawn per attempt
	int sleep_interval_max = 3;

	// Whole-process bounds for the subprocess backend
	Seconds info_timeout{120};
	Seconds download_timeout{1800};
	Seconds direct_url_timeout{20};
};

struct YTPLAY_EXPORT PipelineConfig {
	PacerSettings pacer;
	RetryPolicy retry;
	BackendSettings backend;

	std::string watch_base_url = "https://www.youtube.com/watch?v=";
	std::string search_prefix = "ytsearch:";
	std::string downloads_dir = "downloads";
	std::string audio_ext = "mp3";	// canonical audio extension
	std::string audio_quality = "192";
	int worker_threads = 4;
	int slider_results = 10;
};

}  // namespace ytplay
