#include <algorithm>
#include <ytplay/backend.hpp>

namespace ytplay {

BackendOptionsBuilder::BackendOptionsBuilder(const BackendSettings &settings)
	: settings_(settings) {
	opts_.ignore_errors = settings.ignore_errors;
	opts_.retries = settings.retries;
	opts_.geo_bypass = settings.geo_bypass;
	opts_.force_ipv4 = settings.force_ipv4;
	opts_.socket_timeout = settings.socket_timeout;
	opts_.skip_streams = settings.skip_streams;
	opts_.player_clients = settings.player_clients;
	opts_.referer = settings.referer;
	opts_.throttled_rate = settings.throttled_rate;
	opts_.process_timeout = settings.info_timeout;
	if (!settings.user_agents.empty()) {
		opts_.user_agent = settings.user_agents.front();
	}
}

BackendOptionsBuilder &BackendOptionsBuilder::randomize(std::mt19937 &rng) {
	if (!settings_.user_agents.empty()) {
		std::uniform_int_distribution<std::size_t> pick(
			0, settings_.user_agents.size() - 1);
		opts_.user_agent = settings_.user_agents[pick(rng)];
	}
	if (settings_.sleep_interval_max > 0) {
		int lo = std::min(settings_.sleep_interval_min,
						  settings_.sleep_interval_max);
		std::uniform_int_distribution<int> sleep(
			lo, settings_.sleep_interval_max);
		opts_.sleep_interval = sleep(rng);
	}
	return *this;
}

BackendOptionsBuilder &BackendOptionsBuilder::format(std::string selector) {
	opts_.format = std::move(selector);
	return *this;
}

BackendOptionsBuilder &BackendOptionsBuilder::selection(
	const FormatSelection &sel, const std::string &audio_ext,
	const std::string &audio_quality) {
	opts_.format = sel.format;
	opts_.output_template = sel.output_template;
	opts_.merge_output_format = sel.merge_output_format;
	opts_.extract_audio = sel.extract_audio;
	if (sel.extract_audio) {
		opts_.audio_format = audio_ext;
		opts_.audio_quality = audio_quality;
	}
	return *this;
}

BackendOptionsBuilder &BackendOptionsBuilder::output_dir(std::string dir) {
	opts_.output_dir = std::move(dir);
	return *this;
}

BackendOptionsBuilder &BackendOptionsBuilder::flat_playlist(int limit) {
	opts_.flat_playlist = true;
	opts_.playlist_end = limit;
	return *this;
}

BackendOptionsBuilder &BackendOptionsBuilder::no_playlist() {
	opts_.no_playlist = true;
	return *this;
}

BackendOptionsBuilder &BackendOptionsBuilder::timeout(Seconds t) {
	opts_.process_timeout = t;
	return *this;
}

}  // namespace ytplay
