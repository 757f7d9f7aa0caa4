#include <algorithm>
#include <random>
#include <string>
#include <vector>
#include <ytplay/backend.hpp>
#include <ytplay/format_selector.hpp>
#include <ytplay/ytdlp_backend.hpp>

#include "../framework/SimpleTest.hpp"

using namespace ytplay;

namespace {

bool contains(const std::vector<std::string> &args, const std::string &arg) {
	return std::find(args.begin(), args.end(), arg) != args.end();
}

// Value following `flag`, empty when absent
std::string value_of(const std::vector<std::string> &args,
					 const std::string &flag) {
	auto it = std::find(args.begin(), args.end(), flag);
	if (it == args.end() || it + 1 == args.end()) return "";
	return *(it + 1);
}

}  // namespace

TEST_CASE(test_builder_carries_anti_detection_settings) {
	BackendSettings settings;
	auto opts = BackendOptionsBuilder(settings).build();

	ASSERT_TRUE(opts.geo_bypass);
	ASSERT_TRUE(opts.force_ipv4);
	ASSERT_TRUE(opts.socket_timeout == Seconds{30});
	ASSERT_EQ(opts.retries, 3);
	ASSERT_EQ(opts.throttled_rate, "1M");
	ASSERT_EQ(opts.skip_streams.size(), 2u);
	ASSERT_TRUE(opts.process_timeout == settings.info_timeout);
}

TEST_CASE(test_builder_randomizes_within_pool) {
	BackendSettings settings;
	std::mt19937 rng(42);
	for (int i = 0; i < 20; ++i) {
		auto opts = BackendOptionsBuilder(settings).randomize(rng).build();
		ASSERT_TRUE(std::find(settings.user_agents.begin(),
							  settings.user_agents.end(),
							  opts.user_agent) != settings.user_agents.end());
		ASSERT_GE(opts.sleep_interval, settings.sleep_interval_min);
		ASSERT_LE(opts.sleep_interval, settings.sleep_interval_max);
	}
}

TEST_CASE(test_builder_applies_audio_selection) {
	BackendSettings settings;
	auto opts = BackendOptionsBuilder(settings)
					.selection(select_format(mode::NamedSongAudio{"251", "x"}),
							   "mp3", "192")
					.output_dir("downloads")
					.no_playlist()
					.timeout(Seconds{5})
					.build();
	ASSERT_EQ(opts.format, "251");
	ASSERT_TRUE(opts.extract_audio);
	ASSERT_EQ(opts.audio_format, "mp3");
	ASSERT_EQ(opts.audio_quality, "192");
	ASSERT_EQ(opts.output_dir, "downloads");
	ASSERT_TRUE(opts.no_playlist);
	ASSERT_TRUE(opts.process_timeout == Seconds{5});
}

TEST_CASE(test_arguments_for_metadata_call) {
	BackendSettings settings;
	auto opts = BackendOptionsBuilder(settings).format("bestaudio/best").build();
	auto args = build_backend_arguments("ytsearch:never gonna", opts, false);

	ASSERT_EQ(args.front(), "--dump-single-json");
	ASSERT_FALSE(contains(args, "--no-simulate"));
	ASSERT_EQ(value_of(args, "-f"), "bestaudio/best");
	ASSERT_TRUE(contains(args, "--geo-bypass"));
	ASSERT_TRUE(contains(args, "--force-ipv4"));
	ASSERT_EQ(value_of(args, "--socket-timeout"), "30");
	ASSERT_EQ(value_of(args, "--extractor-args"),
			  "youtube:skip=dash,hls;player_client=android,web");
	ASSERT_EQ(value_of(args, "--throttled-rate"), "1M");
	ASSERT_FALSE(value_of(args, "--user-agent").empty());
	// Query always last, after the option terminator
	ASSERT_EQ(args.back(), "ytsearch:never gonna");
	ASSERT_EQ(args[args.size() - 2], "--");
}

TEST_CASE(test_arguments_for_download_call) {
	BackendSettings settings;
	auto opts = BackendOptionsBuilder(settings)
					.selection(select_format(mode::VideoUpTo720{}), "mp3", "192")
					.output_dir("downloads")
					.build();
	auto args = build_backend_arguments("https://youtu.be/x", opts, true);

	ASSERT_TRUE(contains(args, "--no-simulate"));
	ASSERT_EQ(value_of(args, "-P"), "downloads");
	ASSERT_EQ(value_of(args, "-o"), "%(id)s.%(ext)s");
	ASSERT_EQ(value_of(args, "--merge-output-format"), "mp4");
	ASSERT_FALSE(contains(args, "-x"));
}

TEST_CASE(test_arguments_for_flat_playlist) {
	BackendSettings settings;
	auto opts = BackendOptionsBuilder(settings).format("").flat_playlist(5).build();
	auto args = build_backend_arguments("https://www.youtube.com/playlist?list=PL1",
										opts, false);
	ASSERT_FALSE(contains(args, "-f"));
	ASSERT_TRUE(contains(args, "--flat-playlist"));
	ASSERT_EQ(value_of(args, "--playlist-end"), "5");
}

TEST_CASE(test_direct_resolver_arguments) {
	auto args = YtDlpDirectUrlResolver::arguments("https://youtu.be/x");
	ASSERT_EQ(args[0], "-g");
	ASSERT_EQ(value_of(args, "-f"), "best[height<=?720][width<=?1280]");
	ASSERT_EQ(args.back(), "https://youtu.be/x");
}

TEST_CASE(test_parse_single_item) {
	auto info = parse_info_json(R"({
		"id": "dQw4w9WgXcQ",
		"title": "Test Song",
		"duration": 212.0,
		"thumbnail": "https://i.ytimg.com/vi/dQw4w9WgXcQ/maxresdefault.jpg",
		"ext": "webm",
		"requested_downloads": [{"filepath": "downloads/dQw4w9WgXcQ.webm"}],
		"formats": [
			{"format_id": "140", "ext": "m4a", "format_note": "medium",
			 "vcodec": "none", "acodec": "mp4a.40.2", "filesize": 3433514}
		]
	})");
	ASSERT_TRUE(info.has_value());
	const auto &item = info.value();
	ASSERT_EQ(item.id, "dQw4w9WgXcQ");
	ASSERT_EQ(item.title, "Test Song");
	ASSERT_EQ(item.duration, 212);
	ASSERT_EQ(item.filepath, "downloads/dQw4w9WgXcQ.webm");
	ASSERT_FALSE(item.has_entries);
	ASSERT_EQ(item.formats.size(), 1u);
	ASSERT_EQ(item.formats[0].filesize, 3433514);
}

TEST_CASE(test_parse_search_response_entries) {
	auto info = parse_info_json(R"({
		"_type": "playlist",
		"entries": [null, {"id": "abc", "title": "First", "duration": 61}]
	})");
	ASSERT_TRUE(info.has_value());
	ASSERT_TRUE(info.value().has_entries);
	ASSERT_EQ(info.value().entries.size(), 1u);
	ASSERT_EQ(info.value().entries[0].id, "abc");
}

TEST_CASE(test_parse_rejects_null_and_garbage) {
	ASSERT_EQ(parse_info_json("null").error(),
			  make_error_code(errc::transient_extraction_failure));
	ASSERT_EQ(parse_info_json("").error(),
			  make_error_code(errc::json_parse_error));
	ASSERT_EQ(parse_info_json("ERROR: blocked").error(),
			  make_error_code(errc::json_parse_error));
}

int main() { return ytplay::test::TestRunner::instance().run_all(); }
