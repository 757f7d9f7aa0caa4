#include <ytplay/format_selector.hpp>
#include <ytplay/output_template.hpp>

#include "../framework/SimpleTest.hpp"

using namespace ytplay;

TEST_CASE(test_audio_only_never_requests_video) {
	auto sel = select_format(mode::AudioOnly{});
	ASSERT_EQ(sel.format, "bestaudio");
	ASSERT_TRUE(sel.format.find("video") == std::string::npos);
	ASSERT_EQ(sel.output_template, "%(id)s.%(ext)s");
	ASSERT_FALSE(sel.merge_output_format.has_value());
	ASSERT_TRUE(produces_audio(mode::AudioOnly{}));
}

TEST_CASE(test_video_capped_at_720_and_merged) {
	auto sel = select_format(mode::VideoUpTo720{});
	ASSERT_TRUE(sel.format.find("height<=?720") != std::string::npos);
	ASSERT_TRUE(sel.format.find("+") != std::string::npos);
	ASSERT_EQ(sel.output_template, "%(id)s.%(ext)s");
	ASSERT_TRUE(sel.merge_output_format.has_value());
	ASSERT_EQ(*sel.merge_output_format, "mp4");
	ASSERT_FALSE(produces_audio(mode::VideoUpTo720{}));
}

TEST_CASE(test_named_song_audio_uses_exact_format) {
	auto sel = select_format(mode::NamedSongAudio{"251", "My Song"});
	ASSERT_EQ(sel.format, "251");
	ASSERT_EQ(sel.output_template, "My Song.%(ext)s");
	ASSERT_TRUE(sel.extract_audio);
	ASSERT_TRUE(produces_audio(mode::NamedSongAudio{"251", "My Song"}));
}

TEST_CASE(test_named_song_video_merges_best_audio) {
	auto sel = select_format(mode::NamedSongVideo{"137", "MySong"});
	ASSERT_TRUE(sel.format.find("137") != std::string::npos);
	ASSERT_EQ(sel.format, "137+bestaudio[ext=m4a]/137+bestaudio");
	ASSERT_TRUE(sel.format.find("140") == std::string::npos);
	ASSERT_EQ(sel.output_template, "MySong.mp4");
	ASSERT_TRUE(sel.merge_output_format.has_value());
	ASSERT_EQ(*sel.merge_output_format, "mp4");
}

TEST_CASE(test_mode_names) {
	ASSERT_EQ(to_string(AcquisitionMode{mode::AudioOnly{}}), "audio");
	ASSERT_EQ(to_string(AcquisitionMode{mode::VideoUpTo720{}}), "video");
	ASSERT_EQ(to_string(AcquisitionMode{mode::NamedSongAudio{}}), "song-audio");
	ASSERT_EQ(to_string(AcquisitionMode{mode::NamedSongVideo{}}), "song-video");
}

TEST_CASE(test_title_is_sanitized_for_templates) {
	auto sel = select_format(mode::NamedSongVideo{"22", "AC/DC: Back 100%?"});
	ASSERT_EQ(sel.output_template, "AC_DC_ Back 100%%_.mp4");

	ASSERT_EQ(sanitize_filename("name. . "), "name");
	ASSERT_EQ(sanitize_filename("line\nbreak"), "line break");
	ASSERT_EQ(sanitize_filename("\x01\x02"), "video");
	ASSERT_EQ(escape_template_literal("50%"), "50%%");
}

int main() { return ytplay::test::TestRunner::instance().run_all(); }
