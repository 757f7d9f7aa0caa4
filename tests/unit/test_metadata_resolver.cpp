#include <ytplay/metadata_resolver.hpp>

#include "../fakes/fakes.hpp"
#include "../framework/SimpleTest.hpp"

using namespace ytplay;
using namespace ytplay::test;

namespace {

struct Fixture {
	PipelineConfig config = fast_config();
	CountingPacer pacer;
	WorkerPool pool{2};
	FakeBackend backend;
	FakeSearch search;
	MetadataResolver resolver{pacer, pool, backend, search, config};

	Metadata resolve(const Reference &ref, CancellationToken cancel = {}) {
		Metadata md;
		run_coroutine([&](asio::yield_context yield) {
			md = resolver.resolve(ref, yield, cancel);
		});
		return md;
	}
};

SearchResult search_hit() {
	SearchResult r;
	r.video_id = "fallback001";
	r.title = "Fallback Song";
	r.duration_string = "3:32";
	r.thumbnails = {"https://i.ytimg.com/vi/fallback001/hq720.jpg?sqp=abc&rs=x"};
	return r;
}

}  // namespace

TEST_CASE(test_classify_attempt_transitions) {
	Result<BackendInfo> failed = make_error_code(errc::transient_extraction_failure);
	ASSERT_TRUE(std::holds_alternative<resolve_step::Retry>(
		classify_attempt(failed, 1, 3)));
	ASSERT_TRUE(std::holds_alternative<resolve_step::Fallback>(
		classify_attempt(failed, 3, 3)));

	Result<BackendInfo> cancelled = make_error_code(errc::cancelled);
	ASSERT_TRUE(std::holds_alternative<resolve_step::SentinelFailure>(
		classify_attempt(cancelled, 1, 3)));

	BackendInfo empty_set;
	empty_set.has_entries = true;
	auto step = classify_attempt(empty_set, 1, 3);
	ASSERT_TRUE(std::holds_alternative<resolve_step::Fallback>(step));
	ASSERT_EQ(std::get<resolve_step::Fallback>(step).reason,
			  make_error_code(errc::no_results));

	BackendInfo item = make_item("abc", "Title", 61);
	ASSERT_TRUE(std::holds_alternative<resolve_step::Success>(
		classify_attempt(item, 1, 3)));
}

TEST_CASE(test_direct_url_resolves_on_first_attempt) {
	Fixture f;
	f.backend.push(make_item("dQw4w9WgXcQ", "Test Song", 212));

	auto md = f.resolve(Reference::direct_url(
		"https://www.youtube.com/watch?v=dQw4w9WgXcQ&list=RD&index=2"));

	ASSERT_EQ(md.title, "Test Song");
	ASSERT_EQ(md.duration_seconds, 212);
	ASSERT_EQ(md.duration_display(), "3:32");
	ASSERT_EQ(f.backend.calls.size(), 1u);
	ASSERT_EQ(f.backend.calls[0].query,
			  "https://www.youtube.com/watch?v=dQw4w9WgXcQ");
	ASSERT_FALSE(f.backend.calls[0].download);
	ASSERT_EQ(f.pacer.slots.load(), 1);
	ASSERT_TRUE(f.search.queries.empty());
}

TEST_CASE(test_search_query_takes_first_entry) {
	Fixture f;
	BackendInfo set;
	set.has_entries = true;
	set.entries.push_back(make_item("first000001", "First", 100));
	set.entries.push_back(make_item("second00002", "Second", 200));
	f.backend.push(set);

	auto md = f.resolve(Reference::search_query("never gonna give you up"));

	ASSERT_EQ(md.video_id, "first000001");
	ASSERT_EQ(f.backend.calls[0].query, "ytsearch:never gonna give you up");
}

TEST_CASE(test_retry_then_success) {
	Fixture f;
	f.backend.push(make_error_code(errc::transient_extraction_failure));
	f.backend.push(make_item("abc", "Second Try", 30));

	auto md = f.resolve(Reference::video_id("abc"));

	ASSERT_EQ(md.title, "Second Try");
	ASSERT_EQ(f.backend.calls.size(), 2u);
	ASSERT_EQ(f.pacer.slots.load(), 2);
	ASSERT_TRUE(f.search.queries.empty());
}

TEST_CASE(test_every_attempt_paced_and_reconfigured) {
	Fixture f;
	f.backend.push(make_error_code(errc::transient_extraction_failure));
	f.search.results = {search_hit()};

	f.resolve(Reference::search_query("song"));

	ASSERT_EQ(f.backend.calls.size(), 3u);
	ASSERT_EQ(f.pacer.slots.load(), 3);
	for (const auto &call : f.backend.calls) {
		ASSERT_FALSE(call.options.user_agent.empty());
		ASSERT_TRUE(call.options.geo_bypass);
		ASSERT_TRUE(call.options.force_ipv4);
		ASSERT_EQ(call.options.format, "bestaudio/best");
	}
}

TEST_CASE(test_exhausted_attempts_fall_back_exactly_once) {
	Fixture f;
	f.backend.push(make_error_code(errc::transient_extraction_failure));
	f.search.results = {search_hit()};

	auto md = f.resolve(Reference::search_query("ytsearch:some song"));

	ASSERT_EQ(f.search.queries.size(), 1u);
	ASSERT_EQ(f.search.queries[0], "some song");
	ASSERT_EQ(f.search.limits[0], 1);
	ASSERT_EQ(md.title, "Fallback Song");
	ASSERT_EQ(md.duration_seconds, 212);
	ASSERT_EQ(md.thumbnail_url, "https://i.ytimg.com/vi/fallback001/hq720.jpg");
}

TEST_CASE(test_empty_result_set_skips_retries) {
	Fixture f;
	BackendInfo empty_set;
	empty_set.has_entries = true;
	f.backend.push(empty_set);
	f.search.results = {search_hit()};

	auto md = f.resolve(Reference::search_query("nothing matches"));

	ASSERT_EQ(f.backend.calls.size(), 1u);
	ASSERT_EQ(f.search.queries.size(), 1u);
	ASSERT_EQ(md.video_id, "fallback001");
}

TEST_CASE(test_total_failure_yields_sentinel) {
	PipelineConfig config = fast_config();
	CountingPacer pacer;
	WorkerPool pool(2);
	ThrowingBackend backend;
	FakeSearch search;
	search.raise = true;
	MetadataResolver resolver(pacer, pool, backend, search, config);

	Metadata md;
	run_coroutine([&](asio::yield_context yield) {
		md = resolver.resolve(Reference::search_query("anything"), yield);
	});

	ASSERT_TRUE(md.is_sentinel());
	ASSERT_EQ(md.title, "Unknown Title");
	ASSERT_EQ(md.duration_display(), "0:00");
	ASSERT_EQ(backend.calls.load(), 3);
	ASSERT_EQ(search.queries.size(), 1u);
}

TEST_CASE(test_fallback_with_no_results_yields_sentinel) {
	Fixture f;
	f.backend.push(make_error_code(errc::transient_extraction_failure));

	auto md = f.resolve(Reference::search_query("obscure"));

	ASSERT_TRUE(md.is_sentinel());
	ASSERT_EQ(f.search.queries.size(), 1u);
}

TEST_CASE(test_cancelled_request_stops_before_backend) {
	Fixture f;
	f.backend.push(make_item("abc", "Never", 1));
	CancellationToken cancel;
	cancel.cancel();

	auto md = f.resolve(Reference::video_id("abc"), cancel);

	ASSERT_TRUE(md.is_sentinel());
	ASSERT_TRUE(f.backend.calls.empty());
	ASSERT_TRUE(f.search.queries.empty());
}

TEST_CASE(test_list_formats_filters_unusable_entries) {
	Fixture f;
	BackendInfo item = make_item("dQw4w9WgXcQ", "Test Song", 212);
	BackendFormat audio{"140", "m4a", "medium", "", "none", "mp4a", "https"};
	audio.filesize = 1000;
	BackendFormat video{"22", "mp4", "720p", "", "avc1", "mp4a", "https"};
	video.width = 1280;
	video.height = 720;
	BackendFormat dash{"137", "mp4", "1080p DASH video", "", "avc1", "none",
					   "https"};
	BackendFormat storyboard{"sb0", "mhtml", "", "", "none", "none", "mhtml"};
	item.formats = {audio, video, dash, storyboard};
	f.backend.push(item);

	std::vector<FormatOption> formats;
	run_coroutine([&](asio::yield_context yield) {
		formats = f.resolver.list_formats(
			Reference::direct_url("https://youtu.be/dQw4w9WgXcQ"), yield);
	});

	ASSERT_EQ(formats.size(), 2u);
	ASSERT_EQ(formats[0].format_id, "140");
	ASSERT_EQ(formats[0].resolution, "audio only");
	ASSERT_EQ(formats[1].resolution, "1280x720");
	ASSERT_EQ(formats[1].link, "https://www.youtube.com/watch?v=dQw4w9WgXcQ");
	ASSERT_EQ(f.pacer.slots.load(), 1);
}

TEST_CASE(test_search_slider_picks_index) {
	Fixture f;
	for (int i = 0; i < 3; ++i) {
		auto hit = search_hit();
		hit.video_id = "video" + std::to_string(i);
		f.search.results.push_back(hit);
	}

	Metadata second;
	Metadata past_end;
	run_coroutine([&](asio::yield_context yield) {
		second = f.resolver.search_slider("songs", 1, yield);
		past_end = f.resolver.search_slider("songs", 5, yield);
	});

	ASSERT_EQ(second.video_id, "video1");
	ASSERT_TRUE(past_end.is_sentinel());
	ASSERT_EQ(f.search.limits[0], 10);
}

int main() { return ytplay::test::TestRunner::instance().run_all(); }
