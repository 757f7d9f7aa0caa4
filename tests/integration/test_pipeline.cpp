#include <boost/asio/io_context.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <ytplay/pipeline.hpp>
#include <ytplay/reference.hpp>

#include "../fakes/fakes.hpp"
#include "../framework/SimpleTest.hpp"

using namespace ytplay;
using namespace ytplay::test;
namespace fs = std::filesystem;

namespace {

struct Harness {
	asio::io_context ioc;
	fs::path dir = fs::temp_directory_path() /
				   ("ytplay-it-" + std::to_string(std::random_device{}()));
	FakeBackend *backend = nullptr;
	FakeSearch *search = nullptr;
	FakeDirect *direct = nullptr;
	std::optional<Pipeline> pipeline;

	explicit Harness(std::unique_ptr<ExtractionBackend> custom = nullptr,
					 bool direct_link = false) {
		fs::create_directories(dir);
		auto config = fast_config();
		config.downloads_dir = dir.string();

		Collaborators c;
		if (custom) {
			c.backend = std::move(custom);
		} else {
			auto b = std::make_unique<FakeBackend>();
			backend = b.get();
			c.backend = std::move(b);
		}
		auto s = std::make_unique<FakeSearch>();
		search = s.get();
		c.search = std::move(s);
		auto d = std::make_unique<FakeDirect>();
		direct = d.get();
		c.direct = std::move(d);
		c.pacer = std::make_unique<NoopPacer>();
		c.direct_link = [direct_link] { return direct_link; };

		pipeline.emplace(
			Pipeline::create(ioc.get_executor(), config, std::move(c)));
	}

	~Harness() {
		pipeline->shutdown();
		std::error_code ec;
		fs::remove_all(dir, ec);
	}
};

// Info calls describe the track; download calls write `<id>.webm`
FakeBackend::Script youtube_like(fs::path dir) {
	return [dir](const BackendCall &call) -> Result<BackendInfo> {
		BackendInfo info = make_item("dQw4w9WgXcQ", "Test Song", 212);
		info.thumbnail = "https://i.ytimg.com/vi/dQw4w9WgXcQ/hq.jpg?sqp=1";
		if (call.download) {
			auto path = dir / "dQw4w9WgXcQ.webm";
			std::ofstream(path) << "media";
			info.filepath = path.string();
		}
		return info;
	};
}

}  // namespace

TEST_CASE(test_resolve_then_acquire_audio) {
	Harness h;
	h.backend->on_call(youtube_like(h.dir));

	auto ref = classify_reference("https://youtu.be/dQw4w9WgXcQ");
	ASSERT_TRUE(ref.has_value());

	Metadata md;
	AcquisitionResult acquired;
	h.pipeline->async_resolve(*ref, [&](Metadata m) {
		md = std::move(m);
		h.pipeline->async_acquire(*ref, mode::AudioOnly{},
								  [&](AcquisitionResult r) { acquired = r; });
	});
	h.ioc.run();

	ASSERT_EQ(md.title, "Test Song");
	ASSERT_EQ(md.duration_seconds, 212);
	ASSERT_EQ(md.duration_display(), "3:32");
	ASSERT_EQ(md.video_id, "dQw4w9WgXcQ");

	ASSERT_TRUE(acquired.succeeded);
	ASSERT_FALSE(acquired.is_direct);
	ASSERT_EQ(fs::path(acquired.location).extension().string(), ".mp3");
	ASSERT_TRUE(fs::exists(acquired.location));

	ASSERT_EQ(h.backend->calls.size(), 2u);
	ASSERT_FALSE(h.backend->calls[0].download);
	ASSERT_TRUE(h.backend->calls[1].download);
	ASSERT_TRUE(h.search->queries.empty());
}

TEST_CASE(test_total_failure_yields_sentinel) {
	Harness h(std::make_unique<ThrowingBackend>());
	h.search->raise = true;

	Metadata md;
	md.title = "stale";
	h.pipeline->async_resolve(Reference::search_query("some song"),
							  [&](Metadata m) { md = std::move(m); });
	h.ioc.run();

	ASSERT_EQ(md.title, "Unknown Title");
	ASSERT_EQ(md.duration_seconds, 0);
	ASSERT_EQ(md.duration_display(), "0:00");
	ASSERT_TRUE(md.is_sentinel());
	ASSERT_EQ(h.search->queries.size(), 1u);
}

TEST_CASE(test_search_fallback_after_retries) {
	Harness h;
	SearchResult hit;
	hit.video_id = "fallback001";
	hit.title = "From Search";
	hit.duration_string = "4:05";
	h.search->results.push_back(hit);

	Metadata md;
	h.pipeline->async_resolve(Reference::search_query("obscure"),
							  [&](Metadata m) { md = std::move(m); });
	h.ioc.run();

	ASSERT_EQ(md.title, "From Search");
	ASSERT_EQ(md.duration_seconds, 245);
	ASSERT_EQ(h.backend->calls.size(), 3u);
	ASSERT_EQ(h.search->queries.size(), 1u);
	ASSERT_EQ(h.search->queries[0], "obscure");
}

TEST_CASE(test_direct_link_video) {
	Harness h(nullptr, true);
	h.direct->url = "https://rr1.googlevideo.com/videoplayback?itag=22";

	AcquisitionResult acquired;
	h.pipeline->async_acquire(
		Reference::direct_url("https://www.youtube.com/watch?v=dQw4w9WgXcQ"),
		mode::VideoUpTo720{}, [&](AcquisitionResult r) { acquired = r; });
	h.ioc.run();

	ASSERT_TRUE(acquired.succeeded);
	ASSERT_TRUE(acquired.is_direct);
	ASSERT_EQ(acquired.location, h.direct->url);
	ASSERT_TRUE(h.backend->calls.empty());
}

TEST_CASE(test_playlist_expansion) {
	Harness h;
	BackendInfo list;
	list.has_entries = true;
	for (const char *id : {"a", "b", "c", "d"}) {
		list.entries.push_back(make_item(id, "", 0));
	}
	h.backend->push(list);

	std::vector<std::string> ids;
	h.pipeline->async_expand(
		Reference::playlist_url("https://www.youtube.com/playlist?list=PL1"), 3,
		[&](std::vector<std::string> v) { ids = std::move(v); });
	h.ioc.run();

	ASSERT_EQ(ids.size(), 3u);
	ASSERT_EQ(ids[2], "c");
}

TEST_CASE(test_concurrent_requests_share_pool) {
	Harness h;
	h.backend->on_call(youtube_like(h.dir));

	int done = 0;
	for (int i = 0; i < 5; ++i) {
		h.pipeline->async_resolve(Reference::video_id("dQw4w9WgXcQ"),
								  [&](Metadata m) {
									  ASSERT_EQ(m.title, "Test Song");
									  ++done;
								  });
	}
	h.ioc.run();

	ASSERT_EQ(done, 5);
	ASSERT_EQ(h.backend->calls.size(), 5u);
}

TEST_CASE(test_requests_after_shutdown_complete) {
	Harness h;
	h.backend->on_call(youtube_like(h.dir));
	h.pipeline->shutdown();

	Metadata md;
	md.title = "stale";
	AcquisitionResult acquired;
	acquired.succeeded = true;
	h.pipeline->async_resolve(Reference::video_id("dQw4w9WgXcQ"),
							  [&](Metadata m) { md = std::move(m); });
	h.pipeline->async_acquire(Reference::video_id("dQw4w9WgXcQ"),
							  mode::AudioOnly{},
							  [&](AcquisitionResult r) { acquired = r; });
	h.ioc.run();

	ASSERT_TRUE(md.is_sentinel());
	ASSERT_FALSE(acquired.succeeded);
	ASSERT_TRUE(h.backend->calls.empty());
}

int main() { return ytplay::test::TestRunner::instance().run_all(); }
