#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/coroutine/attributes.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <ytplay/pipeline.hpp>
#include <ytplay/reference.hpp>
#include <ytplay/search_adapter.hpp>
#include <ytplay/types.hpp>

namespace po = boost::program_options;
namespace asio = boost::asio;

// =============================================================================
// Output
// =============================================================================

nlohmann::json track_json(const ytplay::TrackDetails &t) {
	return {{"title", t.title},
			{"link", t.link},
			{"video_id", t.video_id},
			{"duration", t.duration_display},
			{"thumbnail", t.thumbnail}};
}

void print_track(const ytplay::TrackDetails &t, bool dump_json) {
	if (dump_json) {
		std::cout << track_json(t).dump(2) << "\n";
		return;
	}
	fmt::println("{} [{}]", t.title, t.duration_display);
	if (!t.video_id.empty()) fmt::println("  {}", t.link);
	if (!t.thumbnail.empty()) fmt::println("  thumbnail: {}", t.thumbnail);
}

void print_formats(const std::vector<ytplay::FormatOption> &formats,
				   bool dump_json) {
	if (dump_json) {
		auto j = nlohmann::json::array();
		for (const auto &f : formats) {
			j.push_back({{"format_id", f.format_id},
						 {"ext", f.ext},
						 {"format_note", f.format_note},
						 {"resolution", f.resolution},
						 {"filesize", f.filesize},
						 {"link", f.link}});
		}
		std::cout << j.dump(2) << "\n";
		return;
	}

	constexpr double MIB = 1024.0 * 1024.0;
	fmt::println("{:<8} {:<6} {:<12} {:<14} {:>10}", "ID", "EXT", "RESOLUTION",
				 "NOTE", "SIZE");
	fmt::println("{:-<54}", "");
	for (const auto &f : formats) {
		std::string size =
			f.filesize > 0 ? fmt::format("{:.2f}MiB", f.filesize / MIB) : "";
		fmt::println("{:<8} {:<6} {:<12} {:<14} {:>10}", f.format_id, f.ext,
					 f.resolution, f.format_note, size);
	}
}

// =============================================================================
// CLI Application using Coroutines
// =============================================================================

struct CliOptions {
	std::string query;
	std::string message_file;
	std::string mode = "audio";
	std::string format_id;
	std::string title;
	std::optional<int> playlist_limit;
	std::optional<int> slider_index;
	bool download = false;
	bool list_formats = false;
	bool stream_url = false;
	bool dump_json = false;
};

std::optional<ytplay::AcquisitionMode> parse_mode(const CliOptions &opts) {
	if (opts.mode == "audio") return ytplay::mode::AudioOnly{};
	if (opts.mode == "video") return ytplay::mode::VideoUpTo720{};
	if (opts.mode == "song-audio") {
		return ytplay::mode::NamedSongAudio{opts.format_id, opts.title};
	}
	if (opts.mode == "song-video") {
		return ytplay::mode::NamedSongVideo{opts.format_id, opts.title};
	}
	return std::nullopt;
}

std::optional<ytplay::Reference> load_reference(const CliOptions &opts) {
	if (opts.message_file.empty()) {
		return ytplay::classify_reference(opts.query);
	}

	std::ifstream in(opts.message_file);
	if (!in) {
		spdlog::error("Cannot open {}", opts.message_file);
		return std::nullopt;
	}
	std::stringstream ss;
	ss << in.rdbuf();

	auto message = ytplay::parse_chat_message(ss.str());
	if (message.has_error()) {
		spdlog::error("Invalid message file: {}", message.error().message());
		return std::nullopt;
	}
	return ytplay::resolve_reference(message.value());
}

void acquire_and_report(ytplay::Pipeline &pipeline,
						const ytplay::Reference &ref,
						const ytplay::AcquisitionMode &mode,
						const ytplay::CancellationToken &cancel,
						asio::yield_context yield) {
	spdlog::info("[download] {} as {}", ref.value(), ytplay::to_string(mode));
	auto result = pipeline.async_acquire(ref, mode, yield, cancel);
	if (!result.succeeded) {
		spdlog::error("Acquisition failed for {}", ref.value());
		return;
	}
	fmt::println("{} {}", result.is_direct ? "[direct]" : "[file]",
				 result.location);
}

void run_app(ytplay::Pipeline &pipeline, const CliOptions &opts,
			 const ytplay::CancellationToken &cancel,
			 asio::yield_context yield) {
	const auto &config = pipeline.config();

	if (opts.slider_index) {
		auto md = pipeline.async_search_slider(opts.query, *opts.slider_index,
											   yield);
		print_track(ytplay::to_track_details(md, config.watch_base_url),
					opts.dump_json);
		return;
	}

	auto ref = load_reference(opts);
	if (!ref) {
		spdlog::error("No link or query found");
		return;
	}
	spdlog::debug("Reference: {} \"{}\"", ytplay::to_string(ref->kind()),
				  ref->value());

	auto mode = parse_mode(opts);
	if (!mode) {
		spdlog::error("Unknown mode: {}", opts.mode);
		return;
	}

	if (ref->is<ytplay::PlaylistUrl>() || opts.playlist_limit) {
		int limit = opts.playlist_limit.value_or(config.slider_results);
		auto ids = pipeline.async_expand(*ref, limit, yield, cancel);
		spdlog::info("[playlist] {} item(s)", ids.size());
		for (const auto &id : ids) {
			if (cancel.cancelled()) break;
			if (!opts.download) {
				fmt::println("{}{}", config.watch_base_url, id);
				continue;
			}
			acquire_and_report(pipeline, ytplay::Reference::video_id(id),
							   *mode, cancel, yield);
		}
		return;
	}

	if (opts.list_formats) {
		auto formats = pipeline.async_list_formats(*ref, yield, cancel);
		if (formats.empty()) {
			spdlog::error("No formats available");
			return;
		}
		print_formats(formats, opts.dump_json);
		return;
	}

	if (opts.stream_url) {
		auto url = pipeline.async_stream_url(*ref, *mode, yield, cancel);
		if (url.has_error()) {
			spdlog::error("No stream URL: {}", url.error().message());
			return;
		}
		fmt::println("{}", url.value());
		return;
	}

	auto md = pipeline.async_resolve(*ref, yield, cancel);
	if (md.is_sentinel()) spdlog::warn("Could not resolve \"{}\"", ref->value());
	print_track(ytplay::to_track_details(md, config.watch_base_url),
				opts.dump_json);

	if (opts.download) acquire_and_report(pipeline, *ref, *mode, cancel, yield);
}

// =============================================================================
// Main Entry Point
// =============================================================================

po::options_description config_options(ytplay::PipelineConfig &cfg) {
	po::options_description desc("Pipeline");
	// clang-format off
	desc.add_options()
		("pacer.min-delay-ms", po::value<long long>()->default_value(cfg.pacer.min_delay.count()),
		 "Minimum gap between backend calls")
		("pacer.max-delay-ms", po::value<long long>()->default_value(cfg.pacer.max_delay.count()),
		 "Maximum gap between backend calls")
		("retry.attempts", po::value<int>(&cfg.retry.max_attempts)->default_value(cfg.retry.max_attempts),
		 "Primary backend attempts before the search fallback")
		("retry.backoff-seed-ms", po::value<long long>()->default_value(cfg.retry.backoff_seed.count()),
		 "Backoff before the second attempt")
		("retry.backoff-step-ms", po::value<long long>()->default_value(cfg.retry.backoff_step.count()),
		 "Backoff growth per attempt")
		("retry.backoff-jitter-ms", po::value<long long>()->default_value(cfg.retry.backoff_jitter.count()),
		 "Random backoff jitter")
		("backend.executable", po::value<std::string>(&cfg.backend.executable)->default_value(cfg.backend.executable),
		 "yt-dlp executable")
		("backend.socket-timeout", po::value<long long>()->default_value(cfg.backend.socket_timeout.count()),
		 "Backend socket timeout (seconds)")
		("backend.info-timeout", po::value<long long>()->default_value(cfg.backend.info_timeout.count()),
		 "Metadata call bound (seconds)")
		("backend.download-timeout", po::value<long long>()->default_value(cfg.backend.download_timeout.count()),
		 "Download call bound (seconds)")
		("backend.direct-url-timeout", po::value<long long>()->default_value(cfg.backend.direct_url_timeout.count()),
		 "Direct URL resolver bound (seconds)")
		("backend.throttled-rate", po::value<std::string>(&cfg.backend.throttled_rate)->default_value(cfg.backend.throttled_rate),
		 "Rate below which the backend re-extracts")
		("backend.referer", po::value<std::string>(&cfg.backend.referer)->default_value(cfg.backend.referer),
		 "Referer header")
		("downloads-dir", po::value<std::string>(&cfg.downloads_dir)->default_value(cfg.downloads_dir),
		 "Directory for downloaded files")
		("audio-ext", po::value<std::string>(&cfg.audio_ext)->default_value(cfg.audio_ext),
		 "Canonical audio extension")
		("audio-quality", po::value<std::string>(&cfg.audio_quality)->default_value(cfg.audio_quality),
		 "Audio transcoding quality")
		("workers", po::value<int>(&cfg.worker_threads)->default_value(cfg.worker_threads),
		 "Worker threads for blocking calls");
	// clang-format on
	return desc;
}

void apply_durations(const po::variables_map &vm, ytplay::PipelineConfig &cfg) {
	auto ms = [&](const char *key) {
		return ytplay::Millis(vm[key].as<long long>());
	};
	auto secs = [&](const char *key) {
		return ytplay::Seconds(vm[key].as<long long>());
	};
	cfg.pacer.min_delay = ms("pacer.min-delay-ms");
	cfg.pacer.max_delay = ms("pacer.max-delay-ms");
	cfg.retry.backoff_seed = ms("retry.backoff-seed-ms");
	cfg.retry.backoff_step = ms("retry.backoff-step-ms");
	cfg.retry.backoff_jitter = ms("retry.backoff-jitter-ms");
	cfg.backend.socket_timeout = secs("backend.socket-timeout");
	cfg.backend.info_timeout = secs("backend.info-timeout");
	cfg.backend.download_timeout = secs("backend.download-timeout");
	cfg.backend.direct_url_timeout = secs("backend.direct-url-timeout");
}

int main(int argc, char *argv[]) {
	try {
		// Setup logging
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[%^%l%$] %v");

		ytplay::PipelineConfig config;

		po::options_description general("Options");
		// clang-format off
		general.add_options()
			("help,h", "Print help message")
			("query", po::value<std::string>(), "Link, video id or search text")
			("message", po::value<std::string>(), "Chat message JSON file to take the link from")
			("download,d", "Acquire the media")
			("mode,m", po::value<std::string>()->default_value("audio"),
			 "audio, video, song-audio or song-video")
			("format-id", po::value<std::string>(), "Format id for song modes")
			("title", po::value<std::string>(), "Output title for song modes")
			("playlist", po::value<int>(), "Expand a playlist, up to N items")
			("list-formats,F", "List downloadable formats")
			("slider", po::value<int>(), "Show the N-th (0-based) search result")
			("get-url,g", "Print the direct media URL")
			("dump-json,j", "Print results as JSON")
			("direct-link", "Return direct stream URLs for video instead of downloading")
			("config", po::value<std::string>(), "INI file with pipeline settings")
			("verbose,v", "Enable verbose logging");
		// clang-format on

		auto pipeline_desc = config_options(config);
		po::options_description all;
		all.add(general).add(pipeline_desc);

		po::positional_options_description p;
		p.add("query", 1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(all)
					  .positional(p)
					  .run(),
				  vm);
		if (vm.count("config")) {
			po::store(po::parse_config_file<char>(
						  vm["config"].as<std::string>().c_str(), pipeline_desc),
					  vm);
		}
		po::notify(vm);
		apply_durations(vm, config);

		if (vm.count("help")) {
			std::cout << "Usage: ytplay-cli [options] <query>\n" << all << "\n";
			return 0;
		}

		if (vm.count("verbose")) {
			spdlog::set_level(spdlog::level::debug);
		} else {
			spdlog::set_level(spdlog::level::info);
		}

		if (!vm.count("query") && !vm.count("message")) {
			std::cout << "Usage: ytplay-cli [options] <query>\n" << all << "\n";
			return 1;
		}

		CliOptions opts;
		if (vm.count("query")) opts.query = vm["query"].as<std::string>();
		if (vm.count("message")) {
			opts.message_file = vm["message"].as<std::string>();
		}
		opts.mode = vm["mode"].as<std::string>();
		if (vm.count("format-id")) {
			opts.format_id = vm["format-id"].as<std::string>();
		}
		if (vm.count("title")) opts.title = vm["title"].as<std::string>();
		if (vm.count("playlist")) opts.playlist_limit = vm["playlist"].as<int>();
		if (vm.count("slider")) opts.slider_index = vm["slider"].as<int>();
		opts.download = vm.count("download") > 0;
		opts.list_formats = vm.count("list-formats") > 0;
		opts.stream_url = vm.count("get-url") > 0;
		opts.dump_json = vm.count("dump-json") > 0;

		if ((opts.mode == "song-audio" || opts.mode == "song-video") &&
			(opts.format_id.empty() || opts.title.empty())) {
			spdlog::error("--mode {} needs --format-id and --title", opts.mode);
			return 1;
		}

		const bool direct_link = vm.count("direct-link") > 0;

		asio::io_context ioc;
		ytplay::Collaborators collaborators;
		collaborators.direct_link = [direct_link] { return direct_link; };
		auto pipeline = ytplay::Pipeline::create(
			ioc.get_executor(), config, std::move(collaborators));

		ytplay::CancellationToken cancel;

		// Setup signal handling using asio::signal_set
		asio::signal_set signals(ioc, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int sig) {
			if (!ec) {
				cancel.cancel();
				fmt::println(stderr, "\nCancelling, received signal {}.", sig);
			}
		});

		// Run the app in a coroutine
		boost::asio::spawn(
			ioc,
			[&](asio::yield_context yield) {
				run_app(pipeline, opts, cancel, yield);
				// Cancel signal wait so io_context can exit normally
				signals.cancel();
			},
			boost::coroutines::attributes());

		ioc.run();
		pipeline.shutdown();

		return 0;

	} catch (const std::exception &e) {
		fmt::println(stderr, "ERROR: {}", e.what());
		return 1;
	}
}
