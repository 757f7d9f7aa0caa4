#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>
#include <ytplay/ytdlp_backend.hpp>

#include "process/subprocess.hpp"
#include "utils.hpp"

namespace ytplay {

namespace {

std::string join(const std::vector<std::string> &items, char sep) {
	std::string out;
	for (const auto &item : items) {
		if (!out.empty()) out += sep;
		out += item;
	}
	return out;
}

// youtube:skip=dash,hls;player_client=android,web
std::string extractor_args(const BackendOptions &opts) {
	std::vector<std::string> parts;
	if (!opts.skip_streams.empty()) {
		parts.push_back("skip=" + join(opts.skip_streams, ','));
	}
	if (!opts.player_clients.empty()) {
		parts.push_back("player_client=" + join(opts.player_clients, ','));
	}
	if (parts.empty()) return "";
	return "youtube:" + join(parts, ';');
}

long long duration_of(const nlohmann::json &j) {
	auto d = utils::traverse_obj<double>(j, {"duration"});
	if (!d || *d < 0) return 0;
	return static_cast<long long>(*d);
}

BackendFormat parse_format(const nlohmann::json &j) {
	BackendFormat f;
	f.format_id = utils::traverse_obj_default<std::string>(j, {"format_id"}, "");
	f.ext = utils::traverse_obj_default<std::string>(j, {"ext"}, "");
	f.format_note =
		utils::traverse_obj_default<std::string>(j, {"format_note"}, "");
	f.url = utils::traverse_obj_default<std::string>(j, {"url"}, "");
	f.vcodec = utils::traverse_obj_default<std::string>(j, {"vcodec"}, "");
	f.acodec = utils::traverse_obj_default<std::string>(j, {"acodec"}, "");
	f.protocol = utils::traverse_obj_default<std::string>(j, {"protocol"}, "");
	f.width = utils::traverse_obj_default<int>(j, {"width"}, 0);
	f.height = utils::traverse_obj_default<int>(j, {"height"}, 0);
	f.filesize = utils::traverse_obj<long long>(j, {"filesize"})
					 .value_or(utils::traverse_obj_default<long long>(
						 j, {"filesize_approx"}, 0));
	return f;
}

BackendInfo parse_info(const nlohmann::json &j) {
	BackendInfo info;
	info.id = utils::traverse_obj_default<std::string>(j, {"id"}, "");
	info.title = utils::traverse_obj_default<std::string>(j, {"title"}, "");
	info.duration = duration_of(j);
	info.thumbnail =
		utils::traverse_obj_default<std::string>(j, {"thumbnail"}, "");
	if (info.thumbnail.empty()) {
		info.thumbnail = utils::traverse_obj_default<std::string>(
			j, {"thumbnails", -1, "url"}, "");
	}
	info.webpage_url =
		utils::traverse_obj_default<std::string>(j, {"webpage_url"}, "");
	info.url = utils::traverse_obj_default<std::string>(j, {"url"}, "");
	info.ext = utils::traverse_obj_default<std::string>(j, {"ext"}, "");

	// Final path after post-processing, then the pre-processing name
	if (auto path = utils::traverse_obj<std::string>(
			j, {"requested_downloads", 0, "filepath"})) {
		info.filepath = *path;
	} else if (auto name = utils::traverse_obj<std::string>(j, {"_filename"})) {
		info.filepath = *name;
	} else {
		info.filepath =
			utils::traverse_obj_default<std::string>(j, {"filename"}, "");
	}

	if (const auto *formats = utils::traverse_json(j, {"formats"});
		formats && formats->is_array()) {
		for (const auto &f : *formats) {
			if (f.is_object()) info.formats.push_back(parse_format(f));
		}
	}

	if (const auto *entries = utils::traverse_json(j, {"entries"});
		entries && entries->is_array()) {
		info.has_entries = true;
		for (const auto &e : *entries) {
			// Unavailable playlist members come back as null
			if (e.is_object()) info.entries.push_back(parse_info(e));
		}
	}
	return info;
}

}  // namespace

std::vector<std::string> build_backend_arguments(const std::string &query,
												 const BackendOptions &opts,
												 bool download) {
	std::vector<std::string> args = {"--dump-single-json"};
	if (download) args.emplace_back("--no-simulate");

	if (!opts.format.empty()) {
		args.insert(args.end(), {"-f", opts.format});
	}
	if (!opts.output_dir.empty()) {
		args.insert(args.end(), {"-P", opts.output_dir});
	}
	if (!opts.output_template.empty()) {
		args.insert(args.end(), {"-o", opts.output_template});
	}
	if (opts.merge_output_format) {
		args.insert(args.end(),
					{"--merge-output-format", *opts.merge_output_format});
	}
	if (opts.extract_audio) {
		args.emplace_back("-x");
		if (!opts.audio_format.empty()) {
			args.insert(args.end(), {"--audio-format", opts.audio_format});
		}
		if (!opts.audio_quality.empty()) {
			args.insert(args.end(), {"--audio-quality", opts.audio_quality});
		}
	}

	if (opts.quiet) args.emplace_back("--quiet");
	if (opts.no_warnings) args.emplace_back("--no-warnings");
	if (opts.ignore_errors) args.emplace_back("--ignore-errors");

	args.insert(args.end(), {"--retries", std::to_string(opts.retries)});
	if (opts.geo_bypass) args.emplace_back("--geo-bypass");
	if (opts.force_ipv4) args.emplace_back("--force-ipv4");
	if (opts.socket_timeout.count() > 0) {
		args.insert(args.end(), {"--socket-timeout",
								 std::to_string(opts.socket_timeout.count())});
	}
	if (auto ea = extractor_args(opts); !ea.empty()) {
		args.insert(args.end(), {"--extractor-args", ea});
	}
	if (!opts.user_agent.empty()) {
		args.insert(args.end(), {"--user-agent", opts.user_agent});
	}
	if (!opts.referer.empty()) {
		args.insert(args.end(), {"--referer", opts.referer});
	}
	if (!opts.throttled_rate.empty()) {
		args.insert(args.end(), {"--throttled-rate", opts.throttled_rate});
	}
	if (opts.sleep_interval > 0) {
		args.insert(args.end(), {"--sleep-interval",
								 std::to_string(opts.sleep_interval)});
	}

	if (opts.flat_playlist) args.emplace_back("--flat-playlist");
	if (opts.playlist_end > 0) {
		args.insert(args.end(),
					{"--playlist-end", std::to_string(opts.playlist_end)});
	}
	if (opts.no_playlist) args.emplace_back("--no-playlist");

	args.emplace_back("--");
	args.push_back(query);
	return args;
}

Result<BackendInfo> parse_info_json(std::string_view text) {
	auto json = nlohmann::json::parse(text, nullptr, false);
	if (json.is_discarded()) {
		return make_error_code(errc::json_parse_error);
	}
	if (!json.is_object()) {
		// yt-dlp prints null when --ignore-errors swallowed the failure
		return make_error_code(errc::transient_extraction_failure);
	}
	return parse_info(json);
}

YtDlpBackend::YtDlpBackend(std::string executable)
	: executable_(std::move(executable)) {}

Result<BackendInfo> YtDlpBackend::extract_info(const std::string &query,
											   const BackendOptions &options,
											   bool download,
											   const CancellationToken &cancel) {
	auto args = build_backend_arguments(query, options, download);
	spdlog::debug("[backend] {} {}", executable_, query);

	auto run = process::run(executable_, args, options.process_timeout, cancel);
	if (run.has_error()) {
		if (run.error() == errc::cancelled) return run.error();
		return make_error_code(errc::transient_extraction_failure);
	}

	const auto &output = run.value();
	if (output.exit_code != 0 && output.out.empty()) {
		spdlog::warn("[backend] exit {}: {}", output.exit_code,
					 process::first_line(output.err));
		return make_error_code(errc::transient_extraction_failure);
	}

	auto info = parse_info_json(output.out);
	if (info.has_error()) {
		spdlog::warn("[backend] unusable output for {}: {}", query,
					 info.error().message());
		return make_error_code(errc::transient_extraction_failure);
	}
	return info;
}

}  // namespace ytplay
