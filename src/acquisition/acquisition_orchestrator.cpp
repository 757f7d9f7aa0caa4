#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <ytplay/acquisition.hpp>
#include <ytplay/format_selector.hpp>
#include <ytplay/reference.hpp>

#include "random.hpp"

namespace ytplay {

namespace fs = std::filesystem;

namespace {

// Formats whose direct URL plays without merging
std::string stream_format(const AcquisitionMode &mode) {
	struct Visitor {
		std::string operator()(const mode::AudioOnly &) const {
			return "bestaudio/best";
		}
		std::string operator()(const mode::VideoUpTo720 &) const {
			return "best[height<=?720][width<=?1280]";
		}
		std::string operator()(const mode::NamedSongAudio &m) const {
			return m.format_id;
		}
		std::string operator()(const mode::NamedSongVideo &m) const {
			return m.format_id;
		}
	};
	return std::visit(Visitor{}, mode);
}

// Search-style responses wrap the item in entries
const BackendInfo &single_item(const BackendInfo &info) {
	if (info.has_entries && !info.entries.empty()) return info.entries.front();
	return info;
}

}  // namespace

Result<std::string> normalize_extension(const std::string &path,
										const std::string &ext) {
	fs::path from(path);
	const auto wanted = "." + ext;
	if (from.extension() == wanted) return path;

	fs::path to = from;
	to.replace_extension(wanted);

	std::error_code ec;
	fs::rename(from, to, ec);
	if (ec) {
		spdlog::error("Cannot rename {} to {}: {}", from.string(), to.string(),
					  ec.message());
		return make_error_code(errc::download_failed);
	}
	return to.string();
}

AcquisitionOrchestrator::AcquisitionOrchestrator(
	Pacer &pacer, WorkerPool &pool, ExtractionBackend &backend,
	DirectUrlResolver &direct, DirectLinkFlag direct_link_enabled,
	const PipelineConfig &config)
	: pacer_(pacer),
	  pool_(pool),
	  backend_(backend),
	  direct_(direct),
	  direct_link_enabled_(std::move(direct_link_enabled)),
	  config_(config) {}

std::string AcquisitionOrchestrator::acquisition_query(
	const Reference &ref) const {
	switch (ref.kind()) {
		case ReferenceKind::direct_url: {
			const auto &url = ref.value();
			return url.substr(0, url.find('&'));
		}
		case ReferenceKind::video_id:
			if (is_platform_link(ref.value())) return ref.value();
			return config_.watch_base_url + ref.value();
		case ReferenceKind::search_query:
			if (ref.value().rfind(config_.search_prefix, 0) == 0) {
				return ref.value();
			}
			return config_.search_prefix + ref.value();
		case ReferenceKind::playlist_url: return "";
	}
	return "";
}

AcquisitionResult AcquisitionOrchestrator::acquire(
	const Reference &ref, const AcquisitionMode &mode,
	asio::yield_context yield, const CancellationToken &cancel) {
	try {
		const auto query = acquisition_query(ref);
		if (query.empty()) {
			spdlog::error("Cannot acquire a {}", to_string(ref.kind()));
			return AcquisitionResult::failure();
		}

		pacer_.acquire_slot(yield);
		if (cancel.cancelled()) return AcquisitionResult::failure();

		const bool wants_direct =
			std::holds_alternative<mode::VideoUpTo720>(mode) &&
			direct_link_enabled_ && direct_link_enabled_();
		if (wants_direct) {
			auto url = try_direct(query, yield, cancel);
			if (url.has_value()) {
				spdlog::info("Direct URL resolved for {}", query);
				return AcquisitionResult{url.value(), true, true};
			}
			spdlog::debug("Direct URL unavailable ({}), downloading",
						  url.error().message());
			if (cancel.cancelled()) return AcquisitionResult::failure();
		}

		auto path = download(query, mode, yield, cancel);
		if (path.has_error()) {
			spdlog::error("Acquisition of {} as {} failed: {}", query,
						  to_string(mode), path.error().message());
			return AcquisitionResult::failure();
		}
		return AcquisitionResult{path.value(), false, true};
	} catch (const std::exception &e) {
		spdlog::error("Acquisition of \"{}\" aborted: {}", ref.value(),
					  e.what());
		return AcquisitionResult::failure();
	}
}

Result<std::string> AcquisitionOrchestrator::try_direct(
	const std::string &query, asio::yield_context yield,
	const CancellationToken &cancel) {
	const auto timeout = config_.backend.direct_url_timeout;
	Result<std::string> url = make_error_code(errc::direct_resolution_failed);
	try {
		url = pool_.run([&] { return direct_.resolve(query, timeout, cancel); },
						yield);
	} catch (const std::exception &e) {
		spdlog::debug("Direct URL resolver raised: {}", e.what());
		return make_error_code(errc::direct_resolution_failed);
	}
	if (url.has_value() && url.value().empty()) {
		return make_error_code(errc::direct_resolution_failed);
	}
	return url;
}

Result<std::string> AcquisitionOrchestrator::download(
	const std::string &query, const AcquisitionMode &mode,
	asio::yield_context yield, const CancellationToken &cancel) {
	auto options = BackendOptionsBuilder(config_.backend)
					   .randomize(detail::random_engine())
					   .selection(select_format(mode), config_.audio_ext,
								  config_.audio_quality)
					   .output_dir(config_.downloads_dir)
					   .no_playlist()
					   .timeout(config_.backend.download_timeout)
					   .build();

	auto info = pool_.run(
		[&] { return backend_.extract_info(query, options, true, cancel); },
		yield);
	if (info.has_error()) {
		if (info.error() == errc::cancelled) return info.error();
		return make_error_code(errc::download_failed);
	}

	const auto &item = single_item(info.value());
	if (item.filepath.empty()) {
		spdlog::error("Backend reported no file for {}", query);
		return make_error_code(errc::download_failed);
	}

	std::error_code ec;
	if (!fs::exists(item.filepath, ec)) {
		spdlog::error("Downloaded file {} is missing", item.filepath);
		return make_error_code(errc::download_failed);
	}

	if (produces_audio(mode)) {
		return normalize_extension(item.filepath, config_.audio_ext);
	}
	return item.filepath;
}

Result<std::string> AcquisitionOrchestrator::get_stream_url(
	const Reference &ref, const AcquisitionMode &mode,
	asio::yield_context yield, const CancellationToken &cancel) {
	const auto query = acquisition_query(ref);
	if (query.empty()) return make_error_code(errc::unsupported_reference);

	pacer_.acquire_slot(yield);
	if (cancel.cancelled()) return make_error_code(errc::cancelled);

	auto options = BackendOptionsBuilder(config_.backend)
					   .randomize(detail::random_engine())
					   .format(stream_format(mode))
					   .no_playlist()
					   .build();

	auto info = pool_.run(
		[&] { return backend_.extract_info(query, options, false, cancel); },
		yield);
	if (info.has_error()) return info.error();

	const auto &item = single_item(info.value());
	if (item.url.empty()) return make_error_code(errc::direct_resolution_failed);
	return item.url;
}

}  // namespace ytplay
