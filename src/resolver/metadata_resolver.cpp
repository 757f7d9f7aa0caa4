#include <spdlog/spdlog.h>

#include <boost/algorithm/string/predicate.hpp>

#include <exception>
#include <ytplay/metadata_resolver.hpp>
#include <ytplay/search_adapter.hpp>

#include "random.hpp"

namespace ytplay {

namespace {

// Metadata lookups need a format that always exists
constexpr const char *kInfoFormat = "bestaudio/best";

std::string trim_tracking(const std::string &url) {
	return url.substr(0, url.find('&'));
}

std::string resolution_of(const BackendFormat &f) {
	if (f.vcodec == "none" || (f.width == 0 && f.height == 0)) {
		return "audio only";
	}
	return std::to_string(f.width) + "x" + std::to_string(f.height);
}

}  // namespace

ResolveStep classify_attempt(const Result<BackendInfo> &result,
							 int attempts_made, int max_attempts) {
	auto retry_or_fallback = [&](std::error_code ec) -> ResolveStep {
		if (attempts_made < max_attempts) return resolve_step::Retry{ec};
		return resolve_step::Fallback{ec};
	};

	if (result.has_error()) {
		if (result.error() == errc::cancelled) {
			return resolve_step::SentinelFailure{};
		}
		return retry_or_fallback(result.error());
	}

	const auto &info = result.value();
	if (info.has_entries) {
		// Search-style response: take the first entry, nothing to retry
		if (info.entries.empty() || info.entries.front().id.empty()) {
			return resolve_step::Fallback{make_error_code(errc::no_results)};
		}
		return resolve_step::Success{to_metadata(info.entries.front())};
	}

	if (info.id.empty() && info.title.empty()) {
		return retry_or_fallback(
			make_error_code(errc::transient_extraction_failure));
	}
	return resolve_step::Success{to_metadata(info)};
}

Metadata to_metadata(const BackendInfo &info) {
	Metadata md;
	if (!info.title.empty()) md.title = info.title;
	md.duration_seconds = info.duration > 0 ? info.duration : 0;
	md.video_id = info.id;
	md.thumbnail_url = info.thumbnail;
	return md;
}

MetadataResolver::MetadataResolver(Pacer &pacer, WorkerPool &pool,
								   ExtractionBackend &backend,
								   SearchProvider &search,
								   const PipelineConfig &config)
	: pacer_(pacer),
	  pool_(pool),
	  backend_(backend),
	  search_(search),
	  config_(config) {}

std::string MetadataResolver::backend_query(const Reference &ref) const {
	switch (ref.kind()) {
		case ReferenceKind::direct_url:
		case ReferenceKind::video_id: return trim_tracking(ref.value());
		case ReferenceKind::search_query:
			if (ref.value().rfind(config_.search_prefix, 0) == 0) {
				return ref.value();
			}
			return config_.search_prefix + ref.value();
		case ReferenceKind::playlist_url: return ref.value();
	}
	return ref.value();
}

std::string MetadataResolver::search_text(const Reference &ref) const {
	const auto &value = ref.value();
	if (value.rfind(config_.search_prefix, 0) == 0) {
		return value.substr(config_.search_prefix.size());
	}
	return value;
}

Metadata MetadataResolver::resolve(const Reference &ref,
								   asio::yield_context yield,
								   const CancellationToken &cancel) {
	try {
		const auto query = backend_query(ref);
		spdlog::debug("Resolving {} \"{}\"", to_string(ref.kind()), query);

		RetryContext ctx;
		ResolveStep step = attempt_primary(query, ctx, yield, cancel);
		for (;;) {
			if (auto *success = std::get_if<resolve_step::Success>(&step)) {
				return std::move(success->metadata);
			}
			if (auto *retry = std::get_if<resolve_step::Retry>(&step)) {
				spdlog::warn("Attempt {} failed: {}", ctx.attempt,
							 retry->reason.message());
				backoff(ctx, yield);
				if (cancel.cancelled()) return Metadata::sentinel();
				step = attempt_primary(query, ctx, yield, cancel);
				continue;
			}
			if (auto *fallback = std::get_if<resolve_step::Fallback>(&step)) {
				spdlog::warn("Primary resolution failed ({}), using search "
							 "fallback",
							 fallback->reason.message());
				step = run_fallback(ref, yield);
				continue;
			}
			spdlog::error("Resolution exhausted for \"{}\"", ref.value());
			return Metadata::sentinel();
		}
	} catch (const std::exception &e) {
		spdlog::error("Resolution of \"{}\" aborted: {}", ref.value(),
					  e.what());
		return Metadata::sentinel();
	}
}

ResolveStep MetadataResolver::attempt_primary(const std::string &query,
											  RetryContext &ctx,
											  asio::yield_context yield,
											  const CancellationToken &cancel) {
	pacer_.acquire_slot(yield);
	if (cancel.cancelled()) return resolve_step::SentinelFailure{};

	auto options = BackendOptionsBuilder(config_.backend)
					   .randomize(detail::random_engine())
					   .format(kInfoFormat)
					   .timeout(config_.backend.info_timeout)
					   .build();

	Result<BackendInfo> result = make_error_code(errc::unknown);
	try {
		result = pool_.run(
			[&] { return backend_.extract_info(query, options, false, cancel); },
			yield);
	} catch (const std::exception &e) {
		spdlog::warn("Backend raised: {}", e.what());
		result = make_error_code(errc::transient_extraction_failure);
	}

	++ctx.attempt;
	return classify_attempt(result, ctx.attempt, config_.retry.max_attempts);
}

ResolveStep MetadataResolver::run_fallback(const Reference &ref,
										   asio::yield_context yield) {
	auto text = search_text(ref);
	auto results = search_.search(text, 1, yield);
	if (results.has_error()) {
		spdlog::error("Fallback search failed: {}", results.error().message());
		return resolve_step::SentinelFailure{};
	}
	if (results.value().empty()) {
		spdlog::error("Fallback search found nothing for \"{}\"", text);
		return resolve_step::SentinelFailure{};
	}
	return resolve_step::Success{to_metadata(results.value().front())};
}

void MetadataResolver::backoff(RetryContext &ctx, asio::yield_context yield) {
	const auto &policy = config_.retry;
	Millis wait = policy.backoff_seed + policy.backoff_step * (ctx.attempt - 1);
	if (policy.backoff_jitter.count() > 0) {
		std::uniform_int_distribution<Millis::rep> jitter(
			0, policy.backoff_jitter.count());
		wait += Millis(jitter(detail::random_engine()));
	}
	ctx.accumulated_backoff += wait;
	spdlog::debug("Backing off {}ms before attempt {}", wait.count(),
				  ctx.attempt + 1);
	if (wait.count() > 0) async_sleep(wait, yield);
}

std::vector<FormatOption> MetadataResolver::list_formats(
	const Reference &ref, asio::yield_context yield,
	const CancellationToken &cancel) {
	std::vector<FormatOption> out;
	if (ref.is<SearchQuery>() || ref.is<PlaylistUrl>()) {
		spdlog::warn("Formats need a single item, got {}",
					 to_string(ref.kind()));
		return out;
	}

	auto query = backend_query(ref);
	auto options = BackendOptionsBuilder(config_.backend)
					   .randomize(detail::random_engine())
					   .format("")
					   .no_playlist()
					   .build();

	Result<BackendInfo> info = make_error_code(errc::unknown);
	try {
		pacer_.acquire_slot(yield);
		if (cancel.cancelled()) return out;
		info = pool_.run(
			[&] { return backend_.extract_info(query, options, false, cancel); },
			yield);
	} catch (const std::exception &e) {
		spdlog::error("Format listing raised: {}", e.what());
		return out;
	}
	if (info.has_error()) {
		spdlog::error("Format listing failed: {}", info.error().message());
		return out;
	}

	const auto &item = info.value();
	const auto link = config_.watch_base_url + item.id;
	for (const auto &f : item.formats) {
		if (f.format_id.empty() || f.ext.empty() || f.format_note.empty()) {
			continue;
		}
		if (boost::algorithm::icontains(f.format_note, "dash") ||
			boost::algorithm::icontains(f.protocol, "dash")) {
			continue;
		}
		FormatOption opt;
		opt.format_id = f.format_id;
		opt.ext = f.ext;
		opt.format_note = f.format_note;
		opt.resolution = resolution_of(f);
		opt.filesize = f.filesize;
		opt.link = link;
		out.push_back(std::move(opt));
	}
	spdlog::debug("{} usable format(s) for {}", out.size(), item.id);
	return out;
}

Metadata MetadataResolver::search_slider(const std::string &query, int index,
										 asio::yield_context yield) {
	if (index < 0 || index >= config_.slider_results) {
		return Metadata::sentinel();
	}
	try {
		auto results = search_.search(query, config_.slider_results, yield);
		if (results.has_error()) {
			spdlog::error("Slider search failed: {}",
						  results.error().message());
			return Metadata::sentinel();
		}
		const auto &list = results.value();
		if (static_cast<std::size_t>(index) >= list.size()) {
			return Metadata::sentinel();
		}
		return to_metadata(list[static_cast<std::size_t>(index)]);
	} catch (const std::exception &e) {
		spdlog::error("Slider search raised: {}", e.what());
		return Metadata::sentinel();
	}
}

}  // namespace ytplay
