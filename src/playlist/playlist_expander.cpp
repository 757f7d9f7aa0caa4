#include <spdlog/spdlog.h>

#include <exception>
#include <ytplay/playlist.hpp>

#include "random.hpp"

namespace ytplay {

PlaylistCursor::PlaylistCursor(PlaylistExpander &owner, std::string url,
							   int limit, CancellationToken cancel)
	: owner_(&owner),
	  url_(std::move(url)),
	  limit_(limit),
	  cancel_(std::move(cancel)) {}

std::optional<std::string> PlaylistCursor::next(asio::yield_context yield) {
	if (!fetched_) {
		fetched_ = true;
		if (!url_.empty() && limit_ > 0) {
			ids_ = owner_->fetch(url_, limit_, yield, cancel_);
		}
	}
	if (pos_ >= ids_.size()) return std::nullopt;
	return ids_[pos_++];
}

std::vector<std::string> PlaylistCursor::collect(asio::yield_context yield) {
	std::vector<std::string> out;
	while (auto id = next(yield)) out.push_back(std::move(*id));
	return out;
}

PlaylistExpander::PlaylistExpander(Pacer &pacer, WorkerPool &pool,
								   ExtractionBackend &backend,
								   const PipelineConfig &config)
	: pacer_(pacer), pool_(pool), backend_(backend), config_(config) {}

PlaylistCursor PlaylistExpander::expand(const Reference &ref, int limit,
										const CancellationToken &cancel) {
	if (!ref.is<PlaylistUrl>()) {
		spdlog::warn("Not a playlist: {}", ref.value());
		return PlaylistCursor(*this, "", 0, cancel);
	}
	return PlaylistCursor(*this, ref.value(), limit, cancel);
}

std::vector<std::string> PlaylistExpander::fetch(
	const std::string &url, int limit, asio::yield_context yield,
	const CancellationToken &cancel) {
	std::vector<std::string> ids;
	try {
		pacer_.acquire_slot(yield);
		if (cancel.cancelled()) return ids;

		auto options = BackendOptionsBuilder(config_.backend)
						   .randomize(detail::random_engine())
						   .format("")
						   .flat_playlist(limit)
						   .build();

		auto info = pool_.run(
			[&] { return backend_.extract_info(url, options, false, cancel); },
			yield);
		if (info.has_error()) {
			spdlog::warn("Playlist enumeration failed: {}",
						 info.error().message());
			return ids;
		}

		for (const auto &entry : info.value().entries) {
			if (ids.size() >= static_cast<std::size_t>(limit)) break;
			if (!entry.id.empty()) ids.push_back(entry.id);
		}
		spdlog::debug("Playlist {} expanded to {} item(s)", url, ids.size());
	} catch (const std::exception &e) {
		spdlog::warn("Playlist enumeration raised: {}", e.what());
		ids.clear();
	}
	return ids;
}

}  // namespace ytplay
