#pragma once

#include <ytplay/ytplay_export.h>

#include <boost/asio/spawn.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <ytplay/backend.hpp>
#include <ytplay/config.hpp>
#include <ytplay/pacer.hpp>
#include <ytplay/types.hpp>
#include <ytplay/worker_pool.hpp>

namespace ytplay {

class PlaylistExpander;

/// Lazy, finite, single-pass sequence of video ids. Nothing is fetched until
/// the first call to next(); the enumeration happens once and is never
/// restarted.
class YTPLAY_EXPORT PlaylistCursor {
   public:
	PlaylistCursor(PlaylistCursor &&) noexcept = default;
	PlaylistCursor &operator=(PlaylistCursor &&) noexcept = default;
	PlaylistCursor(const PlaylistCursor &) = delete;
	PlaylistCursor &operator=(const PlaylistCursor &) = delete;

	/// Next video id, std::nullopt once exhausted.
	std::optional<std::string> next(asio::yield_context yield);

	/// Drain the remaining ids.
	std::vector<std::string> collect(asio::yield_context yield);

	[[nodiscard]] bool fetched() const { return fetched_; }

   private:
	friend class PlaylistExpander;

	PlaylistCursor(PlaylistExpander &owner, std::string url, int limit,
				   CancellationToken cancel);

	PlaylistExpander *owner_;
	std::string url_;
	int limit_;
	CancellationToken cancel_;
	bool fetched_ = false;
	std::vector<std::string> ids_;
	std::size_t pos_ = 0;
};

/// Flat playlist enumeration through the paced backend.
class YTPLAY_EXPORT PlaylistExpander {
   public:
	PlaylistExpander(Pacer &pacer, WorkerPool &pool, ExtractionBackend &backend,
					 const PipelineConfig &config);

	/// Ids of at most `limit` playlist members. Non-playlist references and
	/// non-positive limits produce an empty sequence.
	PlaylistCursor expand(const Reference &ref, int limit,
						  const CancellationToken &cancel = {});

   private:
	friend class PlaylistCursor;

	// Empty on any failure
	std::vector<std::string> fetch(const std::string &url, int limit,
								   asio::yield_context yield,
								   const CancellationToken &cancel);

	Pacer &pacer_;
	WorkerPool &pool_;
	ExtractionBackend &backend_;
	const PipelineConfig &config_;
};

}  // namespace ytplay
