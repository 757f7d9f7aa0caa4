#pragma once

#include <ytplay/ytplay_export.h>

#include <boost/asio/spawn.hpp>
#include <string>
#include <system_error>
#include <variant>
#include <vector>
#include <ytplay/backend.hpp>
#include <ytplay/config.hpp>
#include <ytplay/pacer.hpp>
#include <ytplay/types.hpp>
#include <ytplay/worker_pool.hpp>

namespace ytplay {

// Steps of the resolution state machine
namespace resolve_step {
struct Success {
	Metadata metadata;
};
struct Retry {
	std::error_code reason;
};
struct Fallback {
	std::error_code reason;
};
struct SentinelFailure {};
}  // namespace resolve_step

using ResolveStep =
	std::variant<resolve_step::Success, resolve_step::Retry,
				 resolve_step::Fallback, resolve_step::SentinelFailure>;

/// Per-call attempt bookkeeping, never shared across requests.
struct RetryContext {
	int attempt = 0;  // attempts made so far
	Millis accumulated_backoff{0};
};

/// Decide the next step after a primary backend attempt. `attempts_made`
/// counts the attempt just finished.
YTPLAY_EXPORT ResolveStep classify_attempt(const Result<BackendInfo> &result,
										   int attempts_made, int max_attempts);

/// Metadata of a single backend item (not a result set).
YTPLAY_EXPORT Metadata to_metadata(const BackendInfo &info);

/// Resolves references to metadata through the paced primary backend, with
/// sequential retries and a single fallback to the secondary search
/// provider. Collaborators are borrowed and must outlive the resolver.
class YTPLAY_EXPORT MetadataResolver {
   public:
	MetadataResolver(Pacer &pacer, WorkerPool &pool, ExtractionBackend &backend,
					 SearchProvider &search, const PipelineConfig &config);

	/// Never throws and never fails: total failure yields
	/// Metadata::sentinel().
	Metadata resolve(const Reference &ref, asio::yield_context yield,
					 const CancellationToken &cancel = {});

	/// Query string handed to the backend for `ref`.
	[[nodiscard]] std::string backend_query(const Reference &ref) const;

	/// Query text handed to the search provider for `ref`.
	[[nodiscard]] std::string search_text(const Reference &ref) const;

	/// Downloadable formats of a single item. Empty on failure.
	std::vector<FormatOption> list_formats(const Reference &ref,
										   asio::yield_context yield,
										   const CancellationToken &cancel = {});

	/// The `index`-th (0-based) search result for `query`, sentinel when out
	/// of range or on failure.
	Metadata search_slider(const std::string &query, int index,
						   asio::yield_context yield);

   private:
	ResolveStep attempt_primary(const std::string &query, RetryContext &ctx,
								asio::yield_context yield,
								const CancellationToken &cancel);
	ResolveStep run_fallback(const Reference &ref, asio::yield_context yield);
	void backoff(RetryContext &ctx, asio::yield_context yield);

	Pacer &pacer_;
	WorkerPool &pool_;
	ExtractionBackend &backend_;
	SearchProvider &search_;
	const PipelineConfig &config_;
};

}  // namespace ytplay
