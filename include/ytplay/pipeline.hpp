#pragma once

#include <ytplay/ytplay_export.h>

#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <memory>
#include <string>
#include <vector>
#include <ytplay/acquisition.hpp>
#include <ytplay/backend.hpp>
#include <ytplay/config.hpp>
#include <ytplay/metadata_resolver.hpp>
#include <ytplay/pacer.hpp>
#include <ytplay/playlist.hpp>
#include <ytplay/result.hpp>
#include <ytplay/types.hpp>
#include <ytplay/worker_pool.hpp>

namespace ytplay {

/// Replaceable collaborators. Null members are filled with the defaults
/// (yt-dlp backend and resolver, InnerTube search, jittered pacer).
struct YTPLAY_EXPORT Collaborators {
	std::unique_ptr<ExtractionBackend> backend;
	std::unique_ptr<DirectUrlResolver> direct;
	std::unique_ptr<SearchProvider> search;
	std::unique_ptr<Pacer> pacer;
	DirectLinkFlag direct_link;	 // unset: direct-link mode disabled
};

/// Owns one shared pacer and worker pool plus the resolvers built on them.
/// Each operation runs as its own coroutine on the bound executor.
class YTPLAY_EXPORT Pipeline {
   public:
	Pipeline(const Pipeline &) = delete;
	Pipeline &operator=(const Pipeline &) = delete;
	Pipeline(Pipeline &&) noexcept;
	Pipeline &operator=(Pipeline &&) noexcept;
	~Pipeline();

	static Pipeline create(asio::any_io_executor ex, PipelineConfig config,
						   Collaborators collaborators = {});

	[[nodiscard]] asio::any_io_executor get_executor() const;
	[[nodiscard]] const PipelineConfig &config() const;

	// Direct access for callers already running inside a coroutine
	MetadataResolver &resolver();
	AcquisitionOrchestrator &orchestrator();
	PlaylistExpander &expander();

	/// Join the worker pool. Pending operations must have completed.
	void shutdown();

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Metadata)) CompletionToken>
	auto async_resolve(Reference ref, CompletionToken &&token,
					   CancellationToken cancel = {}) {
		return asio::async_initiate<CompletionToken, void(Metadata)>(
			[this, ref = std::move(ref), cancel](auto &&handler) mutable {
				resolve_impl(std::move(ref), std::move(cancel),
							 asio::any_completion_handler<void(Metadata)>(
								 std::forward<decltype(handler)>(handler)));
			},
			token);
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(AcquisitionResult))
				  CompletionToken>
	auto async_acquire(Reference ref, AcquisitionMode mode,
					   CompletionToken &&token, CancellationToken cancel = {}) {
		return asio::async_initiate<CompletionToken, void(AcquisitionResult)>(
			[this, ref = std::move(ref), mode = std::move(mode),
			 cancel](auto &&handler) mutable {
				acquire_impl(
					std::move(ref), std::move(mode), std::move(cancel),
					asio::any_completion_handler<void(AcquisitionResult)>(
						std::forward<decltype(handler)>(handler)));
			},
			token);
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<std::string>))
				  CompletionToken>
	auto async_stream_url(Reference ref, AcquisitionMode mode,
						  CompletionToken &&token,
						  CancellationToken cancel = {}) {
		return asio::async_initiate<CompletionToken,
									void(Result<std::string>)>(
			[this, ref = std::move(ref), mode = std::move(mode),
			 cancel](auto &&handler) mutable {
				stream_url_impl(
					std::move(ref), std::move(mode), std::move(cancel),
					asio::any_completion_handler<void(Result<std::string>)>(
						std::forward<decltype(handler)>(handler)));
			},
			token);
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(std::vector<std::string>))
				  CompletionToken>
	auto async_expand(Reference ref, int limit, CompletionToken &&token,
					  CancellationToken cancel = {}) {
		return asio::async_initiate<CompletionToken,
									void(std::vector<std::string>)>(
			[this, ref = std::move(ref), limit,
			 cancel](auto &&handler) mutable {
				expand_impl(std::move(ref), limit, std::move(cancel),
							asio::any_completion_handler<void(
								std::vector<std::string>)>(
								std::forward<decltype(handler)>(handler)));
			},
			token);
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(std::vector<FormatOption>))
				  CompletionToken>
	auto async_list_formats(Reference ref, CompletionToken &&token,
							CancellationToken cancel = {}) {
		return asio::async_initiate<CompletionToken,
									void(std::vector<FormatOption>)>(
			[this, ref = std::move(ref), cancel](auto &&handler) mutable {
				list_formats_impl(std::move(ref), std::move(cancel),
								  asio::any_completion_handler<void(
									  std::vector<FormatOption>)>(
									  std::forward<decltype(handler)>(handler)));
			},
			token);
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Metadata)) CompletionToken>
	auto async_search_slider(std::string query, int index,
							 CompletionToken &&token) {
		return asio::async_initiate<CompletionToken, void(Metadata)>(
			[this, query = std::move(query), index](auto &&handler) mutable {
				search_slider_impl(
					std::move(query), index,
					asio::any_completion_handler<void(Metadata)>(
						std::forward<decltype(handler)>(handler)));
			},
			token);
	}

   private:
	struct Impl;
	std::shared_ptr<Impl> pimpl_;

	explicit Pipeline(std::shared_ptr<Impl> impl);

	void resolve_impl(Reference ref, CancellationToken cancel,
					  asio::any_completion_handler<void(Metadata)> handler);
	void acquire_impl(
		Reference ref, AcquisitionMode mode, CancellationToken cancel,
		asio::any_completion_handler<void(AcquisitionResult)> handler);
	void stream_url_impl(
		Reference ref, AcquisitionMode mode, CancellationToken cancel,
		asio::any_completion_handler<void(Result<std::string>)> handler);
	void expand_impl(
		Reference ref, int limit, CancellationToken cancel,
		asio::any_completion_handler<void(std::vector<std::string>)> handler);
	void list_formats_impl(
		Reference ref, CancellationToken cancel,
		asio::any_completion_handler<void(std::vector<FormatOption>)> handler);
	void search_slider_impl(
		std::string query, int index,
		asio::any_completion_handler<void(Metadata)> handler);
};

}  // namespace ytplay
