#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/coroutine/attributes.hpp>
#include <algorithm>
#include <exception>
#include <utility>
#include <ytplay/innertube_search.hpp>
#include <ytplay/pipeline.hpp>
#include <ytplay/ytdlp_backend.hpp>

namespace ytplay {

struct Pipeline::Impl {
	asio::any_io_executor ex;
	PipelineConfig config;
	WorkerPool pool;
	std::unique_ptr<ExtractionBackend> backend;
	std::unique_ptr<DirectUrlResolver> direct;
	std::unique_ptr<SearchProvider> search;
	std::unique_ptr<Pacer> pacer;

	MetadataResolver resolver;
	AcquisitionOrchestrator orchestrator;
	PlaylistExpander expander;

	Impl(asio::any_io_executor ex_, PipelineConfig cfg, Collaborators c)
		: ex(std::move(ex_)),
		  config(std::move(cfg)),
		  pool(static_cast<std::size_t>(std::max(1, config.worker_threads))),
		  backend(c.backend ? std::move(c.backend)
							: std::make_unique<YtDlpBackend>(
								  config.backend.executable)),
		  direct(c.direct ? std::move(c.direct)
						  : std::make_unique<YtDlpDirectUrlResolver>(
								config.backend.executable)),
		  search(c.search ? std::move(c.search)
						  : std::make_unique<InnertubeSearch>(
								ex, config.backend.socket_timeout)),
		  pacer(c.pacer ? std::move(c.pacer)
						: std::make_unique<RequestPacer>(ex, config.pacer)),
		  resolver(*pacer, pool, *backend, *search, config),
		  orchestrator(*pacer, pool, *backend, *direct,
					   c.direct_link ? std::move(c.direct_link)
									 : DirectLinkFlag([] { return false; }),
					   config),
		  expander(*pacer, pool, *backend, config) {}

	// Run `fn` as a coroutine and hand its value to `handler` on the
	// handler's executor
	template <typename Sig, typename Fn>
	static void launch(const std::shared_ptr<Impl> &self,
					   asio::any_completion_handler<Sig> handler, Fn fn) {
		asio::spawn(
			self->ex,
			[self, handler = std::move(handler),
			 fn = std::move(fn)](asio::yield_context yield) mutable {
				auto value = fn(*self, yield);
				auto handler_ex = asio::get_associated_executor(handler, self->ex);
				asio::post(handler_ex, [handler = std::move(handler),
										value = std::move(value)]() mutable {
					handler(std::move(value));
				});
			},
			boost::coroutines::attributes());
	}
};

Pipeline::Pipeline(std::shared_ptr<Impl> impl) : pimpl_(std::move(impl)) {}
Pipeline::~Pipeline() = default;
Pipeline::Pipeline(Pipeline &&) noexcept = default;
Pipeline &Pipeline::operator=(Pipeline &&) noexcept = default;

Pipeline Pipeline::create(asio::any_io_executor ex, PipelineConfig config,
						  Collaborators collaborators) {
	auto impl = std::make_shared<Impl>(std::move(ex), std::move(config),
									   std::move(collaborators));
	spdlog::debug("Pipeline ready ({} workers)", impl->config.worker_threads);
	return Pipeline(std::move(impl));
}

asio::any_io_executor Pipeline::get_executor() const { return pimpl_->ex; }

const PipelineConfig &Pipeline::config() const { return pimpl_->config; }

MetadataResolver &Pipeline::resolver() { return pimpl_->resolver; }

AcquisitionOrchestrator &Pipeline::orchestrator() {
	return pimpl_->orchestrator;
}

PlaylistExpander &Pipeline::expander() { return pimpl_->expander; }

void Pipeline::shutdown() {
	if (pimpl_) pimpl_->pool.shutdown();
}

void Pipeline::resolve_impl(
	Reference ref, CancellationToken cancel,
	asio::any_completion_handler<void(Metadata)> handler) {
	Impl::launch(pimpl_, std::move(handler),
				 [ref = std::move(ref), cancel](Impl &impl,
												asio::yield_context yield) {
					 return impl.resolver.resolve(ref, yield, cancel);
				 });
}

void Pipeline::acquire_impl(
	Reference ref, AcquisitionMode mode, CancellationToken cancel,
	asio::any_completion_handler<void(AcquisitionResult)> handler) {
	Impl::launch(pimpl_, std::move(handler),
				 [ref = std::move(ref), mode = std::move(mode), cancel](
					 Impl &impl, asio::yield_context yield) {
					 return impl.orchestrator.acquire(ref, mode, yield, cancel);
				 });
}

void Pipeline::stream_url_impl(
	Reference ref, AcquisitionMode mode, CancellationToken cancel,
	asio::any_completion_handler<void(Result<std::string>)> handler) {
	Impl::launch(
		pimpl_, std::move(handler),
		[ref = std::move(ref), mode = std::move(mode), cancel](
			Impl &impl, asio::yield_context yield) -> Result<std::string> {
			try {
				return impl.orchestrator.get_stream_url(ref, mode, yield,
														cancel);
			} catch (const std::exception &e) {
				spdlog::error("Stream URL lookup raised: {}", e.what());
				return make_error_code(errc::direct_resolution_failed);
			}
		});
}

void Pipeline::expand_impl(
	Reference ref, int limit, CancellationToken cancel,
	asio::any_completion_handler<void(std::vector<std::string>)> handler) {
	Impl::launch(pimpl_, std::move(handler),
				 [ref = std::move(ref), limit, cancel](
					 Impl &impl, asio::yield_context yield) {
					 return impl.expander.expand(ref, limit, cancel)
						 .collect(yield);
				 });
}

void Pipeline::list_formats_impl(
	Reference ref, CancellationToken cancel,
	asio::any_completion_handler<void(std::vector<FormatOption>)> handler) {
	Impl::launch(pimpl_, std::move(handler),
				 [ref = std::move(ref), cancel](Impl &impl,
												asio::yield_context yield) {
					 return impl.resolver.list_formats(ref, yield, cancel);
				 });
}

void Pipeline::search_slider_impl(
	std::string query, int index,
	asio::any_completion_handler<void(Metadata)> handler) {
	Impl::launch(pimpl_, std::move(handler),
				 [query = std::move(query), index](Impl &impl,
												   asio::yield_context yield) {
					 return impl.resolver.search_slider(query, index, yield);
				 });
}

}  // namespace ytplay
