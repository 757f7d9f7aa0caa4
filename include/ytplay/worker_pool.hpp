#pragma once

#include <ytplay/ytplay_export.h>

#include <atomic>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/execution.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace ytplay {

namespace asio = boost::asio;

/// Shared cooperative cancellation flag. Copies observe the same state.
class YTPLAY_EXPORT CancellationToken {
   public:
	CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

	void cancel() const { flag_->store(true, std::memory_order_release); }

	[[nodiscard]] bool cancelled() const {
		return flag_->load(std::memory_order_acquire);
	}

   private:
	std::shared_ptr<std::atomic<bool>> flag_;
};

/// Bounded pool for blocking work (backend extraction, downloads,
/// subprocesses). Completion is delivered on the caller's executor so the
/// main scheduling context never runs blocking code.
class YTPLAY_EXPORT WorkerPool {
   public:
	explicit WorkerPool(std::size_t threads);
	~WorkerPool();

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	/// Stop accepting work and join the threads.
	void shutdown();

	/// Completes with asio::error::operation_aborted, without running
	/// `work`, once the pool has been shut down.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(boost::system::error_code))
				  CompletionToken>
	auto async_run(std::function<void()> work, CompletionToken &&token) {
		return asio::async_initiate<CompletionToken,
									void(boost::system::error_code)>(
			[this](auto &&handler, std::function<void()> work) {
				auto handler_ex = asio::get_associated_executor(handler);
				auto tracked = asio::prefer(
					handler_ex, asio::execution::outstanding_work.tracked);
				if (stopped_.load()) {
					asio::post(tracked,
							   [handler = std::forward<decltype(handler)>(
									handler)]() mutable {
								   handler(boost::system::error_code(
									   asio::error::operation_aborted));
							   });
					return;
				}
				asio::post(
					pool_, [work = std::move(work),
							handler = std::forward<decltype(handler)>(handler),
							tracked = std::move(tracked)]() mutable {
						work();
						asio::post(tracked, [handler = std::move(handler)]() mutable {
							handler(boost::system::error_code{});
						});
					});
			},
			token, std::move(work));
	}

	/// Run `fn` on the pool and suspend the calling coroutine until it
	/// finishes. Exceptions thrown by `fn` are rethrown in the caller; after
	/// shutdown() it throws boost::system::system_error instead.
	template <typename Fn>
	auto run(Fn fn, asio::yield_context yield) -> std::invoke_result_t<Fn &> {
		using R = std::invoke_result_t<Fn &>;
		std::optional<R> out;
		std::exception_ptr error;
		async_run(
			[&]() {
				try {
					out.emplace(fn());
				} catch (...) { error = std::current_exception(); }
			},
			yield);
		if (error) { std::rethrow_exception(error); }
		return std::move(*out);
	}

   private:
	asio::thread_pool pool_;
	std::atomic<bool> stopped_{false};
};

}  // namespace ytplay
