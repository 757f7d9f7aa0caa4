#pragma once

#include <ytplay/ytplay_export.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <ytplay/config.hpp>

namespace ytplay {

namespace asio = boost::asio;

/// Suspend for `delay` on the completion handler's executor.
template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void()) CompletionToken>
auto async_sleep(Millis delay, CompletionToken &&token) {
	return asio::async_initiate<CompletionToken, void()>(
		[delay](auto &&handler) {
			auto ex = asio::get_associated_executor(handler);
			auto timer = std::make_shared<asio::steady_timer>(ex, delay);
			timer->async_wait(
				[timer, handler = std::forward<decltype(handler)>(handler)](
					const boost::system::error_code &) mutable { handler(); });
		},
		token);
}

/// Gate in front of every outbound extraction call.
class YTPLAY_EXPORT Pacer {
   public:
	virtual ~Pacer() = default;

	/// Suspend the calling coroutine until the next request slot opens.
	virtual void acquire_slot(asio::yield_context yield) = 0;
};

/// Enforces a jittered minimum gap between consecutive slots. Shared by
/// every resolver and orchestrator of a process; the lock only guards the
/// timestamp/delay pair and is never held while waiting.
class YTPLAY_EXPORT RequestPacer final : public Pacer {
   public:
	using Clock = std::chrono::steady_clock;

	explicit RequestPacer(asio::any_io_executor ex, PacerSettings settings = {});

	void acquire_slot(asio::yield_context yield) override;

	/// Delay the next caller must respect, as currently sampled.
	[[nodiscard]] Millis current_delay() const;

   private:
	Millis draw_delay();

	asio::any_io_executor ex_;
	PacerSettings settings_;

	mutable std::mutex mutex_;
	std::optional<Clock::time_point> last_request_;
	Millis current_delay_;
	std::mt19937 rng_;
};

/// Pacer that never waits.
class YTPLAY_EXPORT NoopPacer final : public Pacer {
   public:
	void acquire_slot(asio::yield_context) override {}
};

}  // namespace ytplay
