#include <spdlog/spdlog.h>

#include <boost/asio/steady_timer.hpp>
#include <ytplay/pacer.hpp>

namespace ytplay {

RequestPacer::RequestPacer(asio::any_io_executor ex, PacerSettings settings)
	: ex_(std::move(ex)),
	  settings_(settings),
	  current_delay_(0),
	  rng_(std::random_device{}()) {
	if (settings_.max_delay < settings_.min_delay) {
		settings_.max_delay = settings_.min_delay;
	}
	current_delay_ = draw_delay();
}

Millis RequestPacer::current_delay() const {
	std::lock_guard lock(mutex_);
	return current_delay_;
}

// Caller holds mutex_
Millis RequestPacer::draw_delay() {
	std::uniform_int_distribution<Millis::rep> dist(
		settings_.min_delay.count(), settings_.max_delay.count());
	return Millis(dist(rng_));
}

void RequestPacer::acquire_slot(asio::yield_context yield) {
	for (;;) {
		Clock::duration wait{};
		{
			std::lock_guard lock(mutex_);
			auto now = Clock::now();
			if (!last_request_ || now - *last_request_ >= current_delay_) {
				last_request_ = now;
				current_delay_ = draw_delay();
				spdlog::debug(
					"Pacer slot granted, next delay {}ms", current_delay_.count());
				return;
			}
			wait = *last_request_ + current_delay_ - now;
		}

		// Another task may stamp while we sleep, so re-check afterwards.
		spdlog::debug("Pacer waiting {}ms",
					  std::chrono::duration_cast<Millis>(wait).count());
		asio::steady_timer timer(ex_);
		timer.expires_after(wait);
		boost::system::error_code ec;
		timer.async_wait(yield[ec]);
	}
}

}  // namespace ytplay
