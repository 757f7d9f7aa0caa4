#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/coroutine/attributes.hpp>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <ytplay/backend.hpp>
#include <ytplay/pacer.hpp>

namespace ytplay::test {

/// Run `fn` as a coroutine on a fresh io_context and wait for it.
/// Exceptions escaping the coroutine are rethrown to the caller.
inline void run_coroutine(const std::function<void(asio::yield_context)> &fn) {
	asio::io_context ioc;
	std::exception_ptr error;
	asio::spawn(
		ioc,
		[&](asio::yield_context yield) {
			try {
				fn(yield);
			} catch (...) { error = std::current_exception(); }
		},
		boost::coroutines::attributes());
	ioc.run();
	if (error) std::rethrow_exception(error);
}

/// Configuration with every wait shortened so tests run fast.
inline PipelineConfig fast_config() {
	PipelineConfig config;
	config.pacer = {Millis{0}, Millis{0}};
	config.retry.backoff_seed = Millis{0};
	config.retry.backoff_step = Millis{0};
	config.retry.backoff_jitter = Millis{0};
	config.worker_threads = 2;
	return config;
}

/// Pacer that counts slots and never waits.
class CountingPacer final : public Pacer {
   public:
	void acquire_slot(asio::yield_context) override { ++slots; }

	std::atomic<int> slots{0};
};

struct BackendCall {
	std::string query;
	BackendOptions options;
	bool download = false;
};

/// Backend replaying scripted results. Once the script runs out the last
/// result is repeated.
class FakeBackend final : public ExtractionBackend {
   public:
	using Script = std::function<Result<BackendInfo>(const BackendCall &)>;

	void push(Result<BackendInfo> result) {
		std::lock_guard lock(mutex_);
		results_.push_back(std::move(result));
	}

	void on_call(Script script) {
		std::lock_guard lock(mutex_);
		script_ = std::move(script);
	}

	Result<BackendInfo> extract_info(const std::string &query,
									 const BackendOptions &options,
									 bool download,
									 const CancellationToken &) override {
		std::lock_guard lock(mutex_);
		calls.push_back({query, options, download});
		if (script_) return script_(calls.back());
		if (results_.empty()) {
			return make_error_code(errc::transient_extraction_failure);
		}
		auto result = results_.front();
		if (results_.size() > 1) results_.pop_front();
		return result;
	}

	std::vector<BackendCall> calls;

   private:
	std::mutex mutex_;
	std::deque<Result<BackendInfo>> results_;
	Script script_;
};

/// Backend that raises on every call.
class ThrowingBackend final : public ExtractionBackend {
   public:
	Result<BackendInfo> extract_info(const std::string &, const BackendOptions &,
									 bool, const CancellationToken &) override {
		++calls;
		throw std::runtime_error("upstream unavailable");
	}

	std::atomic<int> calls{0};
};

class FakeSearch final : public SearchProvider {
   public:
	Result<std::vector<SearchResult>> search(const std::string &text,
											 int limit,
											 asio::yield_context) override {
		queries.push_back(text);
		limits.push_back(limit);
		if (fail) return make_error_code(errc::request_failed);
		if (raise) throw std::runtime_error("search unavailable");
		return results;
	}

	std::vector<SearchResult> results;
	bool fail = false;
	bool raise = false;
	std::vector<std::string> queries;
	std::vector<int> limits;
};

class FakeDirect final : public DirectUrlResolver {
   public:
	Result<std::string> resolve(const std::string &link, Seconds timeout,
								const CancellationToken &) override {
		++calls;
		last_link = link;
		last_timeout = timeout;
		if (fail) return make_error_code(errc::direct_resolution_failed);
		return url;
	}

	std::string url;
	bool fail = false;
	std::atomic<int> calls{0};
	std::string last_link;
	Seconds last_timeout{0};
};

inline BackendInfo make_item(std::string id, std::string title,
							 long long duration) {
	BackendInfo info;
	info.id = std::move(id);
	info.title = std::move(title);
	info.duration = duration;
	return info;
}

}  // namespace ytplay::test
