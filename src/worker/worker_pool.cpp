#include <spdlog/spdlog.h>

#include <ytplay/worker_pool.hpp>

namespace ytplay {

WorkerPool::WorkerPool(std::size_t threads)
	: pool_(threads == 0 ? 1 : threads) {
	spdlog::debug("Worker pool started with {} thread(s)",
				  threads == 0 ? 1 : threads);
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::shutdown() {
	if (stopped_.exchange(true)) { return; }  // Already shut down
	pool_.join();
}

}  // namespace ytplay
