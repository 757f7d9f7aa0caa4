#pragma once

#include <random>

namespace ytplay::detail {

// Per-thread engine; resolvers are shared by coroutines that may run on
// several io threads.
inline std::mt19937 &random_engine() {
	thread_local std::mt19937 engine{std::random_device{}()};
	return engine;
}

}  // namespace ytplay::detail
