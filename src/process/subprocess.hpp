#pragma once

#include <string>
#include <vector>
#include <ytplay/config.hpp>
#include <ytplay/result.hpp>
#include <ytplay/worker_pool.hpp>

namespace ytplay::process {

struct ProcessOutput {
	int exit_code = -1;
	std::string out;
	std::string err;
};

/// Run `executable` with `args`, capturing stdout and stderr. Blocks the
/// calling thread. The child is terminated when `timeout` (if non-zero)
/// expires or `cancel` is set.
Result<ProcessOutput> run(const std::string &executable,
						  const std::vector<std::string> &args, Seconds timeout,
						  const CancellationToken &cancel);

/// First non-empty line of `text`, trimmed of trailing whitespace.
std::string first_line(const std::string &text);

}  // namespace ytplay::process
