#include "subprocess.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <chrono>
#include <future>
#include <sstream>

namespace ytplay::process {

namespace bp = boost::process;

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(100);

boost::filesystem::path locate(const std::string &executable) {
	if (executable.find('/') != std::string::npos) {
		return boost::filesystem::path(executable);
	}
	return bp::search_path(executable);
}
}  // namespace

Result<ProcessOutput> run(const std::string &executable,
						  const std::vector<std::string> &args, Seconds timeout,
						  const CancellationToken &cancel) {
	auto exe = locate(executable);
	if (exe.empty()) {
		spdlog::error("Executable not found: {}", executable);
		return make_error_code(errc::process_failed);
	}

	boost::asio::io_context ioc;
	std::future<std::string> out;
	std::future<std::string> err;
	std::error_code ec;

	bp::child child(exe, bp::args(args), bp::std_in.close(), bp::std_out > out,
					bp::std_err > err, ioc, ec);
	if (ec) {
		spdlog::error("Failed to launch {}: {}", exe.string(), ec.message());
		return make_error_code(errc::process_failed);
	}

	const auto deadline = timeout.count() > 0
							  ? std::chrono::steady_clock::now() + timeout
							  : std::chrono::steady_clock::time_point::max();

	while (!ioc.stopped()) {
		ioc.run_for(kPollInterval);
		if (ioc.stopped()) break;

		if (cancel.cancelled()) {
			spdlog::debug("Cancelling {} (pid {})", exe.filename().string(),
						  child.id());
			child.terminate(ec);
			return make_error_code(errc::cancelled);
		}
		if (std::chrono::steady_clock::now() >= deadline) {
			spdlog::warn("{} timed out after {}s, killing pid {}",
						 exe.filename().string(), timeout.count(), child.id());
			child.terminate(ec);
			return make_error_code(errc::process_timeout);
		}
	}

	child.wait(ec);
	ProcessOutput result;
	result.exit_code = child.exit_code();
	result.out = out.get();
	result.err = err.get();
	return result;
}

std::string first_line(const std::string &text) {
	std::istringstream stream(text);
	std::string line;
	while (std::getline(stream, line)) {
		while (!line.empty() &&
			   (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
			line.pop_back();
		}
		if (!line.empty()) return line;
	}
	return "";
}

}  // namespace ytplay::process
