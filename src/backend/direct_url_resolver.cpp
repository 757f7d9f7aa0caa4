#include <spdlog/spdlog.h>

#include <ytplay/ytdlp_backend.hpp>

#include "process/subprocess.hpp"

namespace ytplay {

namespace {
constexpr const char *kDirectFormat = "best[height<=?720][width<=?1280]";
}

YtDlpDirectUrlResolver::YtDlpDirectUrlResolver(std::string executable)
	: executable_(std::move(executable)) {}

std::vector<std::string> YtDlpDirectUrlResolver::arguments(
	const std::string &link) {
	return {"-g", "-f", kDirectFormat, "--", link};
}

Result<std::string> YtDlpDirectUrlResolver::resolve(
	const std::string &link, Seconds timeout, const CancellationToken &cancel) {
	auto run = process::run(executable_, arguments(link), timeout, cancel);
	if (run.has_error()) { return run.error(); }

	const auto &output = run.value();
	if (output.exit_code != 0) {
		spdlog::debug("Direct URL lookup exited {}: {}", output.exit_code,
					  process::first_line(output.err));
		return make_error_code(errc::direct_resolution_failed);
	}

	auto url = process::first_line(output.out);
	if (url.empty()) return make_error_code(errc::direct_resolution_failed);
	return url;
}

}  // namespace ytplay
