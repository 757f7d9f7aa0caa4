#pragma once

#include <ytplay/ytplay_export.h>

#include <string>
#include <string_view>
#include <vector>
#include <ytplay/backend.hpp>

namespace ytplay {

/// Command line (without the executable) for one backend call.
YTPLAY_EXPORT std::vector<std::string> build_backend_arguments(
	const std::string &query, const BackendOptions &opts, bool download);

/// Parse a --dump-single-json document. A null or empty document is a
/// failure.
YTPLAY_EXPORT Result<BackendInfo> parse_info_json(std::string_view text);

/// ExtractionBackend that drives the yt-dlp executable.
class YTPLAY_EXPORT YtDlpBackend final : public ExtractionBackend {
   public:
	explicit YtDlpBackend(std::string executable = "yt-dlp");

	Result<BackendInfo> extract_info(const std::string &query,
									 const BackendOptions &options,
									 bool download,
									 const CancellationToken &cancel) override;

   private:
	std::string executable_;
};

/// DirectUrlResolver that asks yt-dlp for the best <=720p format URL.
class YTPLAY_EXPORT YtDlpDirectUrlResolver final : public DirectUrlResolver {
   public:
	explicit YtDlpDirectUrlResolver(std::string executable = "yt-dlp");

	static std::vector<std::string> arguments(const std::string &link);

	Result<std::string> resolve(const std::string &link, Seconds timeout,
								const CancellationToken &cancel) override;

   private:
	std::string executable_;
};

}  // namespace ytplay
