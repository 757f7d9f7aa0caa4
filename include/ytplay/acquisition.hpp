#pragma once

#include <ytplay/ytplay_export.h>

#include <boost/asio/spawn.hpp>
#include <string>
#include <ytplay/backend.hpp>
#include <ytplay/config.hpp>
#include <ytplay/pacer.hpp>
#include <ytplay/result.hpp>
#include <ytplay/types.hpp>
#include <ytplay/worker_pool.hpp>

namespace ytplay {

/// Turns a reference and a mode into a playable asset: a remote URL when
/// direct-link mode allows it, otherwise a file under the downloads
/// directory. Collaborators are borrowed and must outlive the orchestrator.
class YTPLAY_EXPORT AcquisitionOrchestrator {
   public:
	AcquisitionOrchestrator(Pacer &pacer, WorkerPool &pool,
							ExtractionBackend &backend,
							DirectUrlResolver &direct,
							DirectLinkFlag direct_link_enabled,
							const PipelineConfig &config);

	/// Never throws. Failures come back as AcquisitionResult::failure().
	AcquisitionResult acquire(const Reference &ref, const AcquisitionMode &mode,
							  asio::yield_context yield,
							  const CancellationToken &cancel = {});

	/// Direct media URL of the format `mode` would pick, without
	/// downloading.
	Result<std::string> get_stream_url(const Reference &ref,
									   const AcquisitionMode &mode,
									   asio::yield_context yield,
									   const CancellationToken &cancel = {});

	/// Backend query used to acquire `ref`; empty for playlists.
	[[nodiscard]] std::string acquisition_query(const Reference &ref) const;

   private:
	Result<std::string> try_direct(const std::string &query,
								   asio::yield_context yield,
								   const CancellationToken &cancel);
	Result<std::string> download(const std::string &query,
								 const AcquisitionMode &mode,
								 asio::yield_context yield,
								 const CancellationToken &cancel);

	Pacer &pacer_;
	WorkerPool &pool_;
	ExtractionBackend &backend_;
	DirectUrlResolver &direct_;
	DirectLinkFlag direct_link_enabled_;
	const PipelineConfig &config_;
};

/// Rename `path` to carry the `ext` extension (without dot) unless it
/// already does. Returns the final path.
YTPLAY_EXPORT Result<std::string> normalize_extension(const std::string &path,
													  const std::string &ext);

}  // namespace ytplay
