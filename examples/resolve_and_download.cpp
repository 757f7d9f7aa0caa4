#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <iostream>
#include <ytplay/pipeline.hpp>
#include <ytplay/reference.hpp>

using namespace ytplay;

int main() {
	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("ytplay", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	boost::asio::io_context ioc;
	auto work_guard = boost::asio::make_work_guard(ioc);

	auto pipeline = Pipeline::create(ioc.get_executor(), PipelineConfig{});

	auto ref = classify_reference("https://youtu.be/dQw4w9WgXcQ");
	if (!ref) return 1;

	std::cout << "Resolving " << ref->value() << "...\n";

	// Resolve, then download as audio
	pipeline.async_resolve(*ref, [&](Metadata md) {
		if (md.is_sentinel()) {
			std::cerr << "Resolution failed\n";
			work_guard.reset();
			return;
		}
		std::cout << "Resolved: " << md.title << " [" << md.duration_display()
				  << "]\n";

		pipeline.async_acquire(
			*ref, mode::AudioOnly{}, [&](AcquisitionResult res) {
				if (res.succeeded) {
					std::cout << "Downloaded to: " << res.location << "\n";
				} else {
					spdlog::error("Download failed");
				}
				work_guard.reset();
			});
	});

	ioc.run();
	pipeline.shutdown();
	return 0;
}
