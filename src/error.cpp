#include <string>
#include <ytplay/result.hpp>

namespace ytplay {

struct ytplay_error_category : std::error_category {
	const char *name() const noexcept override { return "ytplay"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::request_failed: return "Request failed";
			case errc::http_error: return "HTTP error";
			case errc::json_parse_error: return "JSON parse error";
			case errc::invalid_url: return "Invalid URL";
			case errc::invalid_number_format: return "Invalid number format";
			case errc::transient_extraction_failure:
				return "Extraction failed (transient)";
			case errc::no_results: return "No results found";
			case errc::fallback_exhausted:
				return "Primary and fallback resolution failed";
			case errc::download_failed: return "Download failed";
			case errc::direct_resolution_failed:
				return "Direct URL resolution failed";
			case errc::unsupported_reference:
				return "Reference kind not supported here";
			case errc::process_failed: return "Subprocess failed";
			case errc::process_timeout: return "Subprocess timed out";
			case errc::cancelled: return "Operation cancelled";
			default: return "Unknown error";
		}
	}
};

const std::error_category &ytplay_category() {
	static ytplay_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), ytplay_category()};
}

}  // namespace ytplay
