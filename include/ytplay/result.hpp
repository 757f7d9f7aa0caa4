#pragma once

#include <boost/outcome.hpp>
#include <system_error>

namespace ytplay {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// HTTP/Net errors
	request_failed = 10,
	http_error,	 // Non-200 status

	// Parsing errors
	json_parse_error = 20,
	invalid_url,
	invalid_number_format,

	// Extraction pipeline
	transient_extraction_failure = 30,	// retryable upstream failure
	no_results,							// query matched nothing
	fallback_exhausted,					// primary and secondary both failed
	download_failed,
	direct_resolution_failed,
	unsupported_reference,

	// Subprocess
	process_failed = 40,
	process_timeout,
	cancelled,

	unknown = 100
};

std::error_code make_error_code(errc e);

}  // namespace ytplay

namespace std {
template <>
struct is_error_code_enum<ytplay::errc> : true_type {};
}  // namespace std

namespace ytplay {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace ytplay
