#include <limits>
#include <vector>
#include <ytplay/duration.hpp>

namespace ytplay {

namespace {
constexpr long long kSecondsPerMinute = 60;
constexpr long long kPaddingThreshold = 10;
constexpr std::size_t kMaxParts = 3;  // H:MM:SS
constexpr long long kMax = std::numeric_limits<long long>::max();

std::string_view trim(std::string_view sv) {
	while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
		sv.remove_prefix(1);
	}
	while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
		sv.remove_suffix(1);
	}
	return sv;
}
}  // namespace

Result<long long> parse_duration(std::string_view text) {
	text = trim(text);
	if (text.empty()) { return make_error_code(errc::invalid_number_format); }

	std::vector<long long> parts;
	long long current = 0;
	bool have_digit = false;

	for (char c : text) {
		if (c >= '0' && c <= '9') {
			const int digit = c - '0';
			if (current > (kMax - digit) / 10) {
				return make_error_code(errc::invalid_number_format);
			}
			current = current * 10 + digit;
			have_digit = true;
		} else if (c == ':') {
			if (!have_digit) {
				return make_error_code(errc::invalid_number_format);
			}
			parts.push_back(current);
			current = 0;
			have_digit = false;
		} else {
			return make_error_code(errc::invalid_number_format);
		}
	}
	if (!have_digit) { return make_error_code(errc::invalid_number_format); }
	parts.push_back(current);

	if (parts.size() > kMaxParts) {
		return make_error_code(errc::invalid_number_format);
	}

	// [1, 2, 3] -> (1 * 60 + 2) * 60 + 3
	long long seconds = 0;
	for (long long part : parts) {
		if (seconds > (kMax - part) / kSecondsPerMinute) {
			return make_error_code(errc::invalid_number_format);
		}
		seconds = seconds * kSecondsPerMinute + part;
	}
	return seconds;
}

std::string format_duration(long long seconds) {
	if (seconds <= 0) return "0:00";

	long long minutes = seconds / kSecondsPerMinute;
	long long secs = seconds % kSecondsPerMinute;

	std::string result = std::to_string(minutes) + ":";
	if (secs < kPaddingThreshold) result += "0";
	result += std::to_string(secs);
	return result;
}

}  // namespace ytplay
