#pragma once

#include <string>
#include <string_view>

namespace ytplay {

namespace detail {
constexpr unsigned char kMaxControl = 31;
constexpr unsigned char kDelete = 127;
}  // namespace detail

/// Sanitize a title for use as a filename: path separators and shell-hostile
/// characters become '_', control characters are dropped, trailing spaces
/// and dots are trimmed. Never returns an empty string.
inline std::string sanitize_filename(std::string_view filename) {
	std::string result;
	result.reserve(filename.size());

	for (char c : filename) {
		auto uc = static_cast<unsigned char>(c);
		switch (c) {
			case '/':
			case '\\':
			case ':':
			case '*':
			case '?':
			case '"':
			case '<':
			case '>':
			case '|': result += '_'; break;
			case '\n':
			case '\r':
			case '\t': result += ' '; break;
			default:
				if (uc <= detail::kMaxControl || uc == detail::kDelete) break;
				result += c;
				break;
		}
	}

	// Trim trailing spaces and dots (Windows issues)
	while (!result.empty() && (result.back() == ' ' || result.back() == '.')) {
		result.pop_back();
	}

	if (result.empty()) { result = "video"; }

	return result;
}

/// Escape literal text for the backend's %(field)s template syntax.
inline std::string escape_template_literal(std::string_view text) {
	std::string result;
	result.reserve(text.size());
	for (char c : text) {
		if (c == '%') result += '%';
		result += c;
	}
	return result;
}

/// Template naming the output after a user supplied title.
inline std::string title_template(std::string_view title,
								  std::string_view ext_field) {
	return escape_template_literal(sanitize_filename(title)) + "." +
		   std::string(ext_field);
}

}  // namespace ytplay
