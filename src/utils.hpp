#pragma once

#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>

namespace ytplay::utils {

// =============================================================================
// JSON Traversal Utilities
// =============================================================================

// PathElement wrapper to handle both string keys and integer indices
// Supports implicit conversion from const char*, std::string, and int
class PathElement {
   public:
	PathElement(const char *key) : m_is_index(false), m_key(key), m_index(0) {}
	PathElement(const std::string &key)
		: m_is_index(false), m_key(key), m_index(0) {}
	PathElement(int index) : m_is_index(true), m_index(index) {}

	[[nodiscard]] bool is_index() const { return m_is_index; }
	[[nodiscard]] const std::string &key() const { return m_key; }
	[[nodiscard]] int index() const { return m_index; }

   private:
	bool m_is_index;
	std::string m_key;
	int m_index;
};

namespace detail {

// Navigate one step in the JSON structure
inline const nlohmann::json *step(const nlohmann::json *j,
								  const PathElement &elem) {
	if (!j) return nullptr;

	if (!elem.is_index()) {
		const auto &key = elem.key();
		if (j->is_object()) {
			auto it = j->find(key);
			if (it != j->end()) return &*it;
		}
	} else {
		int idx = elem.index();
		if (j->is_array()) {
			// Negative indices count from the back
			if (idx < 0) { idx = static_cast<int>(j->size()) + idx; }
			if (idx >= 0 && static_cast<size_t>(idx) < j->size()) {
				return &(*j)[static_cast<size_t>(idx)];
			}
		}
	}
	return nullptr;
}

inline const nlohmann::json *traverse(
	const nlohmann::json *j, const std::initializer_list<PathElement> &path) {
	for (const auto &elem : path) {
		j = step(j, elem);
		if (!j) return nullptr;
	}
	return j;
}

template <typename T>
bool holds(const nlohmann::json &j) {
	if constexpr (std::is_same_v<T, std::string>) {
		return j.is_string();
	} else if constexpr (std::is_same_v<T, bool>) {
		return j.is_boolean();
	} else if constexpr (std::is_arithmetic_v<T>) {
		return j.is_number();
	} else {
		return !j.is_null();
	}
}

}  // namespace detail

/// Traverse a JSON object using a path of keys/indices.
/// Returns std::nullopt if the path doesn't exist or holds another type.
///
/// Usage:
///   auto title = traverse_obj<std::string>(json, {"entries", 0, "title"});
///   auto last = traverse_obj<std::string>(json, {"thumbnails", -1, "url"});
template <typename T>
std::optional<T> traverse_obj(const nlohmann::json &j,
							  std::initializer_list<PathElement> path) {
	const nlohmann::json *result = detail::traverse(&j, path);
	if (!result || !detail::holds<T>(*result)) return std::nullopt;
	return result->get<T>();
}

/// Traverse and return the raw JSON node (useful for arrays/objects)
inline const nlohmann::json *traverse_json(
	const nlohmann::json &j, std::initializer_list<PathElement> path) {
	return detail::traverse(&j, path);
}

/// Traverse with a default value (never returns nullopt)
template <typename T>
T traverse_obj_default(const nlohmann::json &j,
					   std::initializer_list<PathElement> path, T default_val) {
	auto result = traverse_obj<T>(j, path);
	return result.value_or(std::move(default_val));
}

/// Get text from runs array (common YouTube pattern)
/// Handles: {"runs": [{"text": "hello"}, {"text": " world"}]} -> "hello world"
inline std::string get_text_from_runs(const nlohmann::json &j,
									  std::initializer_list<PathElement> path) {
	const auto *runs = traverse_json(j, path);
	if (!runs || !runs->is_array()) { return ""; }

	std::string result;
	for (const auto &run : *runs) {
		if (auto text = traverse_obj<std::string>(run, {"text"})) {
			result += *text;
		}
	}
	return result;
}

}  // namespace ytplay::utils
