#include <boost/regex.hpp>
#include <ytplay/reference.hpp>

namespace ytplay {

namespace {

const boost::regex &platform_regex() {
	static const boost::regex re(R"((?:youtube\.com|youtu\.be))",
								 boost::regex::icase);
	return re;
}

// Matches:
// - youtube.com/watch?v=ID
// - youtube.com/shorts/ID
// - youtube.com/embed/ID
// - youtube.com/v/ID
// - youtu.be/ID
const boost::regex &video_id_regex() {
	static const boost::regex re(
		R"(^(?:https?://)?(?:www\.|m\.|music\.)?(?:youtube\.com/(?:watch\?(?:.*&)?v=|shorts/|embed/|v/)|youtu\.be/)([\w-]{11}))",
		boost::regex::icase);
	return re;
}

const boost::regex &playlist_regex() {
	static const boost::regex re(R"(youtube\.com/playlist\?(?:.*&)?list=)",
								 boost::regex::icase);
	return re;
}

std::string_view trim(std::string_view sv) {
	auto is_space = [](char c) {
		return c == ' ' || c == '\t' || c == '\n' || c == '\r';
	};
	while (!sv.empty() && is_space(sv.front())) sv.remove_prefix(1);
	while (!sv.empty() && is_space(sv.back())) sv.remove_suffix(1);
	return sv;
}

Reference classify_link(std::string link) {
	if (boost::regex_search(link, playlist_regex())) {
		return Reference::playlist_url(std::move(link));
	}
	return Reference::direct_url(std::move(link));
}

}  // namespace

std::string_view to_string(ReferenceKind kind) {
	switch (kind) {
		case ReferenceKind::direct_url: return "direct_url";
		case ReferenceKind::video_id: return "video_id";
		case ReferenceKind::search_query: return "search_query";
		case ReferenceKind::playlist_url: return "playlist_url";
	}
	return "unknown";
}

bool is_platform_link(std::string_view text) {
	return boost::regex_search(text.begin(), text.end(), platform_regex());
}

std::string extract_video_id(std::string_view url) {
	boost::match_results<std::string_view::const_iterator> m;
	if (boost::regex_search(url.begin(), url.end(), m, video_id_regex())) {
		return m[1].str();
	}
	return "";
}

std::optional<Reference> classify_reference(std::string_view raw) {
	auto text = trim(raw);
	if (text.empty()) return std::nullopt;

	if (is_platform_link(text)) { return classify_link(std::string(text)); }
	return Reference::search_query(std::string(text));
}

std::optional<std::string> find_link(const ChatMessage &message) {
	const std::string *body = nullptr;
	if (message.text && !message.text->empty()) {
		body = &*message.text;
	} else if (message.caption && !message.caption->empty()) {
		body = &*message.caption;
	}

	for (const auto &entity : message.entities) {
		switch (entity.kind) {
			case EntityKind::url:
				if (!body) break;
				if (entity.offset > body->size() ||
					entity.length > body->size() - entity.offset) {
					break;	// span outside the text
				}
				if (entity.length == 0) break;
				return body->substr(entity.offset, entity.length);
			case EntityKind::text_link:
				if (!entity.url.empty()) return entity.url;
				break;
			case EntityKind::other: break;
		}
	}
	return std::nullopt;
}

std::optional<Reference> resolve_reference(const ChatMessage &message) {
	auto link = find_link(message);
	if (!link && message.reply_to) { link = find_link(*message.reply_to); }
	if (!link) return std::nullopt;
	return classify_link(std::move(*link));
}

}  // namespace ytplay
