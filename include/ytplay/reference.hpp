#pragma once

#include <ytplay/ytplay_export.h>

#include <optional>
#include <string>
#include <string_view>
#include <ytplay/result.hpp>
#include <ytplay/types.hpp>

namespace ytplay {

/// True when `text` points at the target video platform.
YTPLAY_EXPORT bool is_platform_link(std::string_view text);

/// 11-character video id from watch/shorts/embed/v/youtu.be URLs, or empty.
YTPLAY_EXPORT std::string extract_video_id(std::string_view url);

/// Classify a bare string. Platform playlist links become PlaylistUrl, other
/// platform links DirectUrl, anything else a SearchQuery. Blank input yields
/// std::nullopt.
YTPLAY_EXPORT std::optional<Reference> classify_reference(std::string_view raw);

/// Locate a link inside a chat message. Entities are inspected in order; if
/// none yields a link the replied-to message is inspected, one level only.
YTPLAY_EXPORT std::optional<Reference> resolve_reference(
	const ChatMessage &message);

/// Link carried by the message's own entities, without reply traversal.
YTPLAY_EXPORT std::optional<std::string> find_link(const ChatMessage &message);

/// Parse a chat message from JSON: `text`, `caption`,
/// `entities[{type, offset, length, url}]` and a nested `reply_to`.
/// Entity types other than "url" and "text_link" are kept as
/// EntityKind::other.
YTPLAY_EXPORT Result<ChatMessage> parse_chat_message(std::string_view json);

}  // namespace ytplay
