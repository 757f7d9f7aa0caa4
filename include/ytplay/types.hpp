#pragma once

#include <ytplay/ytplay_export.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <ytplay/duration.hpp>

namespace ytplay {

// =============================================================================
// Reference
// =============================================================================

struct DirectUrl {
	std::string value;
};
struct VideoId {
	std::string value;
};
struct SearchQuery {
	std::string value;
};
struct PlaylistUrl {
	std::string value;
};

enum class ReferenceKind : std::uint8_t {
	direct_url,
	video_id,
	search_query,
	playlist_url
};

/// A user-supplied identifier of a media item. Exactly one variant is active
/// and the value never changes after construction.
class YTPLAY_EXPORT Reference {
   public:
	using Variant = std::variant<DirectUrl, VideoId, SearchQuery, PlaylistUrl>;

	static Reference direct_url(std::string url) {
		return Reference(DirectUrl{std::move(url)});
	}
	static Reference video_id(std::string id) {
		return Reference(VideoId{std::move(id)});
	}
	static Reference search_query(std::string text) {
		return Reference(SearchQuery{std::move(text)});
	}
	static Reference playlist_url(std::string url) {
		return Reference(PlaylistUrl{std::move(url)});
	}

	[[nodiscard]] ReferenceKind kind() const {
		return static_cast<ReferenceKind>(value_.index());
	}

	[[nodiscard]] const std::string &value() const {
		return std::visit(
			[](const auto &v) -> const std::string & { return v.value; },
			value_);
	}

	template <typename T>
	[[nodiscard]] bool is() const {
		return std::holds_alternative<T>(value_);
	}

	[[nodiscard]] const Variant &variant() const { return value_; }

   private:
	explicit Reference(Variant v) : value_(std::move(v)) {}

	Variant value_;
};

YTPLAY_EXPORT std::string_view to_string(ReferenceKind kind);

// =============================================================================
// Metadata
// =============================================================================

inline constexpr std::string_view kUnknownTitle = "Unknown Title";

/// Normalized metadata of a single media item. On total resolution failure
/// every field holds its sentinel value (see sentinel()).
struct YTPLAY_EXPORT Metadata {
	std::string title{kUnknownTitle};
	long long duration_seconds = 0;
	std::string video_id;
	std::string thumbnail_url;

	/// "M:SS", minutes not wrapped into hours. Always derived from
	/// duration_seconds.
	[[nodiscard]] std::string duration_display() const {
		return format_duration(duration_seconds);
	}

	[[nodiscard]] bool is_sentinel() const {
		return title == kUnknownTitle && duration_seconds == 0 &&
			   video_id.empty();
	}

	static Metadata sentinel() { return Metadata{}; }
};

struct YTPLAY_EXPORT TrackDetails {
	std::string title;
	std::string link;
	std::string video_id;
	std::string duration_display;
	std::string thumbnail;
};

// =============================================================================
// Acquisition
// =============================================================================

namespace mode {
struct AudioOnly {};
struct VideoUpTo720 {};
struct NamedSongAudio {
	std::string format_id;
	std::string title;
};
struct NamedSongVideo {
	std::string format_id;
	std::string title;
};
}  // namespace mode

using AcquisitionMode = std::variant<mode::AudioOnly, mode::VideoUpTo720,
									 mode::NamedSongAudio, mode::NamedSongVideo>;

/// True for modes whose output is an audio file.
YTPLAY_EXPORT bool produces_audio(const AcquisitionMode &m);

YTPLAY_EXPORT std::string_view to_string(const AcquisitionMode &m);

struct YTPLAY_EXPORT AcquisitionResult {
	std::string location;  // local path, or remote URL when is_direct
	bool is_direct = false;
	bool succeeded = false;

	static AcquisitionResult failure() { return {}; }
};

// =============================================================================
// Formats & search
// =============================================================================

struct YTPLAY_EXPORT FormatOption {
	std::string format_id;
	std::string ext;
	std::string format_note;
	std::string resolution;	 // e.g. "1280x720", "audio only"
	long long filesize = 0;
	std::string link;  // watch URL the format belongs to
};

// Entry returned by the secondary search provider
struct YTPLAY_EXPORT SearchResult {
	std::string video_id;
	std::string title;
	std::string channel;
	std::string url;  // Full watch URL
	std::string duration_string;  // e.g., "3:33", empty for live streams
	std::vector<std::string> thumbnails;
};

// =============================================================================
// Chat message collaborator
// =============================================================================

enum class EntityKind : std::uint8_t {
	url,		// plain URL span inside the text
	text_link,	// rich link carrying its own URL
	other
};

struct YTPLAY_EXPORT MessageEntity {
	EntityKind kind = EntityKind::other;
	std::size_t offset = 0;	 // byte offset into text/caption
	std::size_t length = 0;
	std::string url;  // only for text_link
};

struct YTPLAY_EXPORT ChatMessage {
	std::optional<std::string> text;
	std::optional<std::string> caption;
	std::vector<MessageEntity> entities;
	std::shared_ptr<const ChatMessage> reply_to;
};

}  // namespace ytplay
