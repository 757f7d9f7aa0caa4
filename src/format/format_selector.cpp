#include <ytplay/format_selector.hpp>
#include <ytplay/output_template.hpp>

namespace ytplay {

namespace {

constexpr const char *kIdTemplate = "%(id)s.%(ext)s";
constexpr const char *kBestAudio = "bestaudio";
constexpr const char *kVideo720 =
	"(bestvideo[height<=?720][width<=?1280][ext=mp4])+(bestaudio[ext=m4a])/"
	"best[height<=?720][width<=?1280]";
// Audio muxed under a requested video format, m4a first so mp4 needs no
// re-encode
constexpr const char *kSongVideoAudio = "+bestaudio[ext=m4a]/";
constexpr const char *kSongVideoAnyAudio = "+bestaudio";
constexpr const char *kMp4 = "mp4";

struct Selector {
	FormatSelection operator()(const mode::AudioOnly &) const {
		FormatSelection sel;
		sel.format = kBestAudio;
		sel.output_template = kIdTemplate;
		return sel;
	}

	FormatSelection operator()(const mode::VideoUpTo720 &) const {
		FormatSelection sel;
		sel.format = kVideo720;
		sel.output_template = kIdTemplate;
		sel.merge_output_format = kMp4;
		return sel;
	}

	FormatSelection operator()(const mode::NamedSongAudio &m) const {
		FormatSelection sel;
		sel.format = m.format_id;
		sel.output_template = title_template(m.title, "%(ext)s");
		sel.extract_audio = true;
		return sel;
	}

	FormatSelection operator()(const mode::NamedSongVideo &m) const {
		FormatSelection sel;
		sel.format = m.format_id + kSongVideoAudio + m.format_id +
					 kSongVideoAnyAudio;
		sel.output_template = title_template(m.title, kMp4);
		sel.merge_output_format = kMp4;
		return sel;
	}
};

}  // namespace

FormatSelection select_format(const AcquisitionMode &mode) {
	return std::visit(Selector{}, mode);
}

bool produces_audio(const AcquisitionMode &m) {
	return std::holds_alternative<mode::AudioOnly>(m) ||
		   std::holds_alternative<mode::NamedSongAudio>(m);
}

std::string_view to_string(const AcquisitionMode &m) {
	switch (m.index()) {
		case 0: return "audio";
		case 1: return "video";
		case 2: return "song-audio";
		case 3: return "song-video";
		default: return "unknown";
	}
}

}  // namespace ytplay
