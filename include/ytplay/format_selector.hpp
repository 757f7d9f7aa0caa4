#pragma once

#include <ytplay/ytplay_export.h>

#include <optional>
#include <string>
#include <ytplay/types.hpp>

namespace ytplay {

/// Backend parameters implied by an acquisition mode.
struct YTPLAY_EXPORT FormatSelection {
	std::string format;			  // backend format selector string
	std::string output_template;  // filename template, no directory
	std::optional<std::string> merge_output_format;
	bool extract_audio = false;	 // ask the backend to transcode to audio
};

/// Pure mapping from mode to format selector and filename template.
YTPLAY_EXPORT FormatSelection select_format(const AcquisitionMode &mode);

}  // namespace ytplay
