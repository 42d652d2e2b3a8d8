#pragma once

#include "media/MediaInfo.h"
#include <string>

namespace media {

// Container and stream inspection through libavformat (no decoding)
class MediaProbe {
public:
	// Throws std::runtime_error if the file cannot be opened or has no readable streams
	static MediaInfo probe(const std::string& filename);
};

} // namespace media
