#pragma once

#include "media/MediaInfo.h"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace job {

class InvalidJobException : public std::runtime_error {
public:
	explicit InvalidJobException(const std::string& message)
		: std::runtime_error("Invalid job: " + message) {}
};

// Optional normalization applied to every trimmed clip; 0 leaves the source value
struct VideoFormat {
	int width = 0;
	int height = 0;
	int fps = 0;
};

struct Job {
	static constexpr double kMinClipDurationLow = 0.5;
	static constexpr double kMinClipDurationHigh = 10.0;
	static constexpr double kMaxTransitionDuration = 2.0;

	std::vector<std::string> clips;
	std::string audio;
	std::string strategy = "rhythm";
	double minClipDuration = 2.0;
	std::optional<double> targetDuration;  // caps the timeline below the audio length
	media::TransitionOptions transition{media::TransitionType::Fade, 0.5};
	int segmentCount = 8;
	std::optional<uint32_t> seed;
	std::string scratchDir;
	VideoFormat video;
};

} // namespace job
