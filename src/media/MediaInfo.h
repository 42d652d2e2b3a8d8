#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace media {

struct StreamInfo {
	enum Type {
		Video,
		Audio,
		Other
	};

	Type type = Other;
	std::string codec;

	// Video only
	int width = 0;
	int height = 0;
	double fps = 0.0;

	// Audio only
	int channels = 0;
	int sampleRate = 0;
};

// Result of probing a media file
struct MediaInfo {
	double duration = 0.0;  // seconds
	int64_t size = 0;       // bytes
	int64_t bitRate = 0;
	std::vector<StreamInfo> streams;

	const StreamInfo* firstVideoStream() const {
		for (const auto& stream : streams) {
			if (stream.type == StreamInfo::Video) {
				return &stream;
			}
		}
		return nullptr;
	}

	bool hasVideo() const { return firstVideoStream() != nullptr; }

	bool hasAudio() const {
		for (const auto& stream : streams) {
			if (stream.type == StreamInfo::Audio) {
				return true;
			}
		}
		return false;
	}
};

enum class TransitionType {
	None,
	Fade,
	Dissolve,
	Wipe,
	Slide
};

struct TransitionOptions {
	TransitionType type = TransitionType::None;
	double duration = 0.5;  // seconds
};

// "none", "fade", "dissolve", "wipe", "slide"; unknown names map to Fade
TransitionType stringToTransitionType(const std::string& name);
std::string transitionTypeToString(TransitionType type);
bool isKnownTransitionName(const std::string& name);

} // namespace media
