#pragma once

#include "media/FFmpegCommand.h"
#include "media/MediaOperations.h"
#include <string>

namespace media {

// MediaOperations backed by libavformat probing and the ffmpeg command-line tool
class FFmpegMediaOperations : public MediaOperations {
public:
	struct Config {
		std::string ffmpegPath = "ffmpeg";
		std::string videoCodec = "libx264";
		std::string audioCodec = "aac";
		std::string preset = "veryfast";
		int crf = 23;
		double audioVolume = 0.8;

		// Trimmed clips are scaled/padded to this size and resampled to this rate when non-zero
		int width = 0;
		int height = 0;
		int fps = 0;
	};

	explicit FFmpegMediaOperations(const Config& config);

	std::optional<MediaInfo> probe(const std::string& path) override;
	bool trim(const std::string& input, const std::string& output,
		double start, double end) override;
	bool concat(const std::vector<std::string>& inputs, const std::string& output) override;
	bool transition(const std::string& first, const std::string& second,
		const std::string& output, TransitionType type, double duration) override;
	bool muxAudio(const std::string& video, const std::string& audio,
		double durationCap, const std::string& output) override;

	const Config& getConfig() const { return config_; }

	// Filter graph joining [0:v] and [1:v] into [outv]; firstDuration is the length of input 0
	static std::string transitionFilter(TransitionType type, double firstDuration, double duration);

private:
	FFmpegCommand command() const;
	void addVideoEncoding(FFmpegCommand& cmd) const;
	std::string normalizeFilter() const;

	Config config_;
};

} // namespace media
