#pragma once

#include "media/MediaInfo.h"
#include <optional>
#include <string>
#include <vector>

namespace media {

/**
 * Decode/encode capability set used by the edit engine.
 *
 * Every operation writes to a caller-chosen output path and reports success as a
 * bool; the caller owns the output file whether or not the operation succeeded.
 */
class MediaOperations {
public:
	virtual ~MediaOperations() = default;

	/**
	 * Inspect a media file
	 * @return Duration and streams, or std::nullopt if the file cannot be read
	 */
	virtual std::optional<MediaInfo> probe(const std::string& path) = 0;

	/**
	 * Extract [start, end] seconds of input into output
	 */
	virtual bool trim(const std::string& input, const std::string& output,
		double start, double end) = 0;

	/**
	 * Join inputs back to back into output
	 */
	virtual bool concat(const std::vector<std::string>& inputs, const std::string& output) = 0;

	/**
	 * Join two files with a named transition of the given duration
	 */
	virtual bool transition(const std::string& first, const std::string& second,
		const std::string& output, TransitionType type, double duration) = 0;

	/**
	 * Replace the audio of video with audio, capped at durationCap seconds.
	 * The video stream is passed through; the audio is re-encoded.
	 */
	virtual bool muxAudio(const std::string& video, const std::string& audio,
		double durationCap, const std::string& output) = 0;
};

} // namespace media
