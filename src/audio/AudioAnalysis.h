#pragma once

#include "audio/AudioTypes.h"
#include <string>
#include <vector>

namespace audio {

/**
 * Musical analysis of an audio track, as needed for planning an edit.
 * Implementations throw std::runtime_error when the track cannot be read.
 */
class AudioAnalysis {
public:
	virtual ~AudioAnalysis() = default;

	// Total length in seconds
	virtual double duration(const std::string& path) = 0;

	// Beats and onsets merged into one timeline
	virtual RhythmTimeline rhythmPoints(const std::string& path) = 0;

	// count equal-length partitions with their energy and tempo
	virtual std::vector<EnergySegment> energySegments(const std::string& path, int count) = 0;
};

} // namespace audio
