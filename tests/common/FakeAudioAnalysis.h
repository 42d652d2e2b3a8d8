#pragma once

#include "audio/AudioAnalysis.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace test {

// Returns canned analysis results and counts how often it was asked
class FakeAudioAnalysis : public audio::AudioAnalysis {
public:
	double audioDuration = 10.0;
	std::vector<double> rhythm;
	std::vector<audio::EnergySegment> segments;

	int durationCalls = 0;
	int rhythmCalls = 0;
	int segmentCalls = 0;
	int lastSegmentCount = 0;

	double duration(const std::string& /*path*/) override {
		durationCalls++;
		return audioDuration;
	}

	audio::RhythmTimeline rhythmPoints(const std::string& /*path*/) override {
		rhythmCalls++;
		return audio::RhythmTimeline(rhythm);
	}

	std::vector<audio::EnergySegment> energySegments(const std::string& /*path*/, int count) override {
		segmentCalls++;
		lastSegmentCount = count;
		return segments;
	}

	int totalCalls() const { return durationCalls + rhythmCalls + segmentCalls; }
};

} // namespace test
