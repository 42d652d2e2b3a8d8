#pragma once

#include <cstddef>
#include <vector>

namespace audio {

// Strictly ascending, duplicate-free timestamps in seconds
class RhythmTimeline {
public:
	RhythmTimeline() = default;
	explicit RhythmTimeline(std::vector<double> points);

	const std::vector<double>& points() const { return points_; }
	size_t size() const { return points_.size(); }
	bool empty() const { return points_.empty(); }
	double operator[](size_t i) const { return points_[i]; }

	std::vector<double>::const_iterator begin() const { return points_.begin(); }
	std::vector<double>::const_iterator end() const { return points_.end(); }

private:
	std::vector<double> points_;
};

// One of a fixed number of equal-length partitions of an audio track
struct EnergySegment {
	int index = 0;
	double startTime = 0.0;  // seconds
	double duration = 0.0;   // seconds
	double energy = 0.0;     // mean square amplitude
	double tempo = 0.0;      // BPM, 0 if none was found

	double endTime() const { return startTime + duration; }
};

} // namespace audio
