#include "audio/AudioTypes.h"
#include <algorithm>
#include <utility>

namespace audio {

RhythmTimeline::RhythmTimeline(std::vector<double> points)
	: points_(std::move(points)) {
	std::sort(points_.begin(), points_.end());
	points_.erase(std::unique(points_.begin(), points_.end()), points_.end());
}

} // namespace audio
