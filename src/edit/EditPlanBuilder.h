#pragma once

#include "audio/AudioAnalysis.h"
#include "edit/EditTypes.h"
#include "media/MediaOperations.h"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace edit {

class EditPlanBuilder {
public:
	static constexpr int kDefaultSegmentCount = 8;

	EditPlanBuilder(media::MediaOperations& media, audio::AudioAnalysis& audio,
		uint32_t seed, int segmentCount = kDefaultSegmentCount);

	/**
	 * Analyze the clips and the audio track and distribute the clips over the
	 * track's length with the named strategy (unknown names use "even").
	 * A target duration shorter than the track caps the timeline; longer ones are ignored.
	 * @throws NoValidClipsError if no clip could be analyzed; the audio is not touched in that case
	 */
	EditPlan build(const std::vector<std::string>& clipPaths, const std::string& audioPath,
		const std::string& strategyName, double minClipDuration,
		std::optional<double> targetDuration = std::nullopt);

private:
	media::MediaOperations& media_;
	audio::AudioAnalysis& audio_;
	std::mt19937 rng_;
	int segmentCount_;
};

} // namespace edit
