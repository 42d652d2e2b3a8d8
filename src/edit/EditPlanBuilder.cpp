#include "edit/EditPlanBuilder.h"
#include "edit/ClipAnalyzer.h"
#include "edit/DistributionStrategies.h"
#include "utils/Logger.h"
#include "utils/Timer.h"
#include <utility>

namespace edit {

EditPlanBuilder::EditPlanBuilder(media::MediaOperations& media, audio::AudioAnalysis& audio,
	uint32_t seed, int segmentCount)
	: media_(media)
	, audio_(audio)
	, rng_(seed)
	, segmentCount_(segmentCount > 0 ? segmentCount : kDefaultSegmentCount) {
}

EditPlan EditPlanBuilder::build(const std::vector<std::string>& clipPaths, const std::string& audioPath,
	const std::string& strategyName, double minClipDuration, std::optional<double> targetDuration) {

	TIME_BLOCK("planning");

	std::vector<ClipDescriptor> clips;
	{
		TIME_BLOCK("clip_analysis");
		clips = ClipAnalyzer(media_).analyze(clipPaths);
	}
	if (clips.empty()) {
		throw NoValidClipsError("None of the " + std::to_string(clipPaths.size()) + " clips could be analyzed");
	}

	if (!isKnownStrategyName(strategyName)) {
		utils::Logger::warn("Unknown strategy '{}', using even distribution", strategyName);
	}
	Strategy strategy = strategyFromString(strategyName);

	double timelineDuration = audio_.duration(audioPath);
	if (targetDuration && *targetDuration > 0.0 && *targetDuration < timelineDuration) {
		utils::Logger::info("Capping the timeline at {}s of {}s audio", *targetDuration, timelineDuration);
		timelineDuration = *targetDuration;
	}
	utils::Logger::info("Planning {} clips over {}s of audio with the {} strategy",
		clips.size(), timelineDuration, strategyToString(strategy));

	std::vector<DistributedClip> distributed;
	switch (strategy) {
	case Strategy::Rhythm: {
		audio::RhythmTimeline points = audio_.rhythmPoints(audioPath);
		distributed = DistributionStrategies::distributeByRhythm(clips, points, timelineDuration,
			minClipDuration, rng_);
		break;
	}
	case Strategy::Energy: {
		std::vector<audio::EnergySegment> segments = audio_.energySegments(audioPath, segmentCount_);
		distributed = DistributionStrategies::distributeByEnergy(clips, segments, timelineDuration);
		break;
	}
	case Strategy::Even:
	default:
		distributed = DistributionStrategies::distributeEven(clips, timelineDuration, minClipDuration, rng_);
		break;
	}

	utils::Logger::info("Plan places {} clip intervals", distributed.size());
	for (const auto& placed : distributed) {
		utils::Logger::debug("  {} [{} - {}] -> [{} - {}]", placed.clip.sourcePath,
			placed.sourceStart, placed.sourceEnd, placed.outputStart, placed.outputEnd);
	}

	return EditPlan(std::move(clips), audioPath, timelineDuration, strategy, std::move(distributed));
}

} // namespace edit
