#pragma once

#include "audio/AudioTypes.h"
#include "edit/EditTypes.h"
#include <random>
#include <vector>

namespace edit {

/**
 * Allocation of clips onto an output timeline of targetDuration seconds.
 *
 * Every strategy returns clips in ascending outputStart order with non-overlapping
 * output intervals inside [0, targetDuration]. All randomness comes from rng, so a
 * plan is reproducible from its seed.
 */
class DistributionStrategies {
public:
	/**
	 * Append shuffled copies of clips until the total duration strictly exceeds
	 * targetDuration. Returned unchanged if it already does or if it sums to zero.
	 */
	static std::vector<ClipDescriptor> extendClipPool(const std::vector<ClipDescriptor>& clips,
		double targetDuration, std::mt19937& rng);

	/**
	 * Equal slots of targetDuration / clipCount, back to back from 0.
	 * If slots would be shorter than minClipDuration, a random subset of
	 * floor(targetDuration / minClipDuration) clips is used instead.
	 */
	static std::vector<DistributedClip> distributeEven(const std::vector<ClipDescriptor>& clips,
		double targetDuration, double minClipDuration, std::mt19937& rng);

	// Greedily keep points at least minSpacing after the previously kept point
	static std::vector<double> filterRhythmPoints(const audio::RhythmTimeline& points, double minSpacing);

	/**
	 * One clip per interval between consecutive filtered rhythm points, round-robin.
	 * Falls back to distributeEven when fewer than 3 points survive filtering or
	 * when no interval is long enough.
	 */
	static std::vector<DistributedClip> distributeByRhythm(const std::vector<ClipDescriptor>& clips,
		const audio::RhythmTimeline& rhythmPoints, double targetDuration, double minClipDuration,
		std::mt19937& rng);

	/**
	 * Clips sorted by duration paired index-for-index with segments sorted by energy,
	 * each placed at its segment's start and ordered by it.
	 */
	static std::vector<DistributedClip> distributeByEnergy(const std::vector<ClipDescriptor>& clips,
		const std::vector<audio::EnergySegment>& segments, double targetDuration);

private:
	static double totalDuration(const std::vector<ClipDescriptor>& clips);
};

} // namespace edit
