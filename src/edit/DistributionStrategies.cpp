#include "edit/DistributionStrategies.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cmath>

namespace edit {

double DistributionStrategies::totalDuration(const std::vector<ClipDescriptor>& clips) {
	double total = 0.0;
	for (const auto& clip : clips) {
		total += clip.durationSeconds;
	}
	return total;
}

std::vector<ClipDescriptor> DistributionStrategies::extendClipPool(const std::vector<ClipDescriptor>& clips,
	double targetDuration, std::mt19937& rng) {

	// Only a pool shorter than the target needs more clips
	double total = totalDuration(clips);
	if (total >= targetDuration) {
		return clips;
	}
	if (total <= 0.0) {
		utils::Logger::warn("Clip pool has no usable duration, cannot extend it to {}s", targetDuration);
		return clips;
	}

	std::vector<ClipDescriptor> pool = clips;
	while (total <= targetDuration) {
		std::vector<ClipDescriptor> shuffled = clips;
		std::shuffle(shuffled.begin(), shuffled.end(), rng);
		pool.insert(pool.end(), shuffled.begin(), shuffled.end());
		total += totalDuration(clips);
	}

	utils::Logger::debug("Extended clip pool from {} to {} entries ({}s)", clips.size(), pool.size(), total);
	return pool;
}

std::vector<DistributedClip> DistributionStrategies::distributeEven(const std::vector<ClipDescriptor>& clips,
	double targetDuration, double minClipDuration, std::mt19937& rng) {

	std::vector<DistributedClip> distributed;
	if (clips.empty() || targetDuration <= 0.0) {
		return distributed;
	}

	std::vector<ClipDescriptor> pool = extendClipPool(clips, targetDuration, rng);

	size_t clipCount = pool.size();
	if (minClipDuration > 0.0 && clipCount > targetDuration / minClipDuration) {
		clipCount = std::max<size_t>(1, static_cast<size_t>(std::floor(targetDuration / minClipDuration)));
		std::shuffle(pool.begin(), pool.end(), rng);
		pool.resize(clipCount);
		utils::Logger::debug("Using a random subset of {} clips to keep slots above {}s",
			clipCount, minClipDuration);
	}

	const double slotDuration = targetDuration / clipCount;
	double currentTime = 0.0;

	for (const auto& clip : pool) {
		if (currentTime >= targetDuration) {
			break;
		}

		double used = std::min({clip.durationSeconds, slotDuration, targetDuration - currentTime});
		if (used <= 0.0) {
			continue;
		}

		DistributedClip placed;
		placed.clip = clip;
		placed.sourceStart = 0.0;
		placed.sourceEnd = used;
		placed.outputStart = currentTime;
		placed.outputEnd = currentTime + used;
		distributed.push_back(placed);

		currentTime += used;
	}

	return distributed;
}

std::vector<double> DistributionStrategies::filterRhythmPoints(const audio::RhythmTimeline& points,
	double minSpacing) {

	std::vector<double> filtered;
	for (double point : points) {
		if (filtered.empty() || point - filtered.back() >= minSpacing) {
			filtered.push_back(point);
		}
	}
	return filtered;
}

std::vector<DistributedClip> DistributionStrategies::distributeByRhythm(const std::vector<ClipDescriptor>& clips,
	const audio::RhythmTimeline& rhythmPoints, double targetDuration, double minClipDuration,
	std::mt19937& rng) {

	if (clips.empty() || targetDuration <= 0.0) {
		return {};
	}

	std::vector<double> points = filterRhythmPoints(rhythmPoints, minClipDuration);
	if (points.size() < 3) {
		utils::Logger::warn("Too few valid rhythm points ({}), using even distribution instead", points.size());
		return distributeEven(clips, targetDuration, minClipDuration, rng);
	}
	utils::Logger::info("Using {} filtered rhythm points for clip distribution", points.size());

	std::vector<ClipDescriptor> pool = extendClipPool(clips, targetDuration, rng);
	std::vector<DistributedClip> distributed;
	size_t nextClip = 0;

	for (size_t i = 0; i + 1 < points.size(); i++) {
		double start = points[i];
		double end = std::min(points[i + 1], targetDuration);
		double interval = end - start;

		if (interval < minClipDuration) {
			// A short interval at the end of the timeline means there is nothing left to fill
			if (end >= targetDuration) {
				break;
			}
			continue;
		}

		const ClipDescriptor& clip = pool[nextClip % pool.size()];
		nextClip++;

		DistributedClip placed;
		placed.clip = clip;

		if (clip.durationSeconds > interval) {
			double slack = clip.durationSeconds - interval;
			double offset = 0.0;
			if (slack > 1.0) {
				std::uniform_real_distribution<double> dist(0.0, slack);
				offset = dist(rng);
			}
			placed.sourceStart = offset;
			placed.sourceEnd = offset + interval;
			placed.outputStart = start;
			placed.outputEnd = end;
		} else {
			// Whole clip, centred in the interval
			double padding = (interval - clip.durationSeconds) / 2.0;
			placed.sourceStart = 0.0;
			placed.sourceEnd = clip.durationSeconds;
			placed.outputStart = start + padding;
			placed.outputEnd = start + padding + clip.durationSeconds;
		}
		distributed.push_back(placed);

		if (end >= targetDuration) {
			break;
		}
	}

	if (distributed.empty()) {
		utils::Logger::warn("No clips were distributed based on rhythm points, using even distribution instead");
		return distributeEven(clips, targetDuration, minClipDuration, rng);
	}
	return distributed;
}

std::vector<DistributedClip> DistributionStrategies::distributeByEnergy(const std::vector<ClipDescriptor>& clips,
	const std::vector<audio::EnergySegment>& segments, double targetDuration) {

	std::vector<DistributedClip> distributed;
	if (clips.empty() || segments.empty()) {
		return distributed;
	}

	std::vector<ClipDescriptor> sortedClips = clips;
	std::stable_sort(sortedClips.begin(), sortedClips.end(),
		[](const ClipDescriptor& a, const ClipDescriptor& b) {
			return a.durationSeconds < b.durationSeconds;
		});

	std::vector<audio::EnergySegment> sortedSegments = segments;
	std::stable_sort(sortedSegments.begin(), sortedSegments.end(),
		[](const audio::EnergySegment& a, const audio::EnergySegment& b) {
			return a.energy < b.energy;
		});

	for (size_t i = 0; i < sortedSegments.size(); i++) {
		const audio::EnergySegment& segment = sortedSegments[i];
		const ClipDescriptor& clip = sortedClips[i % sortedClips.size()];

		double used = std::min({clip.durationSeconds, segment.duration, targetDuration - segment.startTime});
		if (used <= 0.0) {
			continue;
		}

		DistributedClip placed;
		placed.clip = clip;
		placed.sourceStart = 0.0;
		placed.sourceEnd = used;
		placed.outputStart = segment.startTime;
		placed.outputEnd = segment.startTime + used;
		placed.segment = segment;
		distributed.push_back(placed);
	}

	std::stable_sort(distributed.begin(), distributed.end(),
		[](const DistributedClip& a, const DistributedClip& b) {
			return a.outputStart < b.outputStart;
		});

	return distributed;
}

} // namespace edit
