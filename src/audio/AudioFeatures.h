#pragma once

#include "audio/AudioTypes.h"
#include <cstddef>
#include <vector>

namespace audio {

/**
 * Rhythm and energy features computed from mono PCM.
 *
 * The onset envelope is sampled once per hop; an envelope index i corresponds to
 * time i / frameRate seconds where frameRate = sampleRate / hopSize.
 */
class AudioFeatures {
public:
	static constexpr size_t kFrameSize = 2048;
	static constexpr size_t kHopSize = 512;
	static constexpr double kMinBpm = 60.0;
	static constexpr double kMaxBpm = 200.0;
	// Rhythm points closer than this are collapsed into the earlier one
	static constexpr double kRhythmMinGap = 0.1;

	/**
	 * Half-wave rectified flux of per-frame log energy
	 * @return One value per hop; empty if samples is empty
	 */
	static std::vector<double> onsetEnvelope(const std::vector<float>& samples,
		size_t frameSize = kFrameSize, size_t hopSize = kHopSize);

	/**
	 * Local maxima of the envelope above the local mean plus delta (envelope normalized to peak 1)
	 * @return Onset times in seconds, ascending
	 */
	static std::vector<double> pickOnsets(const std::vector<double>& envelope, double frameRate,
		double delta = 0.07);

	/**
	 * Dominant tempo from the envelope autocorrelation, restricted to [minBpm, maxBpm]
	 * @return BPM, or 0 if the envelope carries no periodicity
	 */
	static double estimateTempo(const std::vector<double>& envelope, double frameRate,
		double minBpm = kMinBpm, double maxBpm = kMaxBpm);

	/**
	 * Beat grid at the given tempo, phase-aligned to the envelope and snapped to nearby peaks
	 * @return Beat times in seconds, ascending; empty if bpm <= 0
	 */
	static std::vector<double> trackBeats(const std::vector<double>& envelope, double frameRate, double bpm);

	// Merge beats and onsets, dropping points within minGap of the previously kept one
	static RhythmTimeline combineRhythmPoints(const std::vector<double>& beats,
		const std::vector<double>& onsets, double minGap = kRhythmMinGap);

	/**
	 * Split samples into count equal-length segments with mean-square energy and tempo
	 * @return count segments, or none if count <= 0 or samples is empty
	 */
	static std::vector<EnergySegment> segmentEnergy(const std::vector<float>& samples,
		int sampleRate, int count);
};

} // namespace audio
