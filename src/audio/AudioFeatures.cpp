#include "audio/AudioFeatures.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace audio {

namespace {

constexpr double kEnergyFloor = 1e-10;
// Frames either side used for the peak test and the local mean
constexpr int kPeakRadius = 3;
constexpr int kMeanRadius = 10;

double frameLogEnergy(const std::vector<float>& samples, size_t begin, size_t end) {
	double sum = 0.0;
	for (size_t i = begin; i < end; i++) {
		sum += static_cast<double>(samples[i]) * samples[i];
	}
	double meanSquare = end > begin ? sum / (end - begin) : 0.0;
	return 10.0 * std::log10(meanSquare + kEnergyFloor);
}

// Log-normal weight centred on 120 BPM, one octave wide
double tempoPrior(double bpm) {
	double octaves = std::log2(bpm / 120.0);
	return std::exp(-0.5 * octaves * octaves);
}

} // namespace

std::vector<double> AudioFeatures::onsetEnvelope(const std::vector<float>& samples,
	size_t frameSize, size_t hopSize) {

	std::vector<double> envelope;
	if (samples.empty() || frameSize == 0 || hopSize == 0) {
		return envelope;
	}

	size_t frameCount = samples.size() <= frameSize ? 1 : 1 + (samples.size() - frameSize) / hopSize;
	envelope.reserve(frameCount);

	double previous = 0.0;
	for (size_t f = 0; f < frameCount; f++) {
		size_t begin = f * hopSize;
		size_t end = std::min(begin + frameSize, samples.size());
		double current = frameLogEnergy(samples, begin, end);
		envelope.push_back(f == 0 ? 0.0 : std::max(0.0, current - previous));
		previous = current;
	}
	return envelope;
}

std::vector<double> AudioFeatures::pickOnsets(const std::vector<double>& envelope, double frameRate,
	double delta) {

	std::vector<double> onsets;
	if (envelope.empty() || frameRate <= 0.0) {
		return onsets;
	}

	double peak = *std::max_element(envelope.begin(), envelope.end());
	if (peak <= 0.0) {
		return onsets;
	}

	const int n = static_cast<int>(envelope.size());
	int lastOnset = -kPeakRadius - 1;

	for (int i = 0; i < n; i++) {
		double value = envelope[i] / peak;
		if (value <= 0.0) {
			continue;
		}

		bool isPeak = true;
		for (int j = std::max(0, i - kPeakRadius); j <= std::min(n - 1, i + kPeakRadius) && isPeak; j++) {
			// Strict on the left so a plateau yields one onset
			if ((j < i && envelope[j] >= envelope[i]) || (j > i && envelope[j] > envelope[i])) {
				isPeak = false;
			}
		}
		if (!isPeak) {
			continue;
		}

		int lo = std::max(0, i - kMeanRadius);
		int hi = std::min(n - 1, i + kMeanRadius);
		double localMean = std::accumulate(envelope.begin() + lo, envelope.begin() + hi + 1, 0.0)
			/ (hi - lo + 1) / peak;

		if (value >= localMean + delta && i - lastOnset > kPeakRadius) {
			onsets.push_back(i / frameRate);
			lastOnset = i;
		}
	}
	return onsets;
}

double AudioFeatures::estimateTempo(const std::vector<double>& envelope, double frameRate,
	double minBpm, double maxBpm) {

	if (envelope.size() < 2 || frameRate <= 0.0 || minBpm <= 0.0 || maxBpm <= minBpm) {
		return 0.0;
	}

	double mean = std::accumulate(envelope.begin(), envelope.end(), 0.0) / envelope.size();
	std::vector<double> centered(envelope.size());
	std::transform(envelope.begin(), envelope.end(), centered.begin(),
		[mean](double v) { return v - mean; });

	const size_t n = centered.size();
	size_t minLag = std::max<size_t>(1, static_cast<size_t>(std::floor(60.0 * frameRate / maxBpm)));
	size_t maxLag = static_cast<size_t>(std::ceil(60.0 * frameRate / minBpm));
	maxLag = std::min(maxLag, n - 1);
	if (minLag > maxLag) {
		return 0.0;
	}

	// Unbiased autocorrelation, one slot of padding either side for the smoothing below
	std::vector<double> ac(maxLag + 2, 0.0);
	for (size_t lag = minLag > 1 ? minLag - 1 : 1; lag <= std::min(maxLag + 1, n - 1); lag++) {
		double sum = 0.0;
		for (size_t i = 0; i + lag < n; i++) {
			sum += centered[i] * centered[i + lag];
		}
		ac[lag] = sum / (n - lag);
	}

	double bestScore = 0.0;
	size_t bestLag = 0;
	for (size_t lag = minLag; lag <= maxLag; lag++) {
		// Neighbouring lags absorb the rounding of a non-integer beat period
		double score = ac[lag - 1] + ac[lag] + ac[lag + 1];
		score *= tempoPrior(60.0 * frameRate / lag);
		if (score > bestScore) {
			bestScore = score;
			bestLag = lag;
		}
	}

	if (bestLag == 0) {
		return 0.0;
	}
	return 60.0 * frameRate / bestLag;
}

std::vector<double> AudioFeatures::trackBeats(const std::vector<double>& envelope, double frameRate, double bpm) {
	std::vector<double> beats;
	if (envelope.empty() || frameRate <= 0.0 || bpm <= 0.0) {
		return beats;
	}

	const double period = 60.0 * frameRate / bpm;
	const int n = static_cast<int>(envelope.size());

	auto gridScore = [&](double phase) {
		double score = 0.0;
		for (double pos = phase; pos < n; pos += period) {
			score += envelope[std::min(n - 1, static_cast<int>(std::lround(pos)))];
		}
		return score;
	};

	double bestPhase = 0.0;
	double bestScore = -1.0;
	for (int phase = 0; phase < static_cast<int>(std::ceil(period)) && phase < n; phase++) {
		double score = gridScore(phase);
		if (score > bestScore) {
			bestScore = score;
			bestPhase = phase;
		}
	}

	const int snapRadius = std::max(1, static_cast<int>(period / 8.0));
	int lastFrame = -1;
	for (double pos = bestPhase; pos < n; pos += period) {
		int center = static_cast<int>(std::lround(pos));
		if (center >= n) {
			break;
		}
		int best = center;
		for (int j = std::max(0, center - snapRadius); j <= std::min(n - 1, center + snapRadius); j++) {
			if (envelope[j] > envelope[best]) {
				best = j;
			}
		}
		if (best > lastFrame) {
			beats.push_back(best / frameRate);
			lastFrame = best;
		}
	}
	return beats;
}

RhythmTimeline AudioFeatures::combineRhythmPoints(const std::vector<double>& beats,
	const std::vector<double>& onsets, double minGap) {

	std::vector<double> combined;
	combined.reserve(beats.size() + onsets.size());
	combined.insert(combined.end(), beats.begin(), beats.end());
	combined.insert(combined.end(), onsets.begin(), onsets.end());
	std::sort(combined.begin(), combined.end());

	std::vector<double> filtered;
	for (double point : combined) {
		if (filtered.empty() || point - filtered.back() >= minGap) {
			filtered.push_back(point);
		}
	}
	return RhythmTimeline(std::move(filtered));
}

std::vector<EnergySegment> AudioFeatures::segmentEnergy(const std::vector<float>& samples,
	int sampleRate, int count) {

	std::vector<EnergySegment> segments;
	if (count <= 0 || samples.empty() || sampleRate <= 0) {
		return segments;
	}

	const double duration = static_cast<double>(samples.size()) / sampleRate;
	const double segmentDuration = duration / count;
	const double frameRate = static_cast<double>(sampleRate) / kHopSize;

	for (int i = 0; i < count; i++) {
		EnergySegment segment;
		segment.index = i;
		segment.startTime = i * segmentDuration;
		segment.duration = segmentDuration;

		size_t begin = std::min(samples.size(), static_cast<size_t>(segment.startTime * sampleRate));
		size_t end = i == count - 1 ? samples.size()
			: std::min(samples.size(), static_cast<size_t>((i + 1) * segmentDuration * sampleRate));

		if (end > begin) {
			double sum = 0.0;
			for (size_t s = begin; s < end; s++) {
				sum += static_cast<double>(samples[s]) * samples[s];
			}
			segment.energy = sum / (end - begin);

			std::vector<float> slice(samples.begin() + begin, samples.begin() + end);
			segment.tempo = estimateTempo(onsetEnvelope(slice), frameRate);
		}
		segments.push_back(segment);
	}
	return segments;
}

} // namespace audio
