#include "audio/FFmpegAudioAnalyzer.h"
#include "audio/AudioFeatures.h"
#include "utils/Logger.h"
#include "utils/Timer.h"

namespace audio {

double FFmpegAudioAnalyzer::duration(const std::string& path) {
	return load(path)->duration();
}

RhythmTimeline FFmpegAudioAnalyzer::rhythmPoints(const std::string& path) {
	auto pcm = load(path);
	TIME_BLOCK("rhythm_analysis");

	const double frameRate = static_cast<double>(pcm->sampleRate) / AudioFeatures::kHopSize;
	std::vector<double> envelope = AudioFeatures::onsetEnvelope(pcm->samples);

	double tempo = AudioFeatures::estimateTempo(envelope, frameRate);
	std::vector<double> beats = AudioFeatures::trackBeats(envelope, frameRate, tempo);
	std::vector<double> onsets = AudioFeatures::pickOnsets(envelope, frameRate);

	RhythmTimeline timeline = AudioFeatures::combineRhythmPoints(beats, onsets);
	utils::Logger::info("Combined {} beats ({} BPM) and {} onsets into {} rhythm points",
		beats.size(), tempo, onsets.size(), timeline.size());
	return timeline;
}

std::vector<EnergySegment> FFmpegAudioAnalyzer::energySegments(const std::string& path, int count) {
	auto pcm = load(path);
	TIME_BLOCK("energy_analysis");

	std::vector<EnergySegment> segments = AudioFeatures::segmentEnergy(pcm->samples, pcm->sampleRate, count);
	utils::Logger::info("Analyzed music into {} segments", segments.size());
	return segments;
}

std::shared_ptr<const PcmBuffer> FFmpegAudioAnalyzer::load(const std::string& path) {
	{
		std::lock_guard<std::mutex> lock(cacheMutex_);
		auto it = cache_.find(path);
		if (it != cache_.end()) {
			return it->second;
		}
	}

	// Decode outside the lock; a concurrent decode of the same path only wastes work
	auto pcm = std::make_shared<const PcmBuffer>(AudioDecoder::decodeMono(path, kAnalysisSampleRate));

	std::lock_guard<std::mutex> lock(cacheMutex_);
	auto inserted = cache_.emplace(path, pcm);
	return inserted.first->second;
}

} // namespace audio
