#pragma once

#include "audio/AudioAnalysis.h"
#include "audio/AudioDecoder.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace audio {

// AudioAnalysis over PCM decoded with libavcodec; each path is decoded once and cached
class FFmpegAudioAnalyzer : public AudioAnalysis {
public:
	static constexpr int kAnalysisSampleRate = 22050;

	double duration(const std::string& path) override;
	RhythmTimeline rhythmPoints(const std::string& path) override;
	std::vector<EnergySegment> energySegments(const std::string& path, int count) override;

private:
	std::shared_ptr<const PcmBuffer> load(const std::string& path);

	std::mutex cacheMutex_;
	std::map<std::string, std::shared_ptr<const PcmBuffer>> cache_;
};

} // namespace audio
