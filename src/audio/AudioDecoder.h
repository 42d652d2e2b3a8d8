#pragma once

#include <string>
#include <vector>

namespace audio {

// Decoded mono PCM of a whole track
struct PcmBuffer {
	std::vector<float> samples;
	int sampleRate = 0;

	double duration() const {
		return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
	}
};

class AudioDecoder {
public:
	/**
	 * Decode the first audio stream of a file, downmixed to mono float at sampleRate
	 * @throws std::runtime_error if the file has no decodable audio stream
	 */
	static PcmBuffer decodeMono(const std::string& filename, int sampleRate);
};

} // namespace audio
