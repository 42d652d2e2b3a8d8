#include "audio/AudioDecoder.h"
#include "media/FFmpegCompat.h"
#include "media/MediaTypes.h"
#include "utils/Logger.h"
#include "utils/Timer.h"
#include <stdexcept>

namespace audio {

namespace {

class PacketGuard {
public:
	PacketGuard() : packet_(media::FFmpegCompat::allocPacket()) {
		if (!packet_) {
			throw std::runtime_error("Failed to allocate packet");
		}
	}
	~PacketGuard() { media::FFmpegCompat::freePacket(&packet_); }

	PacketGuard(const PacketGuard&) = delete;
	PacketGuard& operator=(const PacketGuard&) = delete;

	AVPacket* get() const { return packet_; }

private:
	AVPacket* packet_;
};

// Appends resampled output to samples; a null frame drains the resampler
bool resampleInto(SwrContext* swrCtx, const AVFrame* frame, std::vector<float>& samples) {
	int inSamples = frame ? frame->nb_samples : 0;
	int capacity = swr_get_out_samples(swrCtx, inSamples);
	if (capacity <= 0) {
		return true;
	}

	size_t offset = samples.size();
	samples.resize(offset + capacity);
	uint8_t* out = reinterpret_cast<uint8_t*>(samples.data() + offset);
	const uint8_t** in = frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr;

	int converted = swr_convert(swrCtx, &out, capacity, in, inSamples);
	if (converted < 0) {
		samples.resize(offset);
		return false;
	}
	samples.resize(offset + converted);
	return true;
}

} // namespace

PcmBuffer AudioDecoder::decodeMono(const std::string& filename, int sampleRate) {
	TIME_BLOCK("audio_decode");

	media::AVFormatInputPtr formatCtx = media::openInput(filename);

	int streamIndex = av_find_best_stream(formatCtx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
	if (streamIndex < 0) {
		throw std::runtime_error("No audio stream found in " + filename);
	}
	AVStream* stream = formatCtx->streams[streamIndex];

	const AVCodec* codec = avcodec_find_decoder(media::FFmpegCompat::streamCodecId(stream));
	if (!codec) {
		throw std::runtime_error("No decoder for audio stream in " + filename);
	}

	media::AVCodecContextPtr codecCtx(avcodec_alloc_context3(codec));
	if (!codecCtx) {
		throw std::runtime_error("Failed to allocate audio codec context");
	}
	if (media::FFmpegCompat::copyCodecParameters(codecCtx.get(), stream) < 0) {
		throw std::runtime_error("Failed to copy audio codec parameters");
	}
	int ret = avcodec_open2(codecCtx.get(), codec, nullptr);
	if (ret < 0) {
		throw std::runtime_error("Failed to open audio decoder: " + media::avErrorToString(ret));
	}

	media::SwrContextPtr swrCtx(media::FFmpegCompat::createMonoFloatResampler(codecCtx.get(), sampleRate));
	if (!swrCtx) {
		throw std::runtime_error("Failed to create audio resampler for " + filename);
	}

	PcmBuffer pcm;
	pcm.sampleRate = sampleRate;

	bool resampleFailed = false;
	auto onFrame = [&](AVFrame* frame) {
		if (!resampleInto(swrCtx.get(), frame, pcm.samples)) {
			resampleFailed = true;
		}
	};

	media::AVFramePtr frame = media::makeAVFrame();
	PacketGuard packet;
	int decodeErrors = 0;

	while (av_read_frame(formatCtx.get(), packet.get()) >= 0) {
		if (packet.get()->stream_index == streamIndex) {
			if (!media::FFmpegCompat::decodeAudioPacket(codecCtx.get(), frame.get(), packet.get(), onFrame)) {
				decodeErrors++;
			}
		}
		av_packet_unref(packet.get());
	}

	// Flush decoder, then resampler
	if (!media::FFmpegCompat::decodeAudioPacket(codecCtx.get(), frame.get(), nullptr, onFrame)) {
		decodeErrors++;
	}
	if (!resampleInto(swrCtx.get(), nullptr, pcm.samples)) {
		resampleFailed = true;
	}

	if (resampleFailed) {
		throw std::runtime_error("Audio resampling failed for " + filename);
	}
	if (decodeErrors > 0) {
		utils::Logger::warn("{} audio packets of {} could not be decoded", decodeErrors, filename);
	}
	if (pcm.samples.empty()) {
		throw std::runtime_error("No audio samples decoded from " + filename);
	}

	utils::Logger::debug("Decoded {}: {} samples at {} Hz ({}s)",
		filename, pcm.samples.size(), sampleRate, pcm.duration());
	return pcm;
}

} // namespace audio
