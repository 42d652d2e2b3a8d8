#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libswresample/swresample.h>
}

#include <functional>

namespace media {

// Key version thresholds for API changes (only define if not already set by CMake)
#ifndef HAVE_SEND_RECEIVE_API
#define HAVE_SEND_RECEIVE_API (LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(57, 37, 100))
#endif
#ifndef HAVE_PACKET_ALLOC_API
#define HAVE_PACKET_ALLOC_API (LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(57, 89, 100))
#endif
#ifndef HAVE_CODECPAR_API
#define HAVE_CODECPAR_API (LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(57, 37, 100))
#endif
#ifndef HAVE_CH_LAYOUT_API
// AVChannelLayout and swr_alloc_set_opts2 arrived with FFmpeg 5.1
#define HAVE_CH_LAYOUT_API (LIBAVUTIL_VERSION_INT >= AV_VERSION_INT(57, 28, 100))
#endif

/**
 * Compatibility wrappers for the libav* calls used by probing and audio analysis
 */
class FFmpegCompat {
public:
	/**
	 * Decode one audio packet, invoking onFrame for every frame it yields
	 * @param codecCtx The codec context
	 * @param frame Scratch frame the decoder writes into
	 * @param packet The packet to decode (nullptr flushes the decoder)
	 * @param onFrame Called with each decoded frame
	 * @return false on a decoder error, true otherwise (including "needs more data")
	 */
	static bool decodeAudioPacket(AVCodecContext* codecCtx, AVFrame* frame, AVPacket* packet,
		const std::function<void(AVFrame*)>& onFrame);

	/**
	 * Allocate a new packet with compatibility for different FFmpeg versions
	 * @return New allocated packet, or nullptr on failure
	 */
	static AVPacket* allocPacket();

	/**
	 * Free a packet allocated with allocPacket
	 * @param packet Packet to free (can be nullptr)
	 */
	static void freePacket(AVPacket** packet);

	/**
	 * Copy codec parameters to codec context with version compatibility
	 * @return 0 on success, negative on error
	 */
	static int copyCodecParameters(AVCodecContext* codecCtx, AVStream* stream);

	/**
	 * Media type / codec id / geometry of a stream, independent of codecpar availability
	 */
	static AVMediaType streamType(const AVStream* stream);
	static AVCodecID streamCodecId(const AVStream* stream);
	static int streamWidth(const AVStream* stream);
	static int streamHeight(const AVStream* stream);
	static int streamChannels(const AVStream* stream);
	static int streamSampleRate(const AVStream* stream);

	/**
	 * Create a resampler converting the decoder output to mono float samples
	 * @return Initialized context, or nullptr on failure
	 */
	static SwrContext* createMonoFloatResampler(AVCodecContext* codecCtx, int outSampleRate);
};

} // namespace media
