#include "media/FFmpegCompat.h"
#include "utils/Logger.h"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
}

namespace media {

bool FFmpegCompat::decodeAudioPacket(AVCodecContext* codecCtx, AVFrame* frame, AVPacket* packet,
	const std::function<void(AVFrame*)>& onFrame) {
#if HAVE_SEND_RECEIVE_API
	int ret = avcodec_send_packet(codecCtx, packet);
	if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
		utils::Logger::error("Error sending packet to audio decoder");
		return false;
	}

	// One packet may carry several frames, drain them all
	while (true) {
		ret = avcodec_receive_frame(codecCtx, frame);
		if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
			return true;
		} else if (ret < 0) {
			utils::Logger::error("Error receiving frame from audio decoder");
			return false;
		}
		onFrame(frame);
		av_frame_unref(frame);
	}
#else
	if (!packet) {
		AVPacket flushPacket;
		av_init_packet(&flushPacket);
		flushPacket.data = nullptr;
		flushPacket.size = 0;

		int gotFrame = 1;
		while (gotFrame) {
			gotFrame = 0;
			if (avcodec_decode_audio4(codecCtx, frame, &gotFrame, &flushPacket) < 0) {
				utils::Logger::debug("Audio decode failed at end of stream");
				return true;
			}
			if (gotFrame) {
				onFrame(frame);
				av_frame_unref(frame);
			}
		}
		return true;
	}

	while (packet->size > 0) {
		int gotFrame = 0;
		int used = avcodec_decode_audio4(codecCtx, frame, &gotFrame, packet);
		if (used < 0) {
			utils::Logger::error("Audio decode failed");
			return false;
		}
		if (gotFrame) {
			onFrame(frame);
			av_frame_unref(frame);
		}
		packet->data += used;
		packet->size -= used;
	}
	return true;
#endif
}

AVPacket* FFmpegCompat::allocPacket() {
#if HAVE_PACKET_ALLOC_API
	return av_packet_alloc();
#else
	AVPacket* packet = new AVPacket();
	av_init_packet(packet);
	packet->data = nullptr;
	packet->size = 0;
	return packet;
#endif
}

void FFmpegCompat::freePacket(AVPacket** packet) {
	if (!packet || !*packet) {
		return;
	}

#if HAVE_PACKET_ALLOC_API
	av_packet_free(packet);
#else
	av_free_packet(*packet);
	delete *packet;
	*packet = nullptr;
#endif
}

int FFmpegCompat::copyCodecParameters(AVCodecContext* codecCtx, AVStream* stream) {
#if HAVE_CODECPAR_API
	return avcodec_parameters_to_context(codecCtx, stream->codecpar);
#else
	return avcodec_copy_context(codecCtx, stream->codec);
#endif
}

AVMediaType FFmpegCompat::streamType(const AVStream* stream) {
#if HAVE_CODECPAR_API
	return stream->codecpar->codec_type;
#else
	return stream->codec->codec_type;
#endif
}

AVCodecID FFmpegCompat::streamCodecId(const AVStream* stream) {
#if HAVE_CODECPAR_API
	return stream->codecpar->codec_id;
#else
	return stream->codec->codec_id;
#endif
}

int FFmpegCompat::streamWidth(const AVStream* stream) {
#if HAVE_CODECPAR_API
	return stream->codecpar->width;
#else
	return stream->codec->width;
#endif
}

int FFmpegCompat::streamHeight(const AVStream* stream) {
#if HAVE_CODECPAR_API
	return stream->codecpar->height;
#else
	return stream->codec->height;
#endif
}

int FFmpegCompat::streamChannels(const AVStream* stream) {
#if HAVE_CH_LAYOUT_API
	return stream->codecpar->ch_layout.nb_channels;
#elif HAVE_CODECPAR_API
	return stream->codecpar->channels;
#else
	return stream->codec->channels;
#endif
}

int FFmpegCompat::streamSampleRate(const AVStream* stream) {
#if HAVE_CODECPAR_API
	return stream->codecpar->sample_rate;
#else
	return stream->codec->sample_rate;
#endif
}

SwrContext* FFmpegCompat::createMonoFloatResampler(AVCodecContext* codecCtx, int outSampleRate) {
	SwrContext* swrCtx = nullptr;

#if HAVE_CH_LAYOUT_API
	AVChannelLayout outLayout{};
	av_channel_layout_default(&outLayout, 1);

	AVChannelLayout inLayout{};
	if (codecCtx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
		av_channel_layout_default(&inLayout, codecCtx->ch_layout.nb_channels);
	} else if (av_channel_layout_copy(&inLayout, &codecCtx->ch_layout) < 0) {
		av_channel_layout_uninit(&outLayout);
		return nullptr;
	}

	int ret = swr_alloc_set_opts2(&swrCtx,
		&outLayout, AV_SAMPLE_FMT_FLT, outSampleRate,
		&inLayout, codecCtx->sample_fmt, codecCtx->sample_rate,
		0, nullptr);

	av_channel_layout_uninit(&inLayout);
	av_channel_layout_uninit(&outLayout);

	if (ret < 0) {
		swr_free(&swrCtx);
		return nullptr;
	}
#else
	int64_t inLayout = codecCtx->channel_layout;
	if (inLayout == 0) {
		inLayout = av_get_default_channel_layout(codecCtx->channels);
	}

	swrCtx = swr_alloc_set_opts(nullptr,
		AV_CH_LAYOUT_MONO, AV_SAMPLE_FMT_FLT, outSampleRate,
		inLayout, codecCtx->sample_fmt, codecCtx->sample_rate,
		0, nullptr);
	if (!swrCtx) {
		return nullptr;
	}
#endif

	if (swr_init(swrCtx) < 0) {
		swr_free(&swrCtx);
		return nullptr;
	}
	return swrCtx;
}

} // namespace media
