#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/frame.h>
#include <libswresample/swresample.h>
}

#include <memory>
#include <stdexcept>
#include <string>

namespace media {

// Custom deleter for AVFrame
struct AVFrameDeleter {
	void operator()(AVFrame* frame) const {
		if (frame) {
			av_frame_free(&frame);
		}
	}
};

// Custom deleter for an opened input (avformat_open_input)
struct AVFormatInputDeleter {
	void operator()(AVFormatContext* ctx) const {
		if (ctx) {
			avformat_close_input(&ctx);
		}
	}
};

struct AVCodecContextDeleter {
	void operator()(AVCodecContext* ctx) const {
		if (ctx) {
			avcodec_free_context(&ctx);
		}
	}
};

struct SwrContextDeleter {
	void operator()(SwrContext* ctx) const {
		if (ctx) {
			swr_free(&ctx);
		}
	}
};

using AVFramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;
using AVFormatInputPtr = std::unique_ptr<AVFormatContext, AVFormatInputDeleter>;
using AVCodecContextPtr = std::unique_ptr<AVCodecContext, AVCodecContextDeleter>;
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;

// Helper to create a managed AVFrame
inline AVFramePtr makeAVFrame() {
	AVFrame* frame = av_frame_alloc();
	if (!frame) {
		throw std::runtime_error("Failed to allocate AVFrame");
	}
	return AVFramePtr(frame);
}

inline std::string avErrorToString(int errnum) {
	char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
	av_strerror(errnum, errbuf, sizeof(errbuf));
	return std::string(errbuf);
}

// Opens a media file and reads its stream info; throws std::runtime_error on failure
inline AVFormatInputPtr openInput(const std::string& filename) {
	AVFormatContext* formatCtx = nullptr;
	int ret = avformat_open_input(&formatCtx, filename.c_str(), nullptr, nullptr);
	if (ret < 0) {
		throw std::runtime_error("Failed to open input file " + filename + ": " + avErrorToString(ret));
	}
	AVFormatInputPtr input(formatCtx);

	ret = avformat_find_stream_info(input.get(), nullptr);
	if (ret < 0) {
		throw std::runtime_error("Failed to find stream info for " + filename + ": " + avErrorToString(ret));
	}
	return input;
}

} // namespace media
