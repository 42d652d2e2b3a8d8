#include "media/MediaProbe.h"
#include "media/FFmpegCompat.h"
#include "media/MediaTypes.h"
#include "utils/Logger.h"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace media {

MediaInfo MediaProbe::probe(const std::string& filename) {
	AVFormatInputPtr formatCtx = openInput(filename);

	MediaInfo info;
	if (formatCtx->duration != AV_NOPTS_VALUE && formatCtx->duration > 0) {
		info.duration = static_cast<double>(formatCtx->duration) / AV_TIME_BASE;
	}
	info.bitRate = formatCtx->bit_rate;

	std::error_code ec;
	auto fileSize = std::filesystem::file_size(filename, ec);
	info.size = ec ? 0 : static_cast<int64_t>(fileSize);

	double longestStream = 0.0;
	for (unsigned int i = 0; i < formatCtx->nb_streams; i++) {
		AVStream* stream = formatCtx->streams[i];
		const AVCodecDescriptor* descriptor = avcodec_descriptor_get(FFmpegCompat::streamCodecId(stream));

		StreamInfo streamInfo;
		streamInfo.codec = descriptor ? descriptor->name : "unknown";

		switch (FFmpegCompat::streamType(stream)) {
		case AVMEDIA_TYPE_VIDEO: {
			// Cover art shows up as a single-picture video stream
			if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) {
				continue;
			}
			streamInfo.type = StreamInfo::Video;
			streamInfo.width = FFmpegCompat::streamWidth(stream);
			streamInfo.height = FFmpegCompat::streamHeight(stream);
			AVRational frameRate = av_guess_frame_rate(formatCtx.get(), stream, nullptr);
			if (frameRate.num > 0 && frameRate.den > 0) {
				streamInfo.fps = av_q2d(frameRate);
			}
			break;
		}
		case AVMEDIA_TYPE_AUDIO:
			streamInfo.type = StreamInfo::Audio;
			streamInfo.channels = FFmpegCompat::streamChannels(stream);
			streamInfo.sampleRate = FFmpegCompat::streamSampleRate(stream);
			break;
		default:
			streamInfo.type = StreamInfo::Other;
			break;
		}

		if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
			longestStream = std::max(longestStream, stream->duration * av_q2d(stream->time_base));
		}

		info.streams.push_back(streamInfo);
	}

	// Some containers (raw streams, fragmented mp4) leave the format duration unset
	if (info.duration <= 0.0) {
		info.duration = longestStream;
	}

	utils::Logger::debug("Probed {}: {}s, {} streams, {} bytes",
		filename, info.duration, info.streams.size(), info.size);

	return info;
}

} // namespace media
