#include "media/FFmpegMediaOperations.h"
#include "media/MediaProbe.h"
#include "utils/Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace media {

namespace {

std::string xfadeName(TransitionType type) {
	switch (type) {
	case TransitionType::Wipe:
		return "wipeleft";
	case TransitionType::Slide:
		return "slideleft";
	case TransitionType::Dissolve:
	default:
		return "dissolve";
	}
}

bool outputExists(const std::string& path) {
	std::error_code ec;
	return fs::exists(path, ec) && fs::file_size(path, ec) > 0 && !ec;
}

} // namespace

FFmpegMediaOperations::FFmpegMediaOperations(const Config& config)
	: config_(config) {
}

std::optional<MediaInfo> FFmpegMediaOperations::probe(const std::string& path) {
	try {
		return MediaProbe::probe(path);
	} catch (const std::exception& e) {
		utils::Logger::error("Probe failed: {}", e.what());
		return std::nullopt;
	}
}

bool FFmpegMediaOperations::trim(const std::string& input, const std::string& output,
	double start, double end) {

	std::error_code ec;
	if (!fs::exists(input, ec)) {
		utils::Logger::error("Input video file not found: {}", input);
		return false;
	}

	auto info = probe(input);
	if (!info) {
		return false;
	}

	if (start < 0.0 || start >= info->duration) {
		utils::Logger::error("Trim start {}s is outside {} ({}s)", start, input, info->duration);
		return false;
	}
	if (end > info->duration) {
		utils::Logger::warn("Trim end {}s exceeds clip length, clamping to {}s", end, info->duration);
		end = info->duration;
	}
	if (end <= start) {
		utils::Logger::error("Empty trim range [{}, {}] for {}", start, end, input);
		return false;
	}

	FFmpegCommand cmd = command();
	cmd.input(input)
		.arg("-ss", start)
		.arg("-t", end - start)
		.arg("-an");

	std::string filter = normalizeFilter();
	if (!filter.empty()) {
		cmd.arg("-vf", filter);
	}
	if (config_.fps > 0) {
		cmd.arg("-r", std::to_string(config_.fps));
	}
	addVideoEncoding(cmd);
	cmd.arg(output);

	auto result = cmd.run();
	if (!result.succeeded()) {
		utils::Logger::error("Failed to trim {}", input);
		return false;
	}

	auto trimmed = probe(output);
	if (!trimmed || trimmed->duration <= 0.0 || !trimmed->hasVideo()) {
		utils::Logger::error("Trimmed output {} is not a playable video", output);
		return false;
	}
	return true;
}

bool FFmpegMediaOperations::concat(const std::vector<std::string>& inputs, const std::string& output) {
	if (inputs.empty()) {
		utils::Logger::error("Nothing to concatenate");
		return false;
	}

	std::string listPath = output + ".txt";
	{
		std::ofstream list(listPath);
		if (!list) {
			utils::Logger::error("Cannot write concat list {}", listPath);
			return false;
		}
		for (const auto& input : inputs) {
			std::error_code ec;
			fs::path absolute = fs::absolute(input, ec);
			std::string entry = ec ? input : absolute.string();
			list << "file " << FFmpegCommand::quote(entry) << "\n";
		}
	}

	FFmpegCommand cmd = command();
	cmd.arg("-f", "concat")
		.arg("-safe", "0")
		.input(listPath)
		.arg("-c", "copy")
		.arg(output);

	auto result = cmd.run();

	std::error_code ec;
	fs::remove(listPath, ec);

	if (!result.succeeded() || !outputExists(output)) {
		utils::Logger::error("Failed to concatenate {} files into {}", inputs.size(), output);
		return false;
	}
	return true;
}

bool FFmpegMediaOperations::transition(const std::string& first, const std::string& second,
	const std::string& output, TransitionType type, double duration) {

	if (type == TransitionType::None) {
		return concat({first, second}, output);
	}

	std::error_code ec;
	if (!fs::exists(first, ec) || !fs::exists(second, ec)) {
		utils::Logger::error("Input video file not found: {} or {}", first, second);
		return false;
	}

	auto firstInfo = probe(first);
	if (!firstInfo || firstInfo->duration <= 0.0) {
		return false;
	}

	double firstDuration = firstInfo->duration;
	if (duration > firstDuration) {
		duration = firstDuration / 2.0;
		utils::Logger::warn("Transition duration adjusted to {}s", duration);
	}
	if (duration <= 0.0) {
		return concat({first, second}, output);
	}

	FFmpegCommand cmd = command();
	cmd.input(first)
		.input(second)
		.arg("-filter_complex", transitionFilter(type, firstDuration, duration))
		.arg("-map", "[outv]")
		.arg("-an");
	addVideoEncoding(cmd);
	cmd.arg(output);

	auto result = cmd.run();
	if (!result.succeeded() || !outputExists(output)) {
		utils::Logger::debug("{} transition between {} and {} failed",
			transitionTypeToString(type), first, second);
		return false;
	}
	return true;
}

bool FFmpegMediaOperations::muxAudio(const std::string& video, const std::string& audio,
	double durationCap, const std::string& output) {

	std::error_code ec;
	if (!fs::exists(video, ec) || !fs::exists(audio, ec)) {
		utils::Logger::error("Mux input not found: {} or {}", video, audio);
		return false;
	}

	std::ostringstream filter;
	filter << "[1:a]atrim=0:" << FFmpegCommand::formatSeconds(durationCap)
		<< ",asetpts=PTS-STARTPTS,volume=" << config_.audioVolume << "[a]";

	FFmpegCommand cmd = command();
	cmd.input(video)
		.arg("-stream_loop", "-1")
		.input(audio)
		.arg("-filter_complex", filter.str())
		.arg("-map", "0:v")
		.arg("-map", "[a]")
		.arg("-c:v", "copy")
		.arg("-c:a", config_.audioCodec)
		.arg("-shortest")
		.arg(output);

	auto result = cmd.run();
	if (!result.succeeded() || !outputExists(output)) {
		utils::Logger::error("Failed to add audio {} to {}", audio, video);
		return false;
	}
	return true;
}

std::string FFmpegMediaOperations::transitionFilter(TransitionType type, double firstDuration, double duration) {
	std::string d = FFmpegCommand::formatSeconds(duration);
	std::string offset = FFmpegCommand::formatSeconds(firstDuration - duration);
	std::ostringstream ss;

	if (type == TransitionType::Fade) {
		// Fade out, then fade in; no overlap so the total length is unchanged
		ss << "[0:v]fade=t=out:st=" << offset << ":d=" << d << "[fadeout];"
			<< "[1:v]fade=t=in:st=0:d=" << d << "[fadein];"
			<< "[fadeout][fadein]concat=n=2:v=1:a=0[outv]";
	} else {
		ss << "[0:v]settb=AVTB,setpts=PTS-STARTPTS[v0];"
			<< "[1:v]settb=AVTB,setpts=PTS-STARTPTS[v1];"
			<< "[v0][v1]xfade=transition=" << xfadeName(type)
			<< ":duration=" << d << ":offset=" << offset
			<< ",format=yuv420p[outv]";
	}
	return ss.str();
}

FFmpegCommand FFmpegMediaOperations::command() const {
	return FFmpegCommand(config_.ffmpegPath);
}

void FFmpegMediaOperations::addVideoEncoding(FFmpegCommand& cmd) const {
	cmd.arg("-c:v", config_.videoCodec)
		.arg("-preset", config_.preset)
		.arg("-crf", std::to_string(config_.crf))
		.arg("-pix_fmt", "yuv420p");
}

std::string FFmpegMediaOperations::normalizeFilter() const {
	if (config_.width <= 0 || config_.height <= 0) {
		return "";
	}
	std::ostringstream ss;
	ss << "scale=" << config_.width << ":" << config_.height
		<< ":force_original_aspect_ratio=decrease,"
		<< "pad=" << config_.width << ":" << config_.height << ":(ow-iw)/2:(oh-ih)/2,"
		<< "setsar=1";
	return ss.str();
}

} // namespace media
