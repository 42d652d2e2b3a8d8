#include "FakeMediaOperations.h"
#include <algorithm>
#include <fstream>

namespace test {

namespace {

media::MediaInfo makeInfo(double duration, int width, int height, bool withAudio) {
	media::MediaInfo info;
	info.duration = duration;
	info.size = 1024;

	media::StreamInfo video;
	video.type = media::StreamInfo::Video;
	video.codec = "h264";
	video.width = width;
	video.height = height;
	video.fps = 30.0;
	info.streams.push_back(video);

	if (withAudio) {
		media::StreamInfo audio;
		audio.type = media::StreamInfo::Audio;
		audio.codec = "aac";
		audio.channels = 2;
		audio.sampleRate = 44100;
		info.streams.push_back(audio);
	}
	return info;
}

} // namespace

void FakeMediaOperations::addSource(const std::string& path, double duration, int width, int height,
	bool withAudio) {
	infos_[path] = makeInfo(duration, width, height, withAudio);
	lineage_[path] = {path};
}

std::optional<media::MediaInfo> FakeMediaOperations::probe(const std::string& path) {
	probeCalls.push_back(path);
	auto it = infos_.find(path);
	if (it == infos_.end()) {
		return std::nullopt;
	}
	return it->second;
}

bool FakeMediaOperations::trim(const std::string& input, const std::string& output, double start, double end) {
	trimCalls.push_back({input, output, start, end});
	if (failAllTrims || failTrimFor.count(input) || !infos_.count(input)) {
		return false;
	}
	writeFile(output, {input}, end - start, false);
	return true;
}

bool FakeMediaOperations::concat(const std::vector<std::string>& inputs, const std::string& output) {
	concatCalls.push_back(inputs);
	if (failConcat) {
		return false;
	}

	std::vector<std::string> sources;
	double duration = 0.0;
	for (const auto& input : inputs) {
		auto it = infos_.find(input);
		if (it == infos_.end()) {
			return false;
		}
		duration += it->second.duration;
		auto s = sourcesOf(input);
		sources.insert(sources.end(), s.begin(), s.end());
	}
	writeFile(output, sources, duration, false);
	return true;
}

bool FakeMediaOperations::transition(const std::string& first, const std::string& second,
	const std::string& output, media::TransitionType type, double duration) {
	transitionCalls.push_back({first, second, output, type, duration});
	if (failTransitions || !infos_.count(first) || !infos_.count(second)) {
		return false;
	}

	std::vector<std::string> sources = sourcesOf(first);
	auto s = sourcesOf(second);
	sources.insert(sources.end(), s.begin(), s.end());
	writeFile(output, sources, infos_[first].duration + infos_[second].duration, false);
	return true;
}

bool FakeMediaOperations::muxAudio(const std::string& video, const std::string& /*audio*/,
	double durationCap, const std::string& output) {
	muxCalls++;
	lastMuxVideo = video;
	if (failMux || !infos_.count(video)) {
		// A failed mux may still leave a partial file behind
		std::ofstream(output) << "partial";
		return false;
	}

	double duration = muxWritesEmptyOutput ? 0.0 : std::min(infos_[video].duration, durationCap);
	writeFile(output, sourcesOf(video), duration, true);
	return true;
}

std::vector<std::string> FakeMediaOperations::sourcesOf(const std::string& path) const {
	auto it = lineage_.find(path);
	return it != lineage_.end() ? it->second : std::vector<std::string>{};
}

void FakeMediaOperations::writeFile(const std::string& path, const std::vector<std::string>& sources,
	double duration, bool withAudio) {
	std::ofstream(path) << "fake media " << duration << "\n";
	infos_[path] = makeInfo(duration, 1280, 720, withAudio);
	lineage_[path] = sources;
}

} // namespace test
