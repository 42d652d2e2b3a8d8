#include "edit/ClipAnalyzer.h"
#include "utils/Logger.h"

namespace edit {

std::vector<ClipDescriptor> ClipAnalyzer::analyze(const std::vector<std::string>& clipPaths) {
	std::vector<ClipDescriptor> descriptors;
	descriptors.reserve(clipPaths.size());

	for (size_t i = 0; i < clipPaths.size(); i++) {
		const std::string& path = clipPaths[i];

		auto info = media_.probe(path);
		if (!info) {
			utils::Logger::warn("Skipping clip {}: cannot be probed", path);
			continue;
		}
		if (info->duration <= 0.0) {
			utils::Logger::warn("Skipping clip {}: duration {}s", path, info->duration);
			continue;
		}

		ClipDescriptor descriptor;
		descriptor.sourcePath = path;
		descriptor.index = static_cast<int>(i);
		descriptor.durationSeconds = info->duration;
		descriptor.hasAudio = info->hasAudio();
		if (const media::StreamInfo* video = info->firstVideoStream()) {
			descriptor.width = video->width;
			descriptor.height = video->height;
			descriptor.fps = video->fps;
		}

		utils::Logger::debug("Clip {}: {}s {}x{} @ {} fps", path, descriptor.durationSeconds,
			descriptor.width, descriptor.height, descriptor.fps);
		descriptors.push_back(descriptor);
	}

	utils::Logger::info("Analyzed {} of {} clips", descriptors.size(), clipPaths.size());
	return descriptors;
}

} // namespace edit
