#include "edit/PlanExecutor.h"
#include "utils/Logger.h"
#include "utils/ScratchDirectory.h"
#include "utils/Timer.h"
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace edit {

PlanExecutor::PlanExecutor(media::MediaOperations& media, const Config& config)
	: media_(media)
	, config_(config) {
	if (config_.scratchRoot.empty()) {
		config_.scratchRoot = fs::temp_directory_path();
	}
}

ExecutionResult PlanExecutor::execute(const EditPlan& plan, const std::string& outputPath,
	const media::TransitionOptions& transition) {

	TIME_BLOCK("execution");
	utils::ScratchDirectory scratch(config_.scratchRoot, "beatcut", outputPath);

	int droppedInTrim = 0;
	std::vector<std::string> trimmed;
	{
		TIME_BLOCK("trim");
		trimmed = trimClips(plan, scratch, droppedInTrim);
	}
	if (trimmed.empty()) {
		throw TrimFailureError("None of the " + std::to_string(plan.getDistributedClips().size()) +
			" planned clips could be trimmed");
	}

	FoldResult folded;
	{
		TIME_BLOCK("fold");
		bool useTransition = transition.type != media::TransitionType::None && transition.duration > 0.0;
		folded = useTransition ? foldWithTransitions(trimmed, scratch, transition)
			: concatenate(trimmed, scratch);
	}

	{
		TIME_BLOCK("mux");
		if (!media_.muxAudio(folded.video, plan.getAudioPath(), plan.getAudioDuration(), outputPath)) {
			removePartialOutput(outputPath);
			throw AudioMuxFailureError("Failed to add audio " + plan.getAudioPath() + " to the edited video");
		}
	}

	std::optional<media::MediaInfo> info;
	{
		TIME_BLOCK("validation");
		info = media_.probe(outputPath);
	}
	if (!info || info->duration <= 0.0 || info->streams.empty()) {
		removePartialOutput(outputPath);
		throw InvalidOutputError("Output " + outputPath + " is empty or unreadable");
	}

	ExecutionResult result;
	result.outputPath = outputPath;
	result.duration = info->duration;
	result.size = info->size;
	result.clipsUsed = folded.clipsUsed;
	result.strategy = plan.getStrategyName();
	result.transitionFallbacks = folded.fallbacks;
	result.droppedClips = droppedInTrim + folded.dropped;

	utils::Logger::info("Created {} ({}s, {} bytes) from {} clips", outputPath,
		result.duration, result.size, result.clipsUsed);
	return result;
}

std::vector<std::string> PlanExecutor::trimClips(const EditPlan& plan, utils::ScratchDirectory& scratch,
	int& dropped) {

	const auto& placed = plan.getDistributedClips();
	std::vector<std::string> trimmed;
	trimmed.reserve(placed.size());

	for (size_t i = 0; i < placed.size(); i++) {
		const DistributedClip& clip = placed[i];
		std::string path = scratch.newFile("clip_" + std::to_string(i) + ".mp4");

		if (media_.trim(clip.clip.sourcePath, path, clip.sourceStart, clip.sourceEnd)) {
			trimmed.push_back(path);
		} else {
			utils::Logger::warn("Dropping clip {} [{} - {}]: trim failed",
				clip.clip.sourcePath, clip.sourceStart, clip.sourceEnd);
			dropped++;
		}
	}

	utils::Logger::info("Trimmed {} of {} clips", trimmed.size(), placed.size());
	return trimmed;
}

PlanExecutor::FoldResult PlanExecutor::concatenate(const std::vector<std::string>& trimmed,
	utils::ScratchDirectory& scratch) {

	FoldResult result;
	result.clipsUsed = static_cast<int>(trimmed.size());

	if (trimmed.size() == 1) {
		result.video = trimmed.front();
		return result;
	}

	result.video = scratch.newFile("concat.mp4");
	if (!media_.concat(trimmed, result.video)) {
		throw FoldFailureError("Failed to concatenate " + std::to_string(trimmed.size()) + " clips");
	}
	return result;
}

PlanExecutor::FoldResult PlanExecutor::foldWithTransitions(const std::vector<std::string>& trimmed,
	utils::ScratchDirectory& scratch, const media::TransitionOptions& transition) {

	FoldResult result;
	result.video = trimmed.front();
	result.clipsUsed = 1;

	const std::string transitionName = media::transitionTypeToString(transition.type);

	for (size_t cursor = 1; cursor < trimmed.size(); cursor++) {
		const std::string& next = trimmed[cursor];
		std::string merged = scratch.newFile("merged_" + std::to_string(cursor) + ".mp4");

		if (media_.transition(result.video, next, merged, transition.type, transition.duration)) {
			result.video = merged;
			result.clipsUsed++;
			continue;
		}

		utils::Logger::warn("{} transition into clip {} failed, falling back to a plain cut",
			transitionName, cursor);
		result.fallbacks++;

		if (media_.concat({result.video, next}, merged)) {
			result.video = merged;
			result.clipsUsed++;
		} else {
			utils::Logger::warn("Dropping clip {}: could not be joined", cursor);
			result.dropped++;
		}
	}

	return result;
}

void PlanExecutor::removePartialOutput(const std::string& outputPath) {
	std::error_code ec;
	if (fs::remove(outputPath, ec)) {
		utils::Logger::debug("Removed partial output {}", outputPath);
	} else if (ec) {
		utils::Logger::warn("Failed to remove partial output {}: {}", outputPath, ec.message());
	}
}

} // namespace edit
