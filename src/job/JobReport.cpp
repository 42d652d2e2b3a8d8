#include "job/JobReport.h"
#include <fstream>
#include <stdexcept>

namespace job {

namespace {

nlohmann::json clipToJson(const edit::ClipDescriptor& clip) {
	return {
		{"path", clip.sourcePath},
		{"index", clip.index},
		{"duration", clip.durationSeconds},
		{"width", clip.width},
		{"height", clip.height},
		{"fps", clip.fps},
		{"hasAudio", clip.hasAudio}
	};
}

nlohmann::json placedToJson(const edit::DistributedClip& placed) {
	nlohmann::json j = {
		{"path", placed.clip.sourcePath},
		{"index", placed.clip.index},
		{"source", {{"in", placed.sourceStart}, {"out", placed.sourceEnd}}},
		{"output", {{"in", placed.outputStart}, {"out", placed.outputEnd}}}
	};
	if (placed.segment) {
		j["segment"] = {
			{"index", placed.segment->index},
			{"start", placed.segment->startTime},
			{"duration", placed.segment->duration},
			{"energy", placed.segment->energy},
			{"tempo", placed.segment->tempo}
		};
	}
	return j;
}

} // namespace

nlohmann::json JobReport::planToJson(const edit::EditPlan& plan) {
	nlohmann::json clips = nlohmann::json::array();
	for (const auto& clip : plan.getClips()) {
		clips.push_back(clipToJson(clip));
	}

	nlohmann::json placed = nlohmann::json::array();
	for (const auto& p : plan.getDistributedClips()) {
		placed.push_back(placedToJson(p));
	}

	return {
		{"strategy", plan.getStrategyName()},
		{"audio", plan.getAudioPath()},
		{"audioDuration", plan.getAudioDuration()},
		{"clips", clips},
		{"timeline", placed}
	};
}

nlohmann::json JobReport::resultToJson(const edit::ExecutionResult& result) {
	return {
		{"output", result.outputPath},
		{"duration", result.duration},
		{"size", result.size},
		{"clipsUsed", result.clipsUsed},
		{"strategy", result.strategy},
		{"transitionFallbacks", result.transitionFallbacks},
		{"droppedClips", result.droppedClips}
	};
}

nlohmann::json JobReport::toJson(const edit::EditPlan& plan, const edit::ExecutionResult* result) {
	nlohmann::json report = {{"plan", planToJson(plan)}};
	report["result"] = result ? resultToJson(*result) : nlohmann::json(nullptr);
	return report;
}

void JobReport::write(const std::string& filename, const nlohmann::json& report) {
	std::ofstream file(filename);
	if (!file.is_open()) {
		throw std::runtime_error("Failed to open report file: " + filename);
	}
	file << report.dump(2) << std::endl;
	if (!file) {
		throw std::runtime_error("Failed to write report file: " + filename);
	}
}

} // namespace job
