#pragma once

#include "audio/AudioTypes.h"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace edit {

// Probed facts about one input clip
struct ClipDescriptor {
	std::string sourcePath;
	int index = 0;            // position in the input list
	double durationSeconds = 0.0;
	int width = 0;            // first video stream, 0 if absent
	int height = 0;
	double fps = 0.0;
	bool hasAudio = false;
};

// A clip interval placed on the output timeline.
// sourceEnd - sourceStart always equals outputEnd - outputStart.
struct DistributedClip {
	ClipDescriptor clip;
	double sourceStart = 0.0;
	double sourceEnd = 0.0;
	double outputStart = 0.0;
	double outputEnd = 0.0;
	std::optional<audio::EnergySegment> segment;  // energy strategy only

	double duration() const { return outputEnd - outputStart; }
};

enum class Strategy {
	Rhythm,
	Energy,
	Even
};

// "rhythm", "energy", "even"; anything else resolves to Even
Strategy strategyFromString(const std::string& name);
std::string strategyToString(Strategy strategy);
bool isKnownStrategyName(const std::string& name);

// Immutable result of planning, consumed by one execution
class EditPlan {
public:
	EditPlan(std::vector<ClipDescriptor> clips, std::string audioPath, double audioDuration,
		Strategy strategy, std::vector<DistributedClip> distributedClips)
		: clips_(std::move(clips))
		, audioPath_(std::move(audioPath))
		, audioDuration_(audioDuration)
		, strategy_(strategy)
		, distributedClips_(std::move(distributedClips)) {}

	const std::vector<ClipDescriptor>& getClips() const { return clips_; }
	const std::string& getAudioPath() const { return audioPath_; }
	double getAudioDuration() const { return audioDuration_; }
	Strategy getStrategy() const { return strategy_; }
	std::string getStrategyName() const { return strategyToString(strategy_); }
	const std::vector<DistributedClip>& getDistributedClips() const { return distributedClips_; }

private:
	std::vector<ClipDescriptor> clips_;
	std::string audioPath_;
	double audioDuration_;
	Strategy strategy_;
	std::vector<DistributedClip> distributedClips_;
};

struct ExecutionResult {
	std::string outputPath;
	double duration = 0.0;       // seconds, as probed
	int64_t size = 0;            // bytes
	int clipsUsed = 0;
	std::string strategy;
	int transitionFallbacks = 0;
	int droppedClips = 0;        // lost to trim or fold failures
};

// Fatal pipeline failure, tagged with the stage it happened in
class EditException : public std::runtime_error {
public:
	EditException(const std::string& stage, const std::string& message)
		: std::runtime_error(message), stage_(stage) {}

	const std::string& stage() const { return stage_; }

private:
	std::string stage_;
};

class NoValidClipsError : public EditException {
public:
	explicit NoValidClipsError(const std::string& message)
		: EditException("analysis", message) {}
};

class TrimFailureError : public EditException {
public:
	explicit TrimFailureError(const std::string& message)
		: EditException("trim", message) {}
};

class FoldFailureError : public EditException {
public:
	explicit FoldFailureError(const std::string& message)
		: EditException("fold", message) {}
};

class AudioMuxFailureError : public EditException {
public:
	explicit AudioMuxFailureError(const std::string& message)
		: EditException("mux", message) {}
};

class InvalidOutputError : public EditException {
public:
	explicit InvalidOutputError(const std::string& message)
		: EditException("validation", message) {}
};

} // namespace edit
