#pragma once

#include "edit/EditTypes.h"
#include "media/MediaInfo.h"
#include "media/MediaOperations.h"
#include <filesystem>
#include <string>
#include <vector>

namespace utils {
class ScratchDirectory;
}

namespace edit {

/**
 * Renders an EditPlan: trim every placed clip, fold the pieces into one video,
 * lay the plan's audio under it and check the result.
 *
 * Intermediate files live in a scratch directory that is removed on every exit path.
 */
class PlanExecutor {
public:
	struct Config {
		std::filesystem::path scratchRoot;  // defaults to the system temp directory
	};

	PlanExecutor(media::MediaOperations& media, const Config& config);

	/**
	 * @throws TrimFailureError if no clip could be trimmed
	 * @throws FoldFailureError if the trimmed clips could not be joined
	 * @throws AudioMuxFailureError if the audio could not be added
	 * @throws InvalidOutputError if the output has no duration or no streams
	 */
	ExecutionResult execute(const EditPlan& plan, const std::string& outputPath,
		const media::TransitionOptions& transition);

private:
	struct FoldResult {
		std::string video;
		int clipsUsed = 0;
		int fallbacks = 0;
		int dropped = 0;
	};

	std::vector<std::string> trimClips(const EditPlan& plan, utils::ScratchDirectory& scratch, int& dropped);
	FoldResult concatenate(const std::vector<std::string>& trimmed, utils::ScratchDirectory& scratch);
	FoldResult foldWithTransitions(const std::vector<std::string>& trimmed, utils::ScratchDirectory& scratch,
		const media::TransitionOptions& transition);
	void removePartialOutput(const std::string& outputPath);

	media::MediaOperations& media_;
	Config config_;
};

} // namespace edit
