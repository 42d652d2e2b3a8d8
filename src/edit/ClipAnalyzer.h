#pragma once

#include "edit/EditTypes.h"
#include "media/MediaOperations.h"
#include <string>
#include <vector>

namespace edit {

class ClipAnalyzer {
public:
	explicit ClipAnalyzer(media::MediaOperations& media) : media_(media) {}

	/**
	 * Probe each clip in order. Clips that cannot be probed or have no positive
	 * duration are logged and left out; the result may be empty.
	 */
	std::vector<ClipDescriptor> analyze(const std::vector<std::string>& clipPaths);

private:
	media::MediaOperations& media_;
};

} // namespace edit
