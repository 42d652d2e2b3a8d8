#include "media/MediaInfo.h"
#include <algorithm>
#include <cctype>

namespace media {

namespace {

std::string toLower(const std::string& str) {
	std::string lower = str;
	std::transform(lower.begin(), lower.end(), lower.begin(),
		[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return lower;
}

} // namespace

std::string transitionTypeToString(TransitionType type) {
	switch (type) {
	case TransitionType::None: return "none";
	case TransitionType::Fade: return "fade";
	case TransitionType::Dissolve: return "dissolve";
	case TransitionType::Wipe: return "wipe";
	case TransitionType::Slide: return "slide";
	default: return "unknown";
	}
}

TransitionType stringToTransitionType(const std::string& name) {
	std::string lower = toLower(name);

	if (lower.empty() || lower == "none") return TransitionType::None;
	if (lower == "fade") return TransitionType::Fade;
	if (lower == "dissolve") return TransitionType::Dissolve;
	if (lower == "wipe") return TransitionType::Wipe;
	if (lower == "slide") return TransitionType::Slide;

	return TransitionType::Fade;
}

bool isKnownTransitionName(const std::string& name) {
	std::string lower = toLower(name);
	return lower == "none" || lower == "fade" || lower == "dissolve" ||
		lower == "wipe" || lower == "slide";
}

} // namespace media
