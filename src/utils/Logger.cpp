#include "utils/Logger.h"
#include <algorithm>
#include <cctype>

namespace utils {

std::atomic<Logger::Level> Logger::currentLevel{Logger::INFO};
std::mutex Logger::outputMutex;

Logger::Level Logger::levelFromString(const std::string& name, Level fallback) {
	std::string lower = name;
	std::transform(lower.begin(), lower.end(), lower.begin(),
		[](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (lower == "error") {
		return ERROR;
	} else if (lower == "warn" || lower == "warning") {
		return WARN;
	} else if (lower == "info") {
		return INFO;
	} else if (lower == "debug") {
		return DEBUG;
	}
	return fallback;
}

} // namespace utils
