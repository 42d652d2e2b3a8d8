#include "edit/EditTypes.h"
#include <algorithm>
#include <cctype>

namespace edit {

namespace {

std::string toLower(const std::string& str) {
	std::string lower = str;
	std::transform(lower.begin(), lower.end(), lower.begin(),
		[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return lower;
}

} // namespace

Strategy strategyFromString(const std::string& name) {
	std::string lower = toLower(name);

	if (lower == "rhythm") return Strategy::Rhythm;
	if (lower == "energy") return Strategy::Energy;

	return Strategy::Even;
}

std::string strategyToString(Strategy strategy) {
	switch (strategy) {
	case Strategy::Rhythm: return "rhythm";
	case Strategy::Energy: return "energy";
	case Strategy::Even: return "even";
	default: return "unknown";
	}
}

bool isKnownStrategyName(const std::string& name) {
	std::string lower = toLower(name);
	return lower == "rhythm" || lower == "energy" || lower == "even";
}

} // namespace edit
