#include "job/JobParser.h"
#include "edit/EditTypes.h"
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace job {

// ============================================================================
// Public interface
// ============================================================================

Job JobParser::parse(const std::string& filename) {
	std::ifstream file(filename);
	if (!file.is_open()) {
		throw std::runtime_error("Failed to open job file: " + filename);
	}

	nlohmann::json j;
	try {
		file >> j;
	} catch (const nlohmann::json::parse_error& e) {
		throw std::runtime_error("Failed to parse job JSON: " + std::string(e.what()));
	}

	return parseJSON(j, fs::path(filename).parent_path());
}

Job JobParser::parseJSON(const nlohmann::json& j, const fs::path& baseDir) {
	if (!j.is_object()) {
		throw InvalidJobException("top level must be an object");
	}

	ensureOnlyKeys(j, "job", {"clips", "audio", "strategy", "minClipDuration", "targetDuration", "transition",
		"segmentCount", "seed", "scratchDir", "video"});

	Job job;

	nlohmann::json clips = getArray(j, "job", "clips");
	for (const auto& clip : clips) {
		if (!clip.is_string()) {
			throw InvalidJobException("clips must contain only strings");
		}
		job.clips.push_back(resolvePath(clip.get<std::string>(), baseDir));
	}

	job.audio = resolvePath(getString(j, "job", "audio"), baseDir);

	if (hasNonNullKey(j, "strategy")) {
		job.strategy = getString(j, "job", "strategy");
		if (!edit::isKnownStrategyName(job.strategy)) {
			throw InvalidJobException("strategy must be one of rhythm, energy, even: " + job.strategy);
		}
	}

	if (hasNonNullKey(j, "minClipDuration")) {
		job.minClipDuration = getDouble(j, "job", "minClipDuration");
	}

	if (hasNonNullKey(j, "targetDuration")) {
		job.targetDuration = getDouble(j, "job", "targetDuration");
	}

	// An explicit null means cuts without transitions
	if (j.contains("transition")) {
		job.transition = j["transition"].is_null()
			? media::TransitionOptions{media::TransitionType::None, 0.0}
			: parseTransition(j["transition"]);
	}

	if (hasNonNullKey(j, "segmentCount")) {
		job.segmentCount = getPositiveInteger(j, "job", "segmentCount");
	}

	if (hasNonNullKey(j, "seed")) {
		const nlohmann::json& seed = j["seed"];
		bool inRange = seed.is_number_unsigned()
			? seed.get<uint64_t>() <= std::numeric_limits<uint32_t>::max()
			: seed.is_number_integer() && seed.get<int64_t>() >= 0 &&
				seed.get<int64_t>() <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max());
		if (!inRange) {
			throw InvalidJobException("seed must be an integer between 0 and " +
				std::to_string(std::numeric_limits<uint32_t>::max()));
		}
		job.seed = static_cast<uint32_t>(seed.get<uint64_t>());
	}

	if (hasNonNullKey(j, "scratchDir")) {
		job.scratchDir = getString(j, "job", "scratchDir");
	}

	if (hasNonNullKey(j, "video")) {
		job.video = parseVideoFormat(j["video"]);
	}

	validate(job);
	return job;
}

void JobParser::validate(const Job& job) {
	if (job.clips.empty()) {
		throw InvalidJobException("clips must not be empty");
	}
	if (job.audio.empty()) {
		throw InvalidJobException("audio must not be empty");
	}
	if (job.minClipDuration < Job::kMinClipDurationLow || job.minClipDuration > Job::kMinClipDurationHigh) {
		throw InvalidJobException("minClipDuration must be between " + std::to_string(Job::kMinClipDurationLow) +
			" and " + std::to_string(Job::kMinClipDurationHigh) + ": " + std::to_string(job.minClipDuration));
	}
	if (job.targetDuration && *job.targetDuration <= 0.0) {
		throw InvalidJobException("targetDuration must be positive: " + std::to_string(*job.targetDuration));
	}
	if (job.transition.duration < 0.0 || job.transition.duration > Job::kMaxTransitionDuration) {
		throw InvalidJobException("transition duration must be between 0 and " +
			std::to_string(Job::kMaxTransitionDuration) + ": " + std::to_string(job.transition.duration));
	}
	if (job.segmentCount <= 0) {
		throw InvalidJobException("segmentCount must be positive: " + std::to_string(job.segmentCount));
	}
}

// ============================================================================
// Validation helpers
// ============================================================================

bool JobParser::hasNonNullKey(const nlohmann::json& j, const std::string& key) {
	return j.contains(key) && !j[key].is_null();
}

void JobParser::ensureOnlyKeys(const nlohmann::json& j, const std::string& objectName,
	const std::set<std::string>& allowedKeys) {
	std::ostringstream badKeys;
	for (const auto& [key, value] : j.items()) {
		if (!allowedKeys.count(key)) {
			badKeys << " " << key;
		}
	}
	if (!badKeys.str().empty()) {
		throw InvalidJobException(objectName + " contains unsupported keys:" + badKeys.str());
	}
}

std::string JobParser::getString(const nlohmann::json& j, const std::string& objectName, const std::string& key) {
	if (!j.contains(key)) {
		throw InvalidJobException(objectName + " must have " + key);
	}
	if (!j[key].is_string()) {
		throw InvalidJobException(key + " must be a string in " + objectName);
	}
	return j[key].get<std::string>();
}

double JobParser::getDouble(const nlohmann::json& j, const std::string& objectName, const std::string& key) {
	if (!j.contains(key)) {
		throw InvalidJobException(objectName + " must have " + key);
	}
	if (!j[key].is_number()) {
		throw InvalidJobException(key + " must be a number in " + objectName);
	}
	return j[key].get<double>();
}

int JobParser::getPositiveInteger(const nlohmann::json& j, const std::string& objectName, const std::string& key) {
	if (!j.contains(key)) {
		throw InvalidJobException(objectName + " must have " + key);
	}
	if (!j[key].is_number_integer()) {
		throw InvalidJobException(key + " must be an integer in " + objectName);
	}
	int val = j[key].get<int>();
	if (val <= 0) {
		throw InvalidJobException(key + " must be positive in " + objectName + ": " + std::to_string(val));
	}
	return val;
}

nlohmann::json JobParser::getArray(const nlohmann::json& j, const std::string& objectName, const std::string& key) {
	if (!j.contains(key)) {
		throw InvalidJobException(objectName + " must have " + key);
	}
	if (!j[key].is_array()) {
		throw InvalidJobException(key + " must be an array in " + objectName);
	}
	return j[key];
}

// ============================================================================
// Structure parsing
// ============================================================================

media::TransitionOptions JobParser::parseTransition(const nlohmann::json& j) {
	if (!j.is_object()) {
		throw InvalidJobException("transition must be an object or null");
	}
	ensureOnlyKeys(j, "transition", {"type", "duration"});

	media::TransitionOptions options{media::TransitionType::Fade, 0.5};
	if (hasNonNullKey(j, "type")) {
		std::string type = getString(j, "transition", "type");
		if (!media::isKnownTransitionName(type)) {
			throw InvalidJobException("transition type must be one of none, fade, dissolve, wipe, slide: " + type);
		}
		options.type = media::stringToTransitionType(type);
	}
	if (hasNonNullKey(j, "duration")) {
		options.duration = getDouble(j, "transition", "duration");
	}
	return options;
}

VideoFormat JobParser::parseVideoFormat(const nlohmann::json& j) {
	if (!j.is_object()) {
		throw InvalidJobException("video must be an object");
	}
	ensureOnlyKeys(j, "video", {"width", "height", "fps"});

	VideoFormat format;
	if (hasNonNullKey(j, "width")) {
		format.width = getPositiveInteger(j, "video", "width");
	}
	if (hasNonNullKey(j, "height")) {
		format.height = getPositiveInteger(j, "video", "height");
	}
	if (hasNonNullKey(j, "fps")) {
		format.fps = getPositiveInteger(j, "video", "fps");
	}
	if ((format.width > 0) != (format.height > 0)) {
		throw InvalidJobException("video width and height must be given together");
	}
	return format;
}

std::string JobParser::resolvePath(const std::string& path, const fs::path& baseDir) {
	fs::path p(path);
	if (p.is_absolute() || baseDir.empty()) {
		return path;
	}
	return (baseDir / p).lexically_normal().string();
}

} // namespace job
