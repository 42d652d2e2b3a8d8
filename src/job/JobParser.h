#pragma once

#include "job/JobTypes.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <set>
#include <string>

namespace job {

class JobParser {
public:
	// Relative clip and audio paths are resolved against the job file's directory
	static Job parse(const std::string& filename);
	static Job parseJSON(const nlohmann::json& j, const std::filesystem::path& baseDir = {});

	// Range checks shared by the parser and command-line overrides
	static void validate(const Job& job);

private:
	static bool hasNonNullKey(const nlohmann::json& j, const std::string& key);
	static void ensureOnlyKeys(const nlohmann::json& j, const std::string& objectName,
		const std::set<std::string>& allowedKeys);

	static std::string getString(const nlohmann::json& j, const std::string& objectName, const std::string& key);
	static double getDouble(const nlohmann::json& j, const std::string& objectName, const std::string& key);
	static int getPositiveInteger(const nlohmann::json& j, const std::string& objectName, const std::string& key);
	static nlohmann::json getArray(const nlohmann::json& j, const std::string& objectName, const std::string& key);

	static media::TransitionOptions parseTransition(const nlohmann::json& j);
	static VideoFormat parseVideoFormat(const nlohmann::json& j);
	static std::string resolvePath(const std::string& path, const std::filesystem::path& baseDir);
};

} // namespace job
