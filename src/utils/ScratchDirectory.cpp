#include "utils/ScratchDirectory.h"
#include "utils/Logger.h"
#include <cstdint>
#include <functional>
#include <random>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace utils {

namespace {

constexpr int kMaxCreateAttempts = 16;

} // namespace

ScratchDirectory::ScratchDirectory(const fs::path& root, const std::string& prefix,
	const std::string& outputPath) {

	std::error_code ec;
	std::string stem = fs::path(outputPath).stem().string();
	fs::path identity = fs::absolute(outputPath, ec);
	if (ec) {
		identity = outputPath;
		ec.clear();
	}

	fs::create_directories(root, ec);
	if (ec) {
		throw std::runtime_error("Failed to create scratch root " + root.string() + ": " + ec.message());
	}

	for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
		fs::path candidate = root / (prefix + "_" + stem + "_" + makeExecutionId(identity.string()));

		// create_directory reports false when the name already exists, so two
		// executions can never end up sharing a directory
		if (fs::create_directory(candidate, ec)) {
			path_ = candidate;
			Logger::debug("Created scratch directory: {}", path_.string());
			return;
		}
		if (ec) {
			throw std::runtime_error("Failed to create scratch directory " + candidate.string() +
				": " + ec.message());
		}
	}

	throw std::runtime_error("Could not allocate a unique scratch directory under " + root.string());
}

ScratchDirectory::~ScratchDirectory() {
	release();
}

std::string ScratchDirectory::newFile(const std::string& name) {
	fs::path file = path_ / name;
	files_.push_back(file);
	return file.string();
}

void ScratchDirectory::release() {
	if (released_) {
		return;
	}
	released_ = true;

	Logger::info("Cleaning up {} temporary files", files_.size());

	std::error_code ec;
	for (const auto& file : files_) {
		if (fs::remove(file, ec)) {
			Logger::debug("Removed temporary file: {}", file.string());
		} else if (ec) {
			Logger::warn("Failed to remove temporary file {}: {}", file.string(), ec.message());
			ec.clear();
		}
	}
	files_.clear();

	if (path_.empty() || !fs::exists(path_, ec)) {
		return;
	}

	if (fs::is_empty(path_, ec) && !ec) {
		fs::remove(path_, ec);
		if (ec) {
			Logger::warn("Failed to remove temporary directory {}: {}", path_.string(), ec.message());
		} else {
			Logger::debug("Removed temporary directory: {}", path_.string());
		}
	} else {
		Logger::warn("Temporary directory {} is not empty, leaving it in place", path_.string());
	}
}

std::string ScratchDirectory::makeExecutionId(const std::string& identity) {
	static thread_local std::mt19937_64 gen(std::random_device{}());
	uint64_t token = gen();
	uint64_t identityHash = std::hash<std::string>{}(identity);

	std::ostringstream ss;
	ss << std::hex << std::setfill('0')
	   << std::setw(8) << (identityHash & 0xffffffffULL)
	   << std::setw(16) << token;
	return ss.str();
}

} // namespace utils
