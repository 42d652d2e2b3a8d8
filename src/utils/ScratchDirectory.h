#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace utils {

// Owns a uniquely named directory and every file path handed out from it.
// The destructor removes the tracked files and then the directory if it is empty,
// whichever way the owning scope is left.
class ScratchDirectory {
public:
	// Creates <root>/<prefix>_<output stem>_<id>; throws std::runtime_error if no unique name can be created
	ScratchDirectory(const std::filesystem::path& root, const std::string& prefix,
		const std::string& outputPath);
	~ScratchDirectory();

	ScratchDirectory(const ScratchDirectory&) = delete;
	ScratchDirectory& operator=(const ScratchDirectory&) = delete;

	// Registers and returns a path inside the directory; the file itself is created by the caller
	std::string newFile(const std::string& name);

	const std::filesystem::path& path() const { return path_; }
	size_t trackedFileCount() const { return files_.size(); }

	// Removes tracked files and the directory; safe to call more than once
	void release();

	// Hex id derived from the output identity plus a random token
	static std::string makeExecutionId(const std::string& identity);

private:
	std::filesystem::path path_;
	std::vector<std::filesystem::path> files_;
	bool released_ = false;
};

} // namespace utils
