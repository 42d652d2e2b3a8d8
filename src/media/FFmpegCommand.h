#pragma once

#include <string>
#include <vector>

namespace media {

// Argument list for one ffmpeg invocation, rendered as a shell-quoted command line
class FFmpegCommand {
public:
	explicit FFmpegCommand(const std::string& ffmpegPath);

	FFmpegCommand& arg(const std::string& value);
	FFmpegCommand& arg(const std::string& flag, const std::string& value);
	FFmpegCommand& arg(const std::string& flag, double value);
	FFmpegCommand& input(const std::string& path);

	const std::vector<std::string>& args() const { return args_; }
	std::string toString() const;

	struct Result {
		int exitCode = -1;
		std::string output;  // stdout and stderr combined
		double executionTime = 0.0;  // milliseconds

		bool succeeded() const { return exitCode == 0; }
	};

	// Runs the command to completion, capturing its output
	Result run() const;

	static std::string quote(const std::string& value);
	static std::string formatSeconds(double seconds);

private:
	std::vector<std::string> args_;
};

} // namespace media
