#include "media/FFmpegCommand.h"
#include "utils/Logger.h"
#include "utils/Timer.h"
#include <array>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <sys/wait.h>

namespace media {

namespace {

// Last few lines of ffmpeg output; the error is almost always at the end
std::string tail(const std::string& output, size_t maxLines) {
	size_t pos = output.size();
	size_t lines = 0;
	while (pos > 0 && lines <= maxLines) {
		pos = output.rfind('\n', pos - 1);
		if (pos == std::string::npos) {
			return output;
		}
		lines++;
	}
	return output.substr(pos + 1);
}

} // namespace

FFmpegCommand::FFmpegCommand(const std::string& ffmpegPath) {
	args_.push_back(ffmpegPath);
	// Never prompt, keep the log to errors
	args_.push_back("-y");
	args_.push_back("-hide_banner");
	args_.push_back("-loglevel");
	args_.push_back("error");
}

FFmpegCommand& FFmpegCommand::arg(const std::string& value) {
	args_.push_back(value);
	return *this;
}

FFmpegCommand& FFmpegCommand::arg(const std::string& flag, const std::string& value) {
	args_.push_back(flag);
	args_.push_back(value);
	return *this;
}

FFmpegCommand& FFmpegCommand::arg(const std::string& flag, double value) {
	return arg(flag, formatSeconds(value));
}

FFmpegCommand& FFmpegCommand::input(const std::string& path) {
	return arg("-i", path);
}

std::string FFmpegCommand::toString() const {
	std::string cmd;
	for (const auto& a : args_) {
		if (!cmd.empty()) {
			cmd += ' ';
		}
		cmd += quote(a);
	}
	return cmd;
}

FFmpegCommand::Result FFmpegCommand::run() const {
	Result result;
	std::string cmd = toString() + " 2>&1";
	utils::Logger::debug("Running: {}", cmd);

	TIME_BLOCK("ffmpeg");
	auto start = std::chrono::steady_clock::now();

	FILE* pipe = popen(cmd.c_str(), "r");
	if (!pipe) {
		utils::Logger::error("Failed to launch {}", args_.front());
		return result;
	}

	std::array<char, 256> buffer;
	while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
		result.output += buffer.data();
	}

	int status = pclose(pipe);
	if (status == -1) {
		result.exitCode = -1;
	} else if (WIFEXITED(status)) {
		result.exitCode = WEXITSTATUS(status);
	} else {
		result.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
	}

	auto end = std::chrono::steady_clock::now();
	result.executionTime = std::chrono::duration<double, std::milli>(end - start).count();

	if (!result.succeeded()) {
		utils::Logger::debug("ffmpeg exited with {} after {} ms", result.exitCode, result.executionTime);
		if (!result.output.empty()) {
			utils::Logger::debug("ffmpeg output:\n{}", tail(result.output, 10));
		}
	}

	return result;
}

std::string FFmpegCommand::quote(const std::string& value) {
	std::string quoted = "'";
	for (char c : value) {
		if (c == '\'') {
			quoted += "'\\''";
		} else {
			quoted += c;
		}
	}
	quoted += "'";
	return quoted;
}

std::string FFmpegCommand::formatSeconds(double seconds) {
	std::ostringstream ss;
	ss << std::fixed << std::setprecision(3) << seconds;
	return ss.str();
}

} // namespace media
