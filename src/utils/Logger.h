#pragma once

#include <string>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <atomic>
#include <mutex>
#include <ctime>

namespace utils {

class Logger {
public:
	enum Level {
		ERROR = 0,
		WARN = 1,
		INFO = 2,
		DEBUG = 3
	};

	static void setLevel(Level level) {
		currentLevel = level;
	}

	static Level getLevel() {
		return currentLevel;
	}

	// Accepts "error", "warn", "info", "debug" (case-insensitive); returns fallback otherwise
	static Level levelFromString(const std::string& name, Level fallback);

	template<typename... Args>
	static void error(const std::string& format, Args... args) {
		log(ERROR, "ERROR", format, args...);
	}

	template<typename... Args>
	static void warn(const std::string& format, Args... args) {
		log(WARN, "WARN", format, args...);
	}

	template<typename... Args>
	static void info(const std::string& format, Args... args) {
		log(INFO, "INFO", format, args...);
	}

	template<typename... Args>
	static void debug(const std::string& format, Args... args) {
		log(DEBUG, "DEBUG", format, args...);
	}

private:
	static std::atomic<Level> currentLevel;
	static std::mutex outputMutex;

	template<typename... Args>
	static void log(Level level, const std::string& levelStr,
		const std::string& format, Args... args) {

		if (level > currentLevel) {
			return;
		}

		auto now = std::chrono::system_clock::now();
		auto time_t = std::chrono::system_clock::to_time_t(now);
		std::tm localTime{};
		localtime_r(&time_t, &localTime);

		std::stringstream ss;
		ss << "[" << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << "] ";
		ss << "[" << levelStr << "] ";

		// Simple format string replacement
		std::string message = format;
		size_t searchFrom = 0;
		((searchFrom = replaceFirst(message, "{}", toString(args), searchFrom)), ...);

		ss << message;

		std::lock_guard<std::mutex> lock(outputMutex);
		if (level <= WARN) {
			std::cerr << ss.str() << std::endl;
		} else {
			std::cout << ss.str() << std::endl;
		}
	}

	// Replaces from position onward so substituted text containing "{}" is left alone
	static size_t replaceFirst(std::string& str, const std::string& from,
		const std::string& to, size_t position) {
		size_t pos = str.find(from, position);
		if (pos == std::string::npos) {
			return str.size();
		}
		str.replace(pos, from.length(), to);
		return pos + to.length();
	}

	template<typename T>
	static std::string toString(const T& value) {
		std::stringstream ss;
		ss << value;
		return ss.str();
	}
};

} // namespace utils
