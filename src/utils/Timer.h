#pragma once

#include <chrono>
#include <string>
#include <map>
#include <mutex>
#include <limits>
#include <algorithm>
#include <utility>
#include <vector>
#include <iostream>
#include <iomanip>

namespace utils {

// Process-wide registry of named wall-clock timings (pipeline stages, external commands)
class Timer {
public:
	using Clock = std::chrono::steady_clock;
	using TimePoint = Clock::time_point;
	using Duration = std::chrono::duration<double>;

	struct TimingResult {
		double totalTime = 0.0;
		int count = 0;
		double minTime = std::numeric_limits<double>::max();
		double maxTime = 0.0;

		void add(double time) {
			totalTime += time;
			count++;
			minTime = std::min(minTime, time);
			maxTime = std::max(maxTime, time);
		}

		double average() const {
			return count > 0 ? totalTime / count : 0.0;
		}
	};

	class ScopedTimer {
	public:
		ScopedTimer(Timer& timer, const std::string& name)
			: timer_(timer), name_(name), start_(Clock::now()) {}

		~ScopedTimer() {
			Duration elapsed = Clock::now() - start_;
			timer_.addTiming(name_, elapsed.count());
		}

		ScopedTimer(const ScopedTimer&) = delete;
		ScopedTimer& operator=(const ScopedTimer&) = delete;

	private:
		Timer& timer_;
		std::string name_;
		TimePoint start_;
	};

	static Timer& getInstance() {
		static Timer instance;
		return instance;
	}

	void addTiming(const std::string& name, double seconds) {
		std::lock_guard<std::mutex> lock(mutex_);
		results_[name].add(seconds);
	}

	TimingResult getTiming(const std::string& name) const {
		std::lock_guard<std::mutex> lock(mutex_);
		auto it = results_.find(name);
		return it != results_.end() ? it->second : TimingResult{};
	}

	/**
	 * Stages ordered by total time, longest first. Share is relative to the longest
	 * entry, which is the enclosing block when the whole run is timed.
	 */
	void printReport(std::ostream& out = std::cout) const {
		std::vector<std::pair<std::string, TimingResult>> stages;
		{
			std::lock_guard<std::mutex> lock(mutex_);
			stages.assign(results_.begin(), results_.end());
		}
		if (stages.empty()) {
			return;
		}

		std::stable_sort(stages.begin(), stages.end(), [](const auto& a, const auto& b) {
			return a.second.totalTime > b.second.totalTime;
		});
		const double longest = stages.front().second.totalTime;

		out << "\nbeatcut stage timings\n";
		out << std::left << std::setw(24) << "stage"
			<< std::right << std::setw(7) << "calls"
			<< std::setw(11) << "total s"
			<< std::setw(8) << "share"
			<< std::setw(11) << "avg ms"
			<< std::setw(11) << "max ms" << "\n";

		for (const auto& [name, result] : stages) {
			double share = longest > 0.0 ? 100.0 * result.totalTime / longest : 0.0;
			out << std::left << std::setw(24) << name
				<< std::right << std::setw(7) << result.count
				<< std::fixed << std::setprecision(3) << std::setw(11) << result.totalTime
				<< std::setprecision(0) << std::setw(7) << share << "%"
				<< std::setprecision(1) << std::setw(11) << result.average() * 1000.0
				<< std::setw(11) << result.maxTime * 1000.0 << "\n";
		}
	}

	void reset() {
		std::lock_guard<std::mutex> lock(mutex_);
		results_.clear();
	}

private:
	mutable std::mutex mutex_;
	std::map<std::string, TimingResult> results_;
};

#define UTILS_TIMER_CONCAT_INNER(a, b) a##b
#define UTILS_TIMER_CONCAT(a, b) UTILS_TIMER_CONCAT_INNER(a, b)

// Times the enclosing block under the given name
#define TIME_BLOCK(name) utils::Timer::ScopedTimer UTILS_TIMER_CONCAT(_timer_, __LINE__)(utils::Timer::getInstance(), name)

} // namespace utils
