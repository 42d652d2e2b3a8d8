#include <catch2/catch_all.hpp>
#include "common/TestHelpers.h"
#include "utils/Logger.h"
#include "utils/ScratchDirectory.h"
#include "utils/Timer.h"
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

TEST_CASE("Log levels parse case-insensitively", "[utils][logger]") {
	using utils::Logger;

	CHECK(Logger::levelFromString("debug", Logger::INFO) == Logger::DEBUG);
	CHECK(Logger::levelFromString("WARN", Logger::INFO) == Logger::WARN);
	CHECK(Logger::levelFromString("Warning", Logger::INFO) == Logger::WARN);
	CHECK(Logger::levelFromString("error", Logger::INFO) == Logger::ERROR);
	CHECK(Logger::levelFromString("", Logger::INFO) == Logger::INFO);
	CHECK(Logger::levelFromString("loud", Logger::ERROR) == Logger::ERROR);
}

TEST_CASE("Scratch directories remove what they handed out", "[utils][scratch]") {
	test::TempDir root;
	fs::path scratchPath;

	{
		utils::ScratchDirectory scratch(root.path(), "beatcut", "/videos/final cut.mp4");
		scratchPath = scratch.path();
		CHECK(scratchPath.parent_path() == root.path());
		CHECK(scratchPath.filename().string().rfind("beatcut_final cut_", 0) == 0);

		std::string clip = scratch.newFile("clip_0.mp4");
		{
			std::ofstream file(clip);
			file << "data";
		}
		scratch.newFile("never_written.mp4");
		CHECK(scratch.trackedFileCount() == 2);
		CHECK(fs::exists(clip));
	}

	CHECK_FALSE(fs::exists(scratchPath));
	CHECK(root.isEmpty());
}

TEST_CASE("Untracked files keep the scratch directory alive", "[utils][scratch]") {
	test::TempDir root;

	utils::ScratchDirectory scratch(root.path(), "beatcut", "out.mp4");
	{
		std::ofstream stray(scratch.path() / "stray.txt");
		stray << "left behind";
	}

	scratch.release();
	CHECK(fs::exists(scratch.path() / "stray.txt"));

	// A second release is a no-op
	scratch.release();
	CHECK(fs::exists(scratch.path()));
}

TEST_CASE("Execution ids differ for the same output", "[utils][scratch]") {
	std::string first = utils::ScratchDirectory::makeExecutionId("/tmp/out.mp4");
	std::string second = utils::ScratchDirectory::makeExecutionId("/tmp/out.mp4");

	CHECK(first.size() == 24);
	CHECK(first.substr(0, 8) == second.substr(0, 8));
	CHECK(first != second);
}

TEST_CASE("Timed blocks accumulate per name", "[utils][timer]") {
	auto& timer = utils::Timer::getInstance();
	timer.reset();

	for (int i = 0; i < 3; i++) {
		TIME_BLOCK("unit_stage");
	}

	auto timing = timer.getTiming("unit_stage");
	CHECK(timing.count == 3);
	CHECK(timing.totalTime >= 0.0);
	CHECK(timing.minTime <= timing.maxTime);
	CHECK(timer.getTiming("never_run").count == 0);

	std::ostringstream report;
	timer.printReport(report);
	CHECK(report.str().find("unit_stage") != std::string::npos);
	timer.reset();
}

TEST_CASE("Timing report lists the slowest stage first", "[utils][timer]") {
	auto& timer = utils::Timer::getInstance();
	timer.reset();
	timer.addTiming("trim", 0.5);
	timer.addTiming("execution", 2.0);
	timer.addTiming("mux", 1.0);

	std::ostringstream report;
	timer.printReport(report);
	std::string text = report.str();

	size_t execution = text.find("execution");
	size_t mux = text.find("mux");
	size_t trim = text.find("trim");
	REQUIRE(execution != std::string::npos);
	REQUIRE(mux != std::string::npos);
	REQUIRE(trim != std::string::npos);
	CHECK(execution < mux);
	CHECK(mux < trim);
	CHECK(text.find("100%") != std::string::npos);
	CHECK(text.find("25%") != std::string::npos);
	timer.reset();
}
