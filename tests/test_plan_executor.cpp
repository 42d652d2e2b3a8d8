#include <catch2/catch_all.hpp>
#include "common/FakeMediaOperations.h"
#include "common/TestHelpers.h"
#include "edit/PlanExecutor.h"
#include "utils/ScratchDirectory.h"
#include <filesystem>

namespace fs = std::filesystem;
using Catch::Approx;

namespace {

edit::DistributedClip place(const std::string& path, double clipDuration, double outStart, double outEnd) {
	edit::DistributedClip placed;
	placed.clip = test::makeClip(path, clipDuration);
	placed.sourceStart = 0.0;
	placed.sourceEnd = outEnd - outStart;
	placed.outputStart = outStart;
	placed.outputEnd = outEnd;
	return placed;
}

edit::EditPlan threeClipPlan() {
	std::vector<edit::ClipDescriptor> clips = {
		test::makeClip("a.mp4", 5.0, 0),
		test::makeClip("b.mp4", 5.0, 1),
		test::makeClip("c.mp4", 5.0, 2)
	};
	std::vector<edit::DistributedClip> placed = {
		place("a.mp4", 5.0, 0.0, 2.0),
		place("b.mp4", 5.0, 2.0, 4.0),
		place("c.mp4", 5.0, 4.0, 6.0)
	};
	return edit::EditPlan(clips, "music.mp3", 6.0, edit::Strategy::Even, placed);
}

void addSources(test::FakeMediaOperations& media) {
	media.addSource("a.mp4", 5.0);
	media.addSource("b.mp4", 5.0);
	media.addSource("c.mp4", 5.0);
}

const media::TransitionOptions kNoTransition{media::TransitionType::None, 0.0};
const media::TransitionOptions kFade{media::TransitionType::Fade, 0.5};

} // namespace

TEST_CASE("Execution without transitions concatenates once", "[executor]") {
	test::TempDir scratch;
	test::TempDir out;
	test::FakeMediaOperations media;
	addSources(media);

	edit::PlanExecutor executor(media, {scratch.path()});
	std::string output = out.file("result.mp4");
	auto result = executor.execute(threeClipPlan(), output, kNoTransition);

	CHECK(result.outputPath == output);
	CHECK(result.clipsUsed == 3);
	CHECK(result.strategy == "even");
	CHECK(result.duration == Approx(6.0));
	CHECK(result.size > 0);
	CHECK(result.transitionFallbacks == 0);
	CHECK(result.droppedClips == 0);

	REQUIRE(media.trimCalls.size() == 3);
	CHECK(media.trimCalls[1].input == "b.mp4");
	CHECK(fs::path(media.trimCalls[1].output).filename() == "clip_1.mp4");
	CHECK(media.trimCalls[1].start == 0.0);
	CHECK(media.trimCalls[1].end == Approx(2.0));

	REQUIRE(media.concatCalls.size() == 1);
	CHECK(media.concatCalls[0].size() == 3);
	CHECK(media.transitionCalls.empty());
	CHECK(media.muxCalls == 1);

	CHECK(fs::exists(output));
	CHECK(scratch.isEmpty());
}

TEST_CASE("A single trimmed clip goes straight to the mux", "[executor]") {
	test::TempDir scratch;
	test::TempDir out;
	test::FakeMediaOperations media;
	addSources(media);
	media.failTrimFor = {"a.mp4", "c.mp4"};

	edit::PlanExecutor executor(media, {scratch.path()});
	auto result = executor.execute(threeClipPlan(), out.file("result.mp4"), kNoTransition);

	CHECK(result.clipsUsed == 1);
	CHECK(result.droppedClips == 2);
	CHECK(media.concatCalls.empty());
	CHECK(media.sourcesOf(media.lastMuxVideo) == std::vector<std::string>{"b.mp4"});
	CHECK(scratch.isEmpty());
}

TEST_CASE("Transitions fold clips pairwise", "[executor][transition]") {
	test::TempDir scratch;
	test::TempDir out;
	test::FakeMediaOperations media;
	addSources(media);

	edit::PlanExecutor executor(media, {scratch.path()});
	auto result = executor.execute(threeClipPlan(), out.file("result.mp4"), kFade);

	CHECK(result.clipsUsed == 3);
	CHECK(result.transitionFallbacks == 0);
	REQUIRE(media.transitionCalls.size() == 2);
	CHECK(media.transitionCalls[0].type == media::TransitionType::Fade);
	CHECK(media.transitionCalls[0].duration == 0.5);
	// The second transition starts from the output of the first
	CHECK(media.transitionCalls[1].first == media.transitionCalls[0].output);
	CHECK(media.concatCalls.empty());
	CHECK(media.sourcesOf(media.lastMuxVideo) == std::vector<std::string>{"a.mp4", "b.mp4", "c.mp4"});
	CHECK(scratch.isEmpty());
}

TEST_CASE("Failing transitions give the same clips as no transition", "[executor][transition]") {
	test::TempDir scratch;
	test::TempDir out;

	test::FakeMediaOperations plain;
	addSources(plain);
	edit::PlanExecutor plainExecutor(plain, {scratch.path()});
	auto plainResult = plainExecutor.execute(threeClipPlan(), out.file("plain.mp4"), kNoTransition);

	test::FakeMediaOperations failing;
	addSources(failing);
	failing.failTransitions = true;
	edit::PlanExecutor failingExecutor(failing, {scratch.path()});
	auto failingResult = failingExecutor.execute(threeClipPlan(), out.file("fallback.mp4"), kFade);

	CHECK(failingResult.transitionFallbacks == 2);
	CHECK(failingResult.clipsUsed == plainResult.clipsUsed);
	CHECK(failingResult.duration == Approx(plainResult.duration));
	CHECK(failing.sourcesOf(failing.lastMuxVideo) == plain.sourcesOf(plain.lastMuxVideo));
	CHECK(scratch.isEmpty());
}

TEST_CASE("A clip is dropped when both transition and fallback fail", "[executor][transition]") {
	test::TempDir scratch;
	test::TempDir out;
	test::FakeMediaOperations media;
	addSources(media);
	media.failTransitions = true;
	media.failConcat = true;

	edit::PlanExecutor executor(media, {scratch.path()});
	auto result = executor.execute(threeClipPlan(), out.file("result.mp4"), kFade);

	CHECK(result.clipsUsed == 1);
	CHECK(result.droppedClips == 2);
	CHECK(result.transitionFallbacks == 2);
	CHECK(media.sourcesOf(media.lastMuxVideo) == std::vector<std::string>{"a.mp4"});
}

TEST_CASE("Fatal failures clean up and report their stage", "[executor][errors]") {
	test::TempDir scratch;
	test::TempDir out;
	test::FakeMediaOperations media;
	addSources(media);
	std::string output = out.file("result.mp4");

	edit::PlanExecutor executor(media, {scratch.path()});

	SECTION("All trims fail") {
		media.failAllTrims = true;
		try {
			executor.execute(threeClipPlan(), output, kNoTransition);
			FAIL("Expected TrimFailureError");
		} catch (const edit::TrimFailureError& e) {
			CHECK(e.stage() == "trim");
		}
		CHECK(media.muxCalls == 0);
	}

	SECTION("Concatenation fails") {
		media.failConcat = true;
		try {
			executor.execute(threeClipPlan(), output, kNoTransition);
			FAIL("Expected FoldFailureError");
		} catch (const edit::FoldFailureError& e) {
			CHECK(e.stage() == "fold");
		}
		CHECK(media.muxCalls == 0);
	}

	SECTION("Audio mux fails") {
		media.failMux = true;
		try {
			executor.execute(threeClipPlan(), output, kNoTransition);
			FAIL("Expected AudioMuxFailureError");
		} catch (const edit::AudioMuxFailureError& e) {
			CHECK(e.stage() == "mux");
		}
	}

	SECTION("Output has no duration") {
		media.muxWritesEmptyOutput = true;
		try {
			executor.execute(threeClipPlan(), output, kNoTransition);
			FAIL("Expected InvalidOutputError");
		} catch (const edit::InvalidOutputError& e) {
			CHECK(e.stage() == "validation");
		}
	}

	CHECK_FALSE(fs::exists(output));
	CHECK(scratch.isEmpty());
}

TEST_CASE("An empty plan cannot be executed", "[executor][errors]") {
	test::TempDir scratch;
	test::FakeMediaOperations media;

	edit::EditPlan plan({test::makeClip("a.mp4", 1.0)}, "music.mp3", 5.0, edit::Strategy::Even, {});
	edit::PlanExecutor executor(media, {scratch.path()});

	CHECK_THROWS_AS(executor.execute(plan, scratch.file("out.mp4"), kNoTransition), edit::TrimFailureError);
	CHECK(scratch.isEmpty());
}

TEST_CASE("Concurrent plans use separate scratch directories", "[executor][scratch]") {
	test::TempDir root;

	utils::ScratchDirectory first(root.path(), "beatcut", "same.mp4");
	utils::ScratchDirectory second(root.path(), "beatcut", "same.mp4");

	CHECK(first.path() != second.path());
	CHECK(fs::is_directory(first.path()));
	CHECK(fs::is_directory(second.path()));
	CHECK(first.path().filename().string().rfind("beatcut_same_", 0) == 0);
}
