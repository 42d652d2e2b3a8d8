#include <catch2/catch_all.hpp>
#include "common/TestHelpers.h"
#include "audio/FFmpegAudioAnalyzer.h"
#include "edit/EditPlanBuilder.h"
#include "edit/PlanExecutor.h"
#include "media/FFmpegCommand.h"
#include "media/FFmpegMediaOperations.h"
#include <cstdlib>

namespace fs = std::filesystem;
using Catch::Approx;

namespace {

std::string ffmpegBinary() {
	const char* path = std::getenv("BEATCUT_FFMPEG");
	return path ? path : "ffmpeg";
}

bool ffmpegAvailable() {
	return media::FFmpegCommand(ffmpegBinary()).arg("-version").run().succeeded();
}

bool hasEncoder(const std::string& name) {
	auto result = media::FFmpegCommand(ffmpegBinary()).arg("-encoders").run();
	return result.succeeded() && result.output.find(" " + name + " ") != std::string::npos;
}

// Synthetic clips and a click track, generated once per test case
class Fixtures {
public:
	Fixtures() {
		clips_.push_back(makeClip("clip_a.mp4", "testsrc", 4.0));
		clips_.push_back(makeClip("clip_b.mp4", "testsrc2", 3.0));
		clips_.push_back(makeClip("clip_c.mp4", "smptebars", 5.0));

		// 440 Hz blips every half second
		audio_ = dir_.file("clicks.wav");
		bool made = media::FFmpegCommand(ffmpegBinary())
			.arg("-f", "lavfi")
			.input("aevalsrc=0.8*sin(2*PI*440*t)*lt(mod(t\\,0.5)\\,0.05):s=22050:d=6")
			.arg(audio_)
			.run().succeeded();
		REQUIRE(made);
	}

	const std::vector<std::string>& clips() const { return clips_; }
	const std::string& audio() const { return audio_; }
	const test::TempDir& dir() const { return dir_; }

	media::FFmpegMediaOperations::Config mediaConfig() const {
		media::FFmpegMediaOperations::Config config;
		config.ffmpegPath = ffmpegBinary();
		if (!hasEncoder("libx264")) {
			config.videoCodec = "mpeg4";
		}
		config.width = 320;
		config.height = 240;
		config.fps = 25;
		return config;
	}

private:
	std::string makeClip(const std::string& name, const std::string& source, double duration) {
		std::string path = dir_.file(name);
		bool made = media::FFmpegCommand(ffmpegBinary())
			.arg("-f", "lavfi")
			.input(source + "=size=320x240:rate=25:duration=" + media::FFmpegCommand::formatSeconds(duration))
			.arg("-pix_fmt", "yuv420p")
			.arg(path)
			.run().succeeded();
		REQUIRE(made);
		return path;
	}

	test::TempDir dir_;
	std::vector<std::string> clips_;
	std::string audio_;
};

} // namespace

TEST_CASE("Generated clips probe with their real properties", "[integration]") {
	if (!ffmpegAvailable()) {
		SKIP("ffmpeg not found");
	}
	Fixtures fixtures;
	media::FFmpegMediaOperations ops(fixtures.mediaConfig());

	auto info = ops.probe(fixtures.clips()[0]);

	REQUIRE(info.has_value());
	CHECK(info->duration == Approx(4.0).margin(0.2));
	REQUIRE(info->hasVideo());
	CHECK(info->firstVideoStream()->width == 320);
	CHECK(info->firstVideoStream()->height == 240);
	CHECK_FALSE(ops.probe(fixtures.dir().file("missing.mp4")).has_value());
}

TEST_CASE("The click track is analyzed for rhythm and energy", "[integration][audio]") {
	if (!ffmpegAvailable()) {
		SKIP("ffmpeg not found");
	}
	Fixtures fixtures;
	audio::FFmpegAudioAnalyzer analyzer;

	CHECK(analyzer.duration(fixtures.audio()) == Approx(6.0).margin(0.1));

	auto points = analyzer.rhythmPoints(fixtures.audio());
	CHECK(points.size() >= 6);

	auto segments = analyzer.energySegments(fixtures.audio(), 4);
	REQUIRE(segments.size() == 4);
	CHECK(segments[0].energy > 0.0);

	CHECK_THROWS(analyzer.duration(fixtures.dir().file("missing.wav")));
}

TEST_CASE("A job renders end to end", "[integration][pipeline]") {
	if (!ffmpegAvailable()) {
		SKIP("ffmpeg not found");
	}
	Fixtures fixtures;
	media::FFmpegMediaOperations ops(fixtures.mediaConfig());
	audio::FFmpegAudioAnalyzer analyzer;

	auto [strategy, transition] = GENERATE(
		std::make_pair(std::string("even"), media::TransitionType::Fade),
		std::make_pair(std::string("rhythm"), media::TransitionType::None),
		std::make_pair(std::string("energy"), media::TransitionType::Dissolve));

	CAPTURE(strategy, media::transitionTypeToString(transition));

	edit::EditPlanBuilder builder(ops, analyzer, 7);
	edit::EditPlan plan = builder.build(fixtures.clips(), fixtures.audio(), strategy, 1.0);
	REQUIRE_FALSE(plan.getDistributedClips().empty());

	test::TempDir scratch;
	edit::PlanExecutor executor(ops, {scratch.path()});
	std::string output = fixtures.dir().file("edit_" + strategy + ".mp4");
	edit::ExecutionResult result = executor.execute(plan, output, {transition, 0.5});

	CHECK(fs::exists(output));
	CHECK(result.size > 0);
	CHECK(result.clipsUsed > 0);
	CHECK(result.duration > 0.0);
	CHECK(result.duration <= plan.getAudioDuration() + 0.5);

	auto info = ops.probe(output);
	REQUIRE(info.has_value());
	CHECK(info->hasVideo());
	CHECK(info->hasAudio());

	CHECK(scratch.isEmpty());
}
