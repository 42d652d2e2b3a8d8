#include <catch2/catch_all.hpp>
#include "media/FFmpegCommand.h"
#include "media/FFmpegMediaOperations.h"

using media::FFmpegCommand;
using media::FFmpegMediaOperations;
using media::TransitionType;

TEST_CASE("Commands start with the non-interactive flags", "[ffmpeg]") {
	FFmpegCommand cmd("ffmpeg");
	cmd.input("in.mp4").arg("-ss", 1.5).arg("-an").arg("out.mp4");

	CHECK(cmd.args() == std::vector<std::string>{
		"ffmpeg", "-y", "-hide_banner", "-loglevel", "error",
		"-i", "in.mp4", "-ss", "1.500", "-an", "out.mp4"});
	CHECK(cmd.toString() ==
		"'ffmpeg' '-y' '-hide_banner' '-loglevel' 'error' '-i' 'in.mp4' '-ss' '1.500' '-an' 'out.mp4'");
}

TEST_CASE("Arguments are shell-quoted", "[ffmpeg]") {
	CHECK(FFmpegCommand::quote("plain") == "'plain'");
	CHECK(FFmpegCommand::quote("my clip.mp4") == "'my clip.mp4'");
	CHECK(FFmpegCommand::quote("it's") == "'it'\\''s'");
	CHECK(FFmpegCommand::quote("$(rm -rf x)") == "'$(rm -rf x)'");
}

TEST_CASE("Seconds are formatted with millisecond precision", "[ffmpeg]") {
	CHECK(FFmpegCommand::formatSeconds(0.0) == "0.000");
	CHECK(FFmpegCommand::formatSeconds(2.5) == "2.500");
	CHECK(FFmpegCommand::formatSeconds(1.23456) == "1.235");
}

TEST_CASE("Fade transitions fade out then in", "[ffmpeg][transition]") {
	std::string filter = FFmpegMediaOperations::transitionFilter(TransitionType::Fade, 3.0, 0.5);

	CHECK(filter ==
		"[0:v]fade=t=out:st=2.500:d=0.500[fadeout];"
		"[1:v]fade=t=in:st=0:d=0.500[fadein];"
		"[fadeout][fadein]concat=n=2:v=1:a=0[outv]");
}

TEST_CASE("Overlapping transitions use xfade", "[ffmpeg][transition]") {
	auto type = GENERATE(TransitionType::Dissolve, TransitionType::Wipe, TransitionType::Slide);
	std::string expected = type == TransitionType::Dissolve ? "dissolve"
		: type == TransitionType::Wipe ? "wipeleft" : "slideleft";

	std::string filter = FFmpegMediaOperations::transitionFilter(type, 4.0, 1.0);

	CHECK(filter.find("xfade=transition=" + expected + ":duration=1.000:offset=3.000") != std::string::npos);
	CHECK(filter.find("[outv]") != std::string::npos);
}
