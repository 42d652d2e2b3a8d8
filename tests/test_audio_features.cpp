#include <catch2/catch_all.hpp>
#include "audio/AudioFeatures.h"
#include <algorithm>

using audio::AudioFeatures;
using Catch::Approx;

namespace {

// Unit impulses every `period` frames starting at `phase`
std::vector<double> impulseEnvelope(size_t frames, size_t period, size_t phase) {
	std::vector<double> envelope(frames, 0.0);
	for (size_t i = phase; i < frames; i += period) {
		envelope[i] = 1.0;
	}
	return envelope;
}

constexpr double kFrameRate = 40.0;

} // namespace

TEST_CASE("Onset envelope rises where the signal gets louder", "[audio][onset]") {
	std::vector<float> samples(16384, 0.0f);
	std::fill(samples.begin() + 4096, samples.end(), 0.5f);

	auto envelope = AudioFeatures::onsetEnvelope(samples);

	REQUIRE(envelope.size() == 1 + (16384 - AudioFeatures::kFrameSize) / AudioFeatures::kHopSize);
	CHECK(envelope[0] == 0.0);
	auto loudest = std::max_element(envelope.begin(), envelope.end()) - envelope.begin();
	// First frame whose window reaches the loud part
	CHECK(loudest == 5);
	CHECK(envelope[20] == 0.0);
	CHECK(AudioFeatures::onsetEnvelope({}).empty());
}

TEST_CASE("Onsets are picked at isolated peaks", "[audio][onset]") {
	auto envelope = impulseEnvelope(400, 20, 5);

	auto onsets = AudioFeatures::pickOnsets(envelope, kFrameRate);

	REQUIRE(onsets.size() == 20);
	CHECK(onsets[0] == Approx(5.0 / kFrameRate));
	CHECK(onsets[1] == Approx(25.0 / kFrameRate));
	CHECK(AudioFeatures::pickOnsets(std::vector<double>(100, 0.0), kFrameRate).empty());
}

TEST_CASE("Tempo is estimated from a periodic envelope", "[audio][tempo]") {
	// 20 frames at 40 frames/s is a beat every half second
	auto envelope = impulseEnvelope(400, 20, 5);

	CHECK(AudioFeatures::estimateTempo(envelope, kFrameRate) == Approx(120.0).margin(7.0));
	CHECK(AudioFeatures::estimateTempo(std::vector<double>(400, 0.3), kFrameRate) == 0.0);
	CHECK(AudioFeatures::estimateTempo({1.0}, kFrameRate) == 0.0);
}

TEST_CASE("Beats follow the phase of the envelope", "[audio][tempo]") {
	auto envelope = impulseEnvelope(400, 20, 5);

	auto beats = AudioFeatures::trackBeats(envelope, kFrameRate, 120.0);

	REQUIRE(beats.size() == 20);
	for (size_t k = 0; k < beats.size(); k++) {
		CHECK(beats[k] == Approx((5.0 + 20.0 * k) / kFrameRate));
	}
	CHECK(AudioFeatures::trackBeats(envelope, kFrameRate, 0.0).empty());
}

TEST_CASE("Rhythm points collapse within the minimum gap", "[audio][rhythm]") {
	auto timeline = AudioFeatures::combineRhythmPoints({0.0, 1.0, 2.0}, {0.05, 1.5, 2.2, 1.0});

	CHECK(timeline.points() == std::vector<double>{0.0, 1.0, 1.5, 2.0, 2.2});
}

TEST_CASE("Energy segments partition the track", "[audio][energy]") {
	std::vector<float> samples(10000, 0.5f);

	auto segments = AudioFeatures::segmentEnergy(samples, 1000, 4);

	REQUIRE(segments.size() == 4);
	for (int i = 0; i < 4; i++) {
		CHECK(segments[i].index == i);
		CHECK(segments[i].startTime == Approx(2.5 * i));
		CHECK(segments[i].duration == Approx(2.5));
		CHECK(segments[i].energy == Approx(0.25));
		CHECK(segments[i].tempo == 0.0);
	}
	CHECK(segments.back().endTime() == Approx(10.0));

	CHECK(AudioFeatures::segmentEnergy(samples, 1000, 0).empty());
	CHECK(AudioFeatures::segmentEnergy({}, 1000, 4).empty());
}

TEST_CASE("Louder segments carry more energy", "[audio][energy]") {
	std::vector<float> samples(8000, 0.1f);
	std::fill(samples.begin() + 4000, samples.end(), 0.8f);

	auto segments = AudioFeatures::segmentEnergy(samples, 1000, 2);

	REQUIRE(segments.size() == 2);
	CHECK(segments[1].energy > segments[0].energy);
}
