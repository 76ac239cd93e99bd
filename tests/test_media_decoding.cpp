#include <catch2/catch_test_macros.hpp>
#include "audio/AudioDecoder.h"
#include "audio/WavWriter.h"
#include "pipeline/CompositionErrors.h"
#include "video/VideoProcessor.h"
#include "FakeMedia.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using namespace SceneStitch;

TEST_CASE("AudioDecoder reads back a written WAV as mono floats", "[decode][audio]") {
    SceneStitchTest::TempDir dir;
    std::string path = dir.file("tone.wav");
    std::vector<float> tone = SceneStitchTest::toneSamples(1.0, 22050);
    std::string error;
    REQUIRE(writeWav(path, tone, 22050, error));

    AudioDecoder decoder;
    AudioDecoder::AudioData data = decoder.decode(path);
    CHECK(data.sampleRate == 22050);
    CHECK(std::abs(static_cast<long>(data.samples.size()) - 22050L) <= 64);
    CHECK(std::abs(data.duration - 1.0) < 0.01);

    float peak = 0.0f;
    for (float s : data.samples) peak = std::max(peak, std::abs(s));
    CHECK(std::abs(peak - 0.5f) < 0.01f);
}

TEST_CASE("AudioDecoder rejects unreadable files", "[decode][audio]") {
    SceneStitchTest::TempDir dir;
    AudioDecoder decoder;
    CHECK_THROWS_AS(decoder.decode(dir.file("missing.wav")), std::runtime_error);

    std::string junk = dir.file("junk.wav");
    std::ofstream(junk) << "definitely not audio";
    CHECK_THROWS_AS(decoder.decode(junk), std::runtime_error);
}

TEST_CASE("VideoProcessor raises SourceDecodeError for unusable files", "[decode][video]") {
    SceneStitchTest::TempDir dir;
    VideoProcessor probe;
    CHECK_THROWS_AS(probe.probe(dir.file("missing.mp4")), SourceDecodeError);

    // Audio-only container has no video stream
    std::string wav = dir.file("narration.wav");
    std::string error;
    REQUIRE(writeWav(wav, SceneStitchTest::toneSamples(0.2), 44100, error));
    CHECK_THROWS_AS(probe.probe(wav), SourceDecodeError);
}
