#include <catch2/catch_test_macros.hpp>
#include "audio/WavWriter.h"
#include "FakeMedia.h"
#include <cstdint>
#include <fstream>
#include <iterator>

using namespace SceneStitch;

static uint32_t le32(const std::vector<unsigned char>& b, size_t at) {
    return b[at] | (b[at + 1] << 8) | (b[at + 2] << 16) | (static_cast<uint32_t>(b[at + 3]) << 24);
}

static int16_t le16(const std::vector<unsigned char>& b, size_t at) {
    return static_cast<int16_t>(b[at] | (b[at + 1] << 8));
}

TEST_CASE("writeWav emits a 16-bit mono PCM file", "[wav]") {
    SceneStitchTest::TempDir dir;
    std::string path = dir.file("scene_0_audio.wav");
    std::vector<float> samples = {0.0f, 1.0f, -1.0f, 2.0f, -3.0f, 0.5f};
    std::string error;
    REQUIRE(writeWav(path, samples, 22050, error));
    CHECK(error.empty());

    std::ifstream in(path, std::ios::binary);
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(bytes.size() == 44 + samples.size() * 2);
    CHECK(std::string(bytes.begin(), bytes.begin() + 4) == "RIFF");
    CHECK(std::string(bytes.begin() + 8, bytes.begin() + 12) == "WAVE");
    CHECK(le32(bytes, 4) == 36 + samples.size() * 2);
    CHECK(le16(bytes, 22) == 1);          // channels
    CHECK(le32(bytes, 24) == 22050);      // sample rate
    CHECK(le16(bytes, 34) == 16);         // bits per sample
    CHECK(le32(bytes, 40) == samples.size() * 2);

    CHECK(le16(bytes, 44) == 0);
    CHECK(le16(bytes, 46) == 32767);
    CHECK(le16(bytes, 48) == -32767);
    CHECK(le16(bytes, 50) == 32767);      // clamped
    CHECK(le16(bytes, 52) == -32767);     // clamped
    CHECK(le16(bytes, 54) == 16384);
}

TEST_CASE("writeWav reports errors instead of throwing", "[wav]") {
    std::string error;
    CHECK_FALSE(writeWav("/nonexistent/scenestitch/dir/out.wav", {0.1f}, 44100, error));
    CHECK_FALSE(error.empty());

    SceneStitchTest::TempDir dir;
    CHECK_FALSE(writeWav(dir.file("bad.wav"), {0.1f}, 0, error));
    CHECK(error.find("sample rate") != std::string::npos);
}
