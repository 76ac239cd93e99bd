#include <catch2/catch_test_macros.hpp>
#include "pipeline/CompositionErrors.h"
#include "pipeline/SceneManifest.h"
#include "FakeMedia.h"
#include <filesystem>
#include <fstream>

using namespace SceneStitch;

TEST_CASE("Manifest scenes are indexed by position", "[manifest]") {
    SceneManifest m = parseSceneManifest(R"({
        "output": "/out/final.mp4",
        "avatar": "/assets/avatar.mp4",
        "scenes": [
            {"text": "Hook line", "audio": "/a/0.wav", "primary": "/v/0a.mp4", "secondary": "/v/0b.mp4",
             "visual_1": "city", "visual_2": "night"},
            {"text": "Second", "audio": "/a/1.wav", "primary": "/v/1a.mp4"}
        ]
    })");
    CHECK(m.outputPath == "/out/final.mp4");
    CHECK(m.avatarPath == "/assets/avatar.mp4");
    REQUIRE(m.scenes.size() == 2);
    CHECK(m.scenes[0].index == 0);
    CHECK(m.scenes[0].narrationText == "Hook line");
    CHECK(m.scenes[0].visualKeyword1 == "city");
    CHECK(m.scenes[0].visualKeyword2 == "night");
    CHECK(m.scenes[0].hasSecondary());
    CHECK(m.scenes[1].index == 1);
    CHECK(m.scenes[1].audio.sourcePath == "/a/1.wav");
    CHECK(m.scenes[1].primarySource.path == "/v/1a.mp4");
    CHECK_FALSE(m.scenes[1].hasSecondary());
}

TEST_CASE("Relative manifest paths resolve against the manifest directory", "[manifest]") {
    SceneStitchTest::TempDir dir;
    std::string path = dir.file("story.json");
    std::ofstream(path) << R"({"output": "final/out.mp4",
        "scenes": [{"text": "x", "audio": "audio/0.wav", "primary": "clips/0.mp4"}]})";

    SceneManifest m = loadSceneManifest(path);
    auto expect = [&](const std::string& rel) {
        return (dir.path() / rel).lexically_normal().string();
    };
    CHECK(m.outputPath == expect("final/out.mp4"));
    REQUIRE(m.scenes.size() == 1);
    CHECK(m.scenes[0].audio.sourcePath == expect("audio/0.wav"));
    CHECK(m.scenes[0].primarySource.path == expect("clips/0.mp4"));
    CHECK(m.avatarPath.empty());
}

TEST_CASE("Malformed manifests are configuration errors", "[manifest]") {
    CHECK_THROWS_AS(parseSceneManifest("nope"), ConfigurationError);
    CHECK_THROWS_AS(parseSceneManifest(R"({"output": "x.mp4"})"), ConfigurationError);
    CHECK_THROWS_AS(parseSceneManifest(R"({"scenes": {}})"), ConfigurationError);
    CHECK_THROWS_AS(parseSceneManifest(R"({"scenes": [3]})"), ConfigurationError);
    CHECK_THROWS_AS(parseSceneManifest(R"({"scenes": [{"text": 5}]})"), ConfigurationError);
    CHECK_THROWS_AS(loadSceneManifest("/nonexistent/scenestitch/story.json"), ConfigurationError);
}

TEST_CASE("Reported narration durations are carried into the scene", "[manifest]") {
    SceneManifest m = parseSceneManifest(R"({"scenes": [
        {"text": "a", "audio": "/a/0.wav", "primary": "/v/0.mp4", "audio_duration": 4.25},
        {"text": "b", "audio": "/a/1.wav", "primary": "/v/1.mp4"}
    ]})");
    REQUIRE(m.scenes.size() == 2);
    CHECK(m.scenes[0].audio.duration == 4250000);
    CHECK(m.scenes[1].audio.duration == 0);

    CHECK_THROWS_AS(parseSceneManifest(R"({"scenes": [{"primary": "/v/0.mp4", "audio_duration": "long"}]})"),
                    ConfigurationError);
    CHECK_THROWS_AS(parseSceneManifest(R"({"scenes": [{"primary": "/v/0.mp4", "audio_duration": 0}]})"),
                    ConfigurationError);
}
