#include <catch2/catch_test_macros.hpp>
#include "pipeline/CompositionErrors.h"
#include "video/TransitionStitcher.h"
#include <algorithm>
#include <random>

using namespace SceneStitch;

static std::vector<RenderedClip> makeClips(const std::vector<MediaTime>& durations) {
    std::vector<RenderedClip> clips;
    for (size_t i = 0; i < durations.size(); ++i) {
        RenderedClip c;
        c.sceneIndex = i;
        c.path = "scene_" + std::to_string(i) + ".mp4";
        c.duration = durations[i];
        clips.push_back(c);
    }
    return clips;
}

TEST_CASE("Total duration subtracts one overlap per join", "[stitcher]") {
    ComposerConfig cfg;
    TransitionStitcher stitcher(cfg);
    SelectionRng rng(1);

    FinalTimeline t = stitcher.stitch(makeClips({4000000, 6000000, 5000000}), rng);
    REQUIRE(t.transitions.size() == 2);
    CHECK(t.totalDuration() == 14000000);
    CHECK(t.transitions[0].offset == 3500000);
    CHECK(t.transitions[1].offset == 9000000);
    CHECK(t.transitions[0].fromScene == 0);
    CHECK(t.transitions[0].toScene == 1);
    CHECK(t.transitions[1].fromScene == 1);
    CHECK(t.transitions[1].toScene == 2);
}

TEST_CASE("Duration identity holds for any clip count", "[stitcher][property]") {
    ComposerConfig cfg;
    TransitionStitcher stitcher(cfg);
    SelectionRng rng(2024);
    std::uniform_int_distribution<MediaTime> dist(cfg.transitionOverlap + 1, 20 * kTimeBase);

    for (size_t n = 2; n <= 12; ++n) {
        std::vector<MediaTime> durations;
        MediaTime sum = 0;
        for (size_t i = 0; i < n; ++i) {
            durations.push_back(dist(rng));
            sum += durations.back();
        }
        FinalTimeline t = stitcher.stitch(makeClips(durations), rng);
        REQUIRE(t.transitions.size() == n - 1);
        REQUIRE(t.totalDuration() == sum - static_cast<MediaTime>(n - 1) * cfg.transitionOverlap);
        for (size_t i = 1; i < t.transitions.size(); ++i) {
            REQUIRE(t.transitions[i].offset > t.transitions[i - 1].offset);
        }
    }
}

TEST_CASE("Clips are consumed in scene order regardless of arrival order", "[stitcher]") {
    ComposerConfig cfg;
    TransitionStitcher stitcher(cfg);
    SelectionRng rng(9);
    std::vector<RenderedClip> clips = makeClips({3000000, 2000000, 4000000, 2500000, 1000000});

    std::mt19937 shuffler(77);
    for (int round = 0; round < 20; ++round) {
        std::shuffle(clips.begin(), clips.end(), shuffler);
        FinalTimeline t = stitcher.stitch(clips, rng);
        for (size_t i = 0; i < t.clips.size(); ++i) {
            REQUIRE(t.clips[i].sceneIndex == i);
        }
        REQUIRE(t.totalDuration() == 12500000 - 4 * 500000);
    }
}

TEST_CASE("Overlap not shorter than every clip is rejected", "[stitcher]") {
    ComposerConfig cfg;
    TransitionStitcher stitcher(cfg);
    SelectionRng rng(4);

    CHECK_THROWS_AS(stitcher.stitch(makeClips({4000000, 500000, 5000000}), rng), TransitionOverlapError);
    CHECK_THROWS_AS(stitcher.stitch(makeClips({4000000, 400000}), rng), TransitionOverlapError);
    CHECK_NOTHROW(stitcher.stitch(makeClips({4000000, 500001}), rng));
}

TEST_CASE("A single clip needs no transitions", "[stitcher]") {
    ComposerConfig cfg;
    TransitionStitcher stitcher(cfg);
    SelectionRng rng(4);

    // Even a clip shorter than the overlap is fine when nothing is joined
    FinalTimeline t = stitcher.stitch(makeClips({300000}), rng);
    CHECK(t.transitions.empty());
    CHECK(t.totalDuration() == 300000);
}

TEST_CASE("Missing or duplicate scenes cannot be stitched", "[stitcher]") {
    ComposerConfig cfg;
    TransitionStitcher stitcher(cfg);
    SelectionRng rng(4);

    CHECK_THROWS_AS(stitcher.stitch({}, rng), MissingAssetError);

    std::vector<RenderedClip> gap = makeClips({2000000, 2000000, 2000000});
    gap.erase(gap.begin() + 1);
    CHECK_THROWS_AS(stitcher.stitch(gap, rng), MissingAssetError);

    std::vector<RenderedClip> dup = makeClips({2000000, 2000000});
    dup[1].sceneIndex = 0;
    CHECK_THROWS_AS(stitcher.stitch(dup, rng), MissingAssetError);
}

TEST_CASE("Transition kinds come from the configured set", "[stitcher]") {
    ComposerConfig cfg;
    cfg.transitionKinds = {TransitionKind::Slide};
    TransitionStitcher stitcher(cfg);
    SelectionRng rng(11);
    FinalTimeline t = stitcher.stitch(makeClips({2000000, 2000000, 2000000, 2000000}), rng);
    for (const auto& tr : t.transitions) {
        CHECK(tr.kind == TransitionKind::Slide);
        CHECK(tr.overlap == cfg.transitionOverlap);
    }
}
