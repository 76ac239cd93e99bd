#include <catch2/catch_test_macros.hpp>
#include "pipeline/CompositionErrors.h"
#include "video/SceneRenderer.h"
#include "FakeMedia.h"
#include <filesystem>

using namespace SceneStitch;
using namespace SceneStitchTest;

namespace {

size_t countOf(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

struct RenderFixture {
    TempDir dir;
    ComposerConfig cfg;
    FakeMediaProbe probe;
    FakeMediaTool tool{&probe};
    std::string primary = dir.touch("clips/primary.mp4");
    std::string secondary = dir.touch("clips/secondary.mp4");
    std::string avatar = dir.touch("avatar/loop.mp4");
    std::string audio = dir.touch("work/scene_0_audio.wav");

    RenderFixture() {
        probe.set(primary, 10 * kTimeBase);
        probe.set(secondary, 10 * kTimeBase);
        probe.set(avatar, 3 * kTimeBase, 1080, 2070);
    }

    Scene scene(bool withSecondary) const {
        Scene s;
        s.index = 0;
        s.narrationText = "Stay for the twist";
        s.primarySource.path = primary;
        if (withSecondary) s.secondarySource.path = secondary;
        return s;
    }

    SceneRenderer renderer() { return SceneRenderer(cfg, tool, probe, dir.file("work")); }
};

} // namespace

TEST_CASE("Stock scene uses primary then secondary with a hard cut", "[renderer]") {
    RenderFixture f;
    SceneTimeline tl = SceneTimelineBuilder().build(0, 4000000, true);
    RenderedClip clip = f.renderer().render(f.scene(true), tl, f.audio);

    auto jobs = f.tool.jobs();
    REQUIRE(jobs.size() == 1);
    auto inputs = inputsOf(jobs[0]);
    REQUIRE(inputs.size() == 3);
    CHECK(inputs[0] == f.primary);
    CHECK(inputs[1] == f.secondary);
    CHECK(inputs[2] == f.audio);

    std::string fc = argAfter(jobs[0], "-filter_complex");
    CHECK(countOf(fc, "trim=duration=2.000000") == 2);
    CHECK(fc.find("concat=n=2:v=1:a=0") != std::string::npos);
    CHECK(fc.find("xfade") == std::string::npos);
    CHECK(fc.find("scale=1080:1920:force_original_aspect_ratio=increase,crop=1080:1920") != std::string::npos);
    CHECK(fc.find("fps=30") != std::string::npos);
    CHECK(fc.find("drawtext=") != std::string::npos);
    CHECK(argAfter(jobs[0], "-t") == "4.000000");
    CHECK(argAfter(jobs[0], "-pix_fmt") == "yuv420p");
    CHECK(argAfter(jobs[0], "-map") == "[vout]");

    CHECK(clip.sceneIndex == 0);
    CHECK(clip.duration == tl.total);
    CHECK_FALSE(clip.hasAvatar);
    CHECK(clip.path == f.renderer().clipPath(0));
    CHECK(std::filesystem::exists(clip.path));
}

TEST_CASE("Missing secondary renders full duration from the primary", "[renderer]") {
    RenderFixture f;
    SceneTimeline tl = SceneTimelineBuilder().build(0, 5000001, false);
    RenderedClip clip = f.renderer().render(f.scene(false), tl, f.audio);

    auto jobs = f.tool.jobs();
    REQUIRE(jobs.size() == 1);
    auto inputs = inputsOf(jobs[0]);
    CHECK(inputs[0] == f.primary);
    CHECK(inputs[1] == f.primary);
    std::string fc = argAfter(jobs[0], "-filter_complex");
    CHECK(fc.find("trim=duration=2.500001") != std::string::npos);
    CHECK(fc.find("trim=duration=2.500000") != std::string::npos);
    CHECK(clip.duration == 5000001);
}

TEST_CASE("Sources shorter than their half are looped, longer ones trimmed", "[renderer]") {
    CHECK(SceneRenderer::chooseFit(1000000, 2000000) == FitMode::Loop);
    CHECK(SceneRenderer::chooseFit(2000000, 2000000) == FitMode::Trim);
    CHECK(SceneRenderer::chooseFit(9000000, 2000000) == FitMode::Trim);
    CHECK(SceneRenderer::chooseFit(0, 2000000) == FitMode::Loop);

    RenderFixture f;
    f.probe.set(f.primary, 1 * kTimeBase);
    SceneTimeline tl = SceneTimelineBuilder().build(0, 4000000, true);
    f.renderer().render(f.scene(true), tl, f.audio);

    auto job = f.tool.jobs().at(0);
    // Only the short primary carries -stream_loop, and it precedes the first input
    REQUIRE(job.args.size() > 3);
    CHECK(job.args[0] == "-stream_loop");
    CHECK(job.args[1] == "-1");
    CHECK(job.args[2] == "-i");
    CHECK(job.args[3] == f.primary);
    size_t loops = 0;
    for (const auto& a : job.args) {
        if (a == "-stream_loop") ++loops;
    }
    CHECK(loops == 1);
}

TEST_CASE("An unreadable source is replaced by the other half's source", "[renderer]") {
    SceneTimeline tl = SceneTimelineBuilder().build(0, 4000000, true);

    SECTION("secondary fails") {
        RenderFixture f;
        f.probe.setFailing(f.secondary);
        RenderedClip clip = f.renderer().render(f.scene(true), tl, f.audio);
        auto inputs = inputsOf(f.tool.jobs().at(0));
        CHECK(inputs[0] == f.primary);
        CHECK(inputs[1] == f.primary);
        CHECK(clip.duration == 4000000);
    }
    SECTION("primary fails") {
        RenderFixture f;
        f.probe.setFailing(f.primary);
        f.renderer().render(f.scene(true), tl, f.audio);
        auto inputs = inputsOf(f.tool.jobs().at(0));
        CHECK(inputs[0] == f.secondary);
        CHECK(inputs[1] == f.secondary);
    }
    SECTION("primary file missing") {
        RenderFixture f;
        std::filesystem::remove(f.primary);
        f.renderer().render(f.scene(true), tl, f.audio);
        auto inputs = inputsOf(f.tool.jobs().at(0));
        CHECK(inputs[0] == f.secondary);
    }
    SECTION("both fail") {
        RenderFixture f;
        f.probe.setFailing(f.primary);
        f.probe.setFailing(f.secondary);
        CHECK_THROWS_AS(f.renderer().render(f.scene(true), tl, f.audio), SourceDecodeError);
        CHECK(f.tool.jobs().empty());
    }
    SECTION("only source fails") {
        RenderFixture f;
        f.probe.setFailing(f.primary);
        CHECK_THROWS_AS(f.renderer().render(f.scene(false), tl, f.audio), SourceDecodeError);
    }
}

TEST_CASE("A failed encode is retried with each source alone", "[renderer]") {
    SceneTimeline tl = SceneTimelineBuilder().build(0, 4000000, true);

    SECTION("primary alone succeeds") {
        RenderFixture f;
        f.tool.failNext("scene_0", 1);
        RenderedClip clip = f.renderer().render(f.scene(true), tl, f.audio);
        auto jobs = f.tool.jobs();
        REQUIRE(jobs.size() == 2);
        auto retryInputs = inputsOf(jobs[1]);
        CHECK(retryInputs[0] == f.primary);
        CHECK(retryInputs[1] == f.primary);
        CHECK(clip.duration == 4000000);
    }
    SECTION("primary breaks mid-decode, secondary carries the scene") {
        RenderFixture f;
        f.tool.failWhenReading(f.primary, 1);
        RenderedClip clip = f.renderer().render(f.scene(true), tl, f.audio);
        auto jobs = f.tool.jobs();
        REQUIRE(jobs.size() == 3);
        auto lastInputs = inputsOf(jobs[2]);
        CHECK(lastInputs[0] == f.secondary);
        CHECK(lastInputs[1] == f.secondary);
        CHECK_FALSE(hasArg(jobs[2], "-stream_loop"));
        CHECK(clip.path == jobs[2].outputPath);
        CHECK(std::filesystem::exists(clip.path));
    }
    SECTION("every attempt fails") {
        RenderFixture f;
        f.tool.failNext("scene_0", 1, 3);
        CHECK_THROWS_AS(f.renderer().render(f.scene(true), tl, f.audio), SourceDecodeError);
        CHECK(f.tool.jobs().size() == 3);
    }
    SECTION("no alternate to retry with") {
        RenderFixture f;
        f.tool.failNext("scene_0", 1);
        CHECK_THROWS_AS(f.renderer().render(f.scene(false), tl, f.audio), SourceDecodeError);
        CHECK(f.tool.jobs().size() == 1);
    }
}

TEST_CASE("Avatar scene loops the cropped avatar clip", "[renderer][avatar]") {
    RenderFixture f;
    SceneTimeline tl = SceneTimelineBuilder().build(0, 7000000, true);
    RenderedClip clip = f.renderer().render(f.scene(true), tl, f.audio, f.avatar);

    auto jobs = f.tool.jobs();
    REQUIRE(jobs.size() == 1);
    CHECK(jobs[0].label == "scene_0_avatar");
    auto inputs = inputsOf(jobs[0]);
    REQUIRE(inputs.size() == 2);
    CHECK(inputs[0] == f.avatar);
    CHECK(jobs[0].args[0] == "-stream_loop");
    std::string fc = argAfter(jobs[0], "-filter_complex");
    CHECK(fc.find("crop=iw:ih-150:0:0") != std::string::npos);
    CHECK(fc.find("trim=duration=7.000000") != std::string::npos);
    CHECK(fc.find("concat") == std::string::npos);
    CHECK(clip.hasAvatar);
    CHECK(clip.duration == 7000000);
}

TEST_CASE("Unreadable avatar clip fails the scene", "[renderer][avatar]") {
    RenderFixture f;
    f.probe.setFailing(f.avatar);
    SceneTimeline tl = SceneTimelineBuilder().build(0, 4000000, true);
    CHECK_THROWS_AS(f.renderer().render(f.scene(true), tl, f.audio, f.avatar), SourceDecodeError);
}

TEST_CASE("Rendered duration must match the narration within one frame", "[renderer]") {
    SceneTimeline tl = SceneTimelineBuilder().build(0, 4000000, true);

    SECTION("inside one frame") {
        RenderFixture f;
        f.tool.setOutputSkew(20000);
        CHECK_NOTHROW(f.renderer().render(f.scene(true), tl, f.audio));
    }
    SECTION("more than one frame off") {
        RenderFixture f;
        f.tool.setOutputSkew(-100000);
        CHECK_THROWS_AS(f.renderer().render(f.scene(true), tl, f.audio), TimingViolationError);
    }
}

TEST_CASE("A scene without a primary source is a missing asset", "[renderer]") {
    RenderFixture f;
    Scene s = f.scene(true);
    s.primarySource.path.clear();
    SceneTimeline tl = SceneTimelineBuilder().build(0, 4000000, true);
    CHECK_THROWS_AS(f.renderer().render(s, tl, f.audio), MissingAssetError);
}
