#include <catch2/catch_test_macros.hpp>
#include "video/TransitionLibrary.h"

using namespace SceneStitch;

TEST_CASE("TransitionLibrary maps each kind to an xfade effect", "[transition]") {
    TransitionLibrary lib;
    REQUIRE(lib.getTransitions().size() == 3);

    const TransitionEffect* fade = lib.findByKind(TransitionKind::CrossFade);
    REQUIRE(fade != nullptr);
    CHECK(fade->xfadeName == "fade");
    CHECK(fade->name == "fade");

    CHECK(lib.findByKind(TransitionKind::Wipe)->xfadeName == "wipeleft");
    CHECK(lib.findByKind(TransitionKind::Slide)->xfadeName == "slideleft");
}

TEST_CASE("findByName accepts aliases and ignores case and padding", "[transition]") {
    TransitionLibrary lib;
    for (const char* name : {"fade", "crossfade", "Cross-Fade", " dissolve ", "FADE"}) {
        const TransitionEffect* t = lib.findByName(name);
        REQUIRE(t != nullptr);
        CHECK(t->kind == TransitionKind::CrossFade);
    }
    REQUIRE(lib.findByName("wipeleft") != nullptr);
    CHECK(lib.findByName("wipeleft")->kind == TransitionKind::Wipe);
    CHECK(lib.findByName("slide")->kind == TransitionKind::Slide);
    CHECK(lib.findByName("gltransition") == nullptr);
}

TEST_CASE("Filter snippets use fixed-point seconds", "[transition]") {
    TransitionLibrary lib;
    CHECK(lib.buildXfadeFilter(TransitionKind::Wipe, 500000, 3500000)
          == "xfade=transition=wipeleft:duration=0.500000:offset=3.500000");
    CHECK(lib.buildXfadeFilter(TransitionKind::CrossFade, 20, 0)
          == "xfade=transition=fade:duration=0.000020:offset=0.000000");
    CHECK(lib.buildAcrossfadeFilter(500000) == "acrossfade=d=0.500000");
    CHECK(std::string(TransitionLibrary::kindName(TransitionKind::Slide)) == "slide");
}
