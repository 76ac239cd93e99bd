#pragma once

#include "timeline/MediaTime.h"
#include <string>
#include <vector>

namespace SceneStitch {

enum class TransitionKind {
    CrossFade,
    Wipe,
    Slide
};

// One entry of the fixed transition set, mapped onto an FFmpeg xfade effect.
struct TransitionEffect {
    TransitionKind kind;
    std::string name;       // e.g. "fade", "wipe", "slide"
    std::string xfadeName;  // xfade transition= value
};

// Library of the transitions the stitcher may choose between, and builders for
// the filter snippets that join two clips with one of them.
class TransitionLibrary {
public:
    TransitionLibrary();

    const std::vector<TransitionEffect>& getTransitions() const { return m_transitions; }

    // Lookup by name ("fade", "crossfade", "wipe", "slide") or xfade name.
    // Returns nullptr if not found.
    const TransitionEffect* findByName(const std::string& name) const;

    const TransitionEffect* findByKind(TransitionKind kind) const;

    // Example output: "xfade=transition=fade:duration=0.500000:offset=3.500000"
    std::string buildXfadeFilter(TransitionKind kind, MediaTime duration, MediaTime offset) const;

    // Audio counterpart of a video transition over the same window
    std::string buildAcrossfadeFilter(MediaTime duration) const;

    static const char* kindName(TransitionKind kind);

private:
    std::vector<TransitionEffect> m_transitions;
};

} // namespace SceneStitch
