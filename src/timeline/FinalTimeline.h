#pragma once

#include "MediaTime.h"
#include "pipeline/Scene.h"
#include "video/TransitionLibrary.h"
#include <vector>

namespace SceneStitch {

/**
 * @brief Join between two adjacent clips
 *
 * The blend consumes `overlap` from the tail of the left clip and the head of
 * the right one, starting at `offset` on the output timeline.
 */
struct Transition {
    size_t fromScene = 0;
    size_t toScene = 0;
    TransitionKind kind = TransitionKind::CrossFade;
    MediaTime overlap = 0;
    MediaTime offset = 0;
};

/**
 * @brief Logical join plan handed to the exporter
 *
 * clips are in scene order; transitions.size() == clips.size() - 1.
 */
struct FinalTimeline {
    std::vector<RenderedClip> clips;
    std::vector<Transition> transitions;
    MediaTime overlap = 0;

    // sum(clip durations) - (N - 1) * overlap
    MediaTime totalDuration() const {
        MediaTime total = 0;
        for (const auto& c : clips) total += c.duration;
        return total - static_cast<MediaTime>(transitions.size()) * overlap;
    }
};

} // namespace SceneStitch
