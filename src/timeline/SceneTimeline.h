#pragma once

#include "MediaTime.h"
#include <cstddef>

namespace SceneStitch {

/**
 * @brief Exact A/B split of one scene
 *
 * halfA = [0, splitPoint), halfB = [splitPoint, total). The two lengths sum to
 * the total exactly and differ by at most one microsecond.
 */
struct SceneTimeline {
    size_t sceneIndex = 0;
    MediaTime total = 0;
    TimeSpan halfA;
    TimeSpan halfB;
    bool secondaryFallback = false;  // halfB reuses the primary source

    MediaTime splitPoint() const { return halfA.end; }
};

class SceneTimelineBuilder {
public:
    /**
     * @brief Split a scene's normalized duration in two
     * @param sceneIndex Scene being planned
     * @param duration NormalizedAudio duration
     * @param hasSecondary Whether a secondary source exists; both halves are
     *        computed either way
     * @throws TimingViolationError if duration is too short to split or the
     *         spans fail the exactness check
     */
    SceneTimeline build(size_t sceneIndex, MediaTime duration, bool hasSecondary) const;

    // Throws TimingViolationError unless halfA + halfB == total with no gap or overlap.
    static void verify(const SceneTimeline& timeline);
};

} // namespace SceneStitch
