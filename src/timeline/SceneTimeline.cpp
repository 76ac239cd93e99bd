#include "SceneTimeline.h"
#include "pipeline/CompositionErrors.h"
#include <string>

namespace SceneStitch {

SceneTimeline SceneTimelineBuilder::build(size_t sceneIndex, MediaTime duration, bool hasSecondary) const {
    if (duration < 2) {
        throw TimingViolationError("scene " + std::to_string(sceneIndex) +
                                   ": duration " + formatSeconds(duration) + "s cannot be split");
    }

    SceneTimeline timeline;
    timeline.sceneIndex = sceneIndex;
    timeline.total = duration;
    timeline.secondaryFallback = !hasSecondary;

    // Round half up: an odd total gives halfA the extra microsecond
    const MediaTime split = (duration + 1) / 2;
    timeline.halfA = {0, split};
    timeline.halfB = {split, duration};

    verify(timeline);
    return timeline;
}

void SceneTimelineBuilder::verify(const SceneTimeline& timeline) {
    const TimeSpan& a = timeline.halfA;
    const TimeSpan& b = timeline.halfB;
    const std::string scene = "scene " + std::to_string(timeline.sceneIndex);

    if (a.start != 0 || b.end != timeline.total) {
        throw TimingViolationError(scene + ": spans do not cover [0, total)");
    }
    if (a.end != b.start) {
        throw TimingViolationError(scene + ": gap or overlap at split point");
    }
    if (a.length() <= 0 || b.length() <= 0) {
        throw TimingViolationError(scene + ": empty half");
    }
    if (a.length() + b.length() != timeline.total) {
        throw TimingViolationError(scene + ": half lengths do not sum to total");
    }
    const MediaTime diff = a.length() - b.length();
    if (diff < 0 || diff > 1) {
        throw TimingViolationError(scene + ": halves differ by more than one time unit");
    }
}

} // namespace SceneStitch
