#include "TransitionStitcher.h"
#include "pipeline/CompositionErrors.h"
#include "tracing/Tracing.h"
#include <algorithm>

namespace SceneStitch {

TransitionStitcher::TransitionStitcher(const ComposerConfig& config)
    : m_kinds(config.transitionKinds)
    , m_overlap(config.transitionOverlap)
{
}

FinalTimeline TransitionStitcher::stitch(std::vector<RenderedClip> clips, SelectionRng& rng) const {
    TRACE_SCOPE("TransitionStitcher::stitch");
    if (clips.empty()) {
        throw MissingAssetError("no rendered clips to stitch");
    }

    std::sort(clips.begin(), clips.end(), [](const RenderedClip& a, const RenderedClip& b) {
        return a.sceneIndex < b.sceneIndex;
    });
    for (size_t i = 0; i < clips.size(); ++i) {
        if (clips[i].sceneIndex != i) {
            throw MissingAssetError("rendered clip for scene " + std::to_string(i) + " is missing");
        }
    }

    FinalTimeline timeline;
    timeline.overlap = m_overlap;

    if (clips.size() == 1) {
        timeline.clips = std::move(clips);
        return timeline;
    }

    auto shortest = std::min_element(clips.begin(), clips.end(), [](const RenderedClip& a, const RenderedClip& b) {
        return a.duration < b.duration;
    });
    if (m_overlap >= shortest->duration) {
        throw TransitionOverlapError("transition overlap " + formatSeconds(m_overlap)
                                     + "s is not shorter than scene " + std::to_string(shortest->sceneIndex)
                                     + " (" + formatSeconds(shortest->duration) + "s)");
    }

    MediaTime elapsed = 0;
    for (size_t i = 0; i + 1 < clips.size(); ++i) {
        elapsed += clips[i].duration;
        Transition t;
        t.fromScene = clips[i].sceneIndex;
        t.toScene = clips[i + 1].sceneIndex;
        t.kind = pickTransitionKind(m_kinds, rng);
        t.overlap = m_overlap;
        t.offset = elapsed - static_cast<MediaTime>(i + 1) * m_overlap;
        timeline.transitions.push_back(t);
    }

    timeline.clips = std::move(clips);
    return timeline;
}

} // namespace SceneStitch
