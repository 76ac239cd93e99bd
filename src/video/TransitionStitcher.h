#pragma once

#include "config/ComposerConfig.h"
#include "pipeline/Selection.h"
#include "timeline/FinalTimeline.h"
#include <vector>

namespace SceneStitch {

// Orders rendered clips and plans the transition between each adjacent pair.
// Produces a descriptor only; nothing is encoded here.
class TransitionStitcher {
public:
    explicit TransitionStitcher(const ComposerConfig& config);

    /**
     * @brief Build the final timeline
     * @param clips Rendered clips in any order (e.g. worker completion order)
     * @param rng Source for the per-join transition kind
     * @throws TransitionOverlapError if the overlap is not shorter than every clip
     * @throws MissingAssetError if clips is empty or scene indices are not contiguous from 0
     */
    FinalTimeline stitch(std::vector<RenderedClip> clips, SelectionRng& rng) const;

private:
    std::vector<TransitionKind> m_kinds;
    MediaTime m_overlap;
};

} // namespace SceneStitch
