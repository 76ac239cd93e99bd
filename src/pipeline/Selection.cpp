#include "Selection.h"
#include "CompositionErrors.h"

namespace SceneStitch {

SelectionRng makeSelectionRng(const ComposerConfig& config) {
    if (config.hasSeed) {
        return SelectionRng(config.seed);
    }
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return SelectionRng(seq);
}

size_t pickAvatarSlot(size_t sceneCount, const ComposerConfig& config, SelectionRng& rng) {
    const size_t lead = static_cast<size_t>(config.avatarExcludeLeading);
    const size_t trail = static_cast<size_t>(config.avatarExcludeTrailing);
    if (sceneCount < lead + trail + 1) {
        return kNoAvatarSlot;
    }
    const size_t last = sceneCount - 1 - trail;
    std::uniform_int_distribution<size_t> dist(lead, last);
    return dist(rng);
}

TransitionKind pickTransitionKind(const std::vector<TransitionKind>& kinds, SelectionRng& rng) {
    if (kinds.empty()) {
        throw ConfigurationError("transition set is empty");
    }
    std::uniform_int_distribution<size_t> dist(0, kinds.size() - 1);
    return kinds[dist(rng)];
}

} // namespace SceneStitch
