#pragma once

#include "config/ComposerConfig.h"
#include "video/TransitionLibrary.h"
#include <cstddef>
#include <limits>
#include <random>
#include <vector>

namespace SceneStitch {

// Random source for every randomized choice of a run (avatar slot,
// transition kinds). Owned by the caller and passed in explicitly so a seed
// reproduces a run.
using SelectionRng = std::mt19937_64;

constexpr size_t kNoAvatarSlot = std::numeric_limits<size_t>::max();

// Seeded from config.seed when set, otherwise from std::random_device.
SelectionRng makeSelectionRng(const ComposerConfig& config);

/**
 * @brief Pick the scene that carries the avatar clip
 *
 * Uniform over [avatarExcludeLeading, sceneCount - 1 - avatarExcludeTrailing],
 * so the hook and outro scenes are never chosen.
 *
 * @return Scene index, or kNoAvatarSlot when the eligible range is empty
 */
size_t pickAvatarSlot(size_t sceneCount, const ComposerConfig& config, SelectionRng& rng);

// Uniform pick from the configured transition set. The set must not be empty.
TransitionKind pickTransitionKind(const std::vector<TransitionKind>& kinds, SelectionRng& rng);

} // namespace SceneStitch
