#pragma once

#include "timeline/MediaTime.h"
#include <string>
#include <vector>

namespace SceneStitch {

/**
 * @brief Raw stock or avatar footage. Read-only; only ever re-encoded into derived clips.
 */
struct VideoAsset {
    std::string path;
    MediaTime nativeDuration = 0;   // 0 = not probed yet
    int width = 0;
    int height = 0;

    bool empty() const { return path.empty(); }
};

/**
 * @brief Narration clip as delivered by the voice source
 *
 * Either carries decoded mono samples, or a sourcePath that the normalizer
 * decodes on the worker thread.
 */
struct AudioAsset {
    std::string sourcePath;
    std::vector<float> samples;   // mono, [-1, 1]
    int sampleRate = 0;
    MediaTime duration = 0;       // as reported by the voice source; 0 = unknown
};

/**
 * @brief Silence-trimmed, gain-adjusted narration. Its duration drives every downstream stage.
 */
struct NormalizedAudio {
    std::vector<float> samples;
    int sampleRate = 0;
    MediaTime duration = 0;
    double gainApplied = 1.0;
    size_t trimmedLeading = 0;    // samples stripped from the head
    size_t trimmedTrailing = 0;   // samples stripped from the tail
};

/**
 * @brief One narrated segment of the final video
 *
 * index defines render and playback order; a run's scenes are contiguous from 0.
 */
struct Scene {
    size_t index = 0;
    std::string narrationText;
    std::string visualKeyword1;
    std::string visualKeyword2;
    VideoAsset primarySource;
    VideoAsset secondarySource;   // empty = reuse primary
    AudioAsset audio;

    bool hasSecondary() const { return !secondarySource.empty(); }
};

/**
 * @brief A finished per-scene clip, owned by the stitcher once emitted
 */
struct RenderedClip {
    size_t sceneIndex = 0;
    std::string path;
    MediaTime duration = 0;
    bool hasAvatar = false;
};

} // namespace SceneStitch
