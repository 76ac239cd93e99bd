#pragma once

#include "config/ComposerConfig.h"
#include "pipeline/Scene.h"
#include <vector>

namespace SceneStitch {

/**
 * @brief Trims leading/trailing silence from a scene's narration and applies fixed gain
 *
 * The emitted duration is never longer than the input's; every later stage
 * times video against it.
 */
class ClipNormalizer {
public:
    explicit ClipNormalizer(const ComposerConfig& config);

    /**
     * @brief Normalize one scene's audio
     * @param sceneIndex Scene the audio belongs to (for error reporting)
     * @param audio Decoded samples, or a sourcePath to decode first
     * @throws AudioDecodeError if the input cannot be decoded or holds nothing audible
     * @throws TimingViolationError if the result outlasts a non-zero audio.duration
     */
    NormalizedAudio normalize(size_t sceneIndex, const AudioAsset& audio) const;

private:
    double m_gainFactor;
    double m_thresholdRms;   // linear RMS equivalent of the dBFS threshold
    int m_windowMs;

    NormalizedAudio process(size_t sceneIndex, const std::vector<float>& samples, int sampleRate) const;

    // Silence trim never lengthens: compare against the reported duration, if any
    void checkAgainstSource(size_t sceneIndex, const AudioAsset& audio, const NormalizedAudio& out) const;

    // Mean-square energy of samples[start, start + length)
    double calculateEnergy(const std::vector<float>& samples, size_t start, size_t length) const;
};

} // namespace SceneStitch
