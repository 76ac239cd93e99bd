#include "ClipNormalizer.h"
#include "AudioDecoder.h"
#include "pipeline/CompositionErrors.h"
#include "tracing/Tracing.h"
#include <algorithm>
#include <cmath>

namespace SceneStitch {

ClipNormalizer::ClipNormalizer(const ComposerConfig& config)
    : m_gainFactor(config.gainFactor)
    , m_thresholdRms(std::pow(10.0, config.silenceThresholdDb / 20.0))
    , m_windowMs(config.silenceWindowMs)
{
}

NormalizedAudio ClipNormalizer::normalize(size_t sceneIndex, const AudioAsset& audio) const {
    TRACE_FUNC();
    if (!audio.samples.empty()) {
        if (audio.sampleRate <= 0) {
            throw AudioDecodeError(sceneIndex, "invalid sample rate " + std::to_string(audio.sampleRate));
        }
        NormalizedAudio out = process(sceneIndex, audio.samples, audio.sampleRate);
        checkAgainstSource(sceneIndex, audio, out);
        return out;
    }

    if (audio.sourcePath.empty()) {
        throw AudioDecodeError(sceneIndex, "no samples and no source file");
    }

    AudioDecoder decoder;
    AudioDecoder::AudioData decoded;
    try {
        decoded = decoder.decode(audio.sourcePath);
    } catch (const std::exception& e) {
        throw AudioDecodeError(sceneIndex, e.what());
    }
    NormalizedAudio out = process(sceneIndex, decoded.samples, decoded.sampleRate);
    checkAgainstSource(sceneIndex, audio, out);
    return out;
}

void ClipNormalizer::checkAgainstSource(size_t sceneIndex, const AudioAsset& audio, const NormalizedAudio& out) const {
    if (audio.duration <= 0) {
        return;
    }
    // One sample of slack for durations the voice source rounded
    const MediaTime slack = samplesToMediaTime(1, out.sampleRate);
    if (out.duration > audio.duration + slack) {
        throw TimingViolationError("scene " + std::to_string(sceneIndex) + ": normalized narration is "
                                   + formatSeconds(out.duration) + "s, longer than the "
                                   + formatSeconds(audio.duration) + "s the voice source reported");
    }
}

NormalizedAudio ClipNormalizer::process(size_t sceneIndex, const std::vector<float>& samples, int sampleRate) const {
    const size_t windowSize = std::max<size_t>(1, static_cast<size_t>(sampleRate) * m_windowMs / 1000);
    const double thresholdEnergy = m_thresholdRms * m_thresholdRms;
    const size_t total = samples.size();

    // Leading silence: whole windows below threshold
    size_t first = 0;
    while (first < total) {
        size_t length = std::min(windowSize, total - first);
        if (calculateEnergy(samples, first, length) >= thresholdEnergy) break;
        first += length;
    }

    if (first >= total) {
        throw AudioDecodeError(sceneIndex, "no audible content above threshold");
    }

    // Trailing silence, walking windows back from the end
    size_t last = total;
    while (last > first) {
        size_t length = std::min(windowSize, last - first);
        if (calculateEnergy(samples, last - length, length) >= thresholdEnergy) break;
        last -= length;
    }

    NormalizedAudio out;
    out.sampleRate = sampleRate;
    out.gainApplied = m_gainFactor;
    out.trimmedLeading = first;
    out.trimmedTrailing = total - last;
    out.samples.reserve(last - first);

    // Clamp, never wrap
    for (size_t i = first; i < last; ++i) {
        float v = static_cast<float>(samples[i] * m_gainFactor);
        out.samples.push_back(std::max(-1.0f, std::min(1.0f, v)));
    }

    out.duration = samplesToMediaTime(out.samples.size(), sampleRate);
    return out;
}

double ClipNormalizer::calculateEnergy(const std::vector<float>& samples, size_t start, size_t length) const {
    if (length == 0) {
        return 0.0;
    }
    double energy = 0.0;
    size_t end = std::min(start + length, samples.size());
    for (size_t i = start; i < end; ++i) {
        energy += static_cast<double>(samples[i]) * samples[i];
    }
    return energy / length;
}

} // namespace SceneStitch
