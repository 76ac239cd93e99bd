#pragma once

#include "MediaProbe.h"
#include "MediaTool.h"
#include "config/ComposerConfig.h"
#include "pipeline/Scene.h"
#include "timeline/SceneTimeline.h"
#include <string>
#include <vector>

namespace SceneStitch {

// How a source is fitted to the span it fills
enum class FitMode {
    Trim,   // source is long enough, take it from the start
    Loop    // source is shorter, repeat it until the span is full
};

struct HalfPlan {
    std::string sourcePath;
    TimeSpan span;
    FitMode fit = FitMode::Trim;
};

/**
 * @brief Everything needed to encode one scene clip
 *
 * Stock scenes carry two halves (A then B, hard cut). Avatar scenes carry a
 * single span covering the whole scene.
 */
struct SceneRenderPlan {
    size_t sceneIndex = 0;
    bool avatar = false;
    MediaTime total = 0;
    std::vector<HalfPlan> halves;
    std::string filterComplex;
    MediaJob job;
};

/**
 * @brief Renders one scene to a portrait clip timed exactly to its narration
 *
 * Sources are probed first. A stock source that cannot be probed is replaced
 * by the other half's source once; an encode failure is retried once with the
 * primary source on both halves. Audio is never re-timed: the video is
 * fitted to the normalized narration and the clip is cut at its duration.
 */
class SceneRenderer {
public:
    /**
     * @param workDir Directory receiving scene_<index>.mp4; one path per scene so
     *        concurrent renders never share a file
     */
    SceneRenderer(const ComposerConfig& config, MediaTool& tool, const MediaProbe& probe,
                  const std::string& workDir);

    /**
     * @brief Render a scene
     * @param audioPath WAV of the scene's NormalizedAudio
     * @param avatarPath Avatar clip when this scene holds the avatar slot, else empty
     * @throws SourceDecodeError when no usable source remains
     * @throws MissingAssetError when the scene has no primary source
     * @throws TimingViolationError when the encoded clip misses the audio by more than a frame
     */
    RenderedClip render(const Scene& scene, const SceneTimeline& timeline,
                        const std::string& audioPath, const std::string& avatarPath = "") const;

    SceneRenderPlan planStockScene(const Scene& scene, const SceneTimeline& timeline,
                                   const std::string& audioPath,
                                   const VideoAsset& sourceA, const VideoAsset& sourceB) const;

    SceneRenderPlan planAvatarScene(const Scene& scene, const SceneTimeline& timeline,
                                    const std::string& audioPath, const VideoAsset& avatar) const;

    std::string clipPath(size_t sceneIndex) const;

    // Unknown native duration (0) is treated as too short
    static FitMode chooseFit(MediaTime nativeDuration, MediaTime needed);

private:
    const ComposerConfig& m_config;
    MediaTool& m_tool;
    const MediaProbe& m_probe;
    std::string m_workDir;

    // Fill in native duration and resolution; false when the probe fails
    bool probeSource(VideoAsset& asset, std::string& error) const;

    std::string scaleCropChain() const;
    void appendOutputArgs(std::vector<std::string>& args, MediaTime total, const std::string& outputPath) const;
    void verifyDuration(const SceneRenderPlan& plan) const;
};

} // namespace SceneStitch
