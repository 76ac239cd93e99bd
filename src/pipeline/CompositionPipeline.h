#pragma once

#include "Scene.h"
#include "Selection.h"
#include "config/ComposerConfig.h"
#include "timeline/FinalTimeline.h"
#include "timeline/SceneTimeline.h"
#include "video/MediaProbe.h"
#include "video/MediaTool.h"
#include <functional>
#include <string>
#include <vector>

namespace SceneStitch {

struct CompositionResult {
    std::string outputPath;
    std::string runDir;                // this run's intermediates; removed unless kept
    FinalTimeline timeline;
    size_t avatarScene = kNoAvatarSlot;
};

// Per-scene outcome of the audio and timing stages
struct ScenePlan {
    size_t sceneIndex = 0;
    MediaTime sourceDuration = 0;      // narration before trimming
    NormalizedAudio audio;
    SceneTimeline timeline;
};

// Dry run: what a composition would produce, without rendering
struct CompositionPlan {
    std::vector<ScenePlan> scenes;
    size_t avatarScene = kNoAvatarSlot;
    FinalTimeline timeline;            // clip durations are the scene totals
};

/**
 * @brief Runs a full composition: normalize, split, render per scene in
 * parallel, then stitch and export in scene order
 *
 * All-or-nothing: any scene failure aborts the run after the in-flight scenes
 * finish, and no output file is written.
 */
class CompositionPipeline {
public:
    CompositionPipeline(const ComposerConfig& config, MediaTool& tool, const MediaProbe& probe);

    /**
     * @param rng Drives avatar slot and transition choice
     * @throws CompositionError subclasses; see CompositionErrors.h
     */
    CompositionResult run(const std::vector<Scene>& scenes, const std::string& outputPath, SelectionRng& rng);

    CompositionPlan plan(const std::vector<Scene>& scenes, SelectionRng& rng);

    // Called with overall progress in [0, 1], possibly from worker threads
    void setProgressCallback(std::function<void(double)> callback);

    // Remove scene_* files directly inside workDir. Nothing else is touched.
    // Returns the number of files removed.
    static size_t cleanWorkDir(const std::string& workDir);

    // Create a fresh run_<pid>_<n> directory under workRoot. Concurrent runs,
    // in this process or another, never share one.
    static std::string makeRunDir(const std::string& workRoot);

private:
    const ComposerConfig& m_config;
    MediaTool& m_tool;
    const MediaProbe& m_probe;
    std::function<void(double)> m_progressCallback;

    // Scenes sorted by index; throws MissingAssetError on gaps or missing inputs
    std::vector<Scene> validateScenes(const std::vector<Scene>& scenes) const;

    // Avatar slot for this run, or kNoAvatarSlot. Throws MissingAvatarAsset
    // when the avatar is required but absent.
    size_t resolveAvatarSlot(size_t sceneCount, SelectionRng& rng) const;

    void reportProgress(double progress) const;

    // Remove this run's scene files and then the run directory itself
    void discardRunDir(const std::string& runDir) const;
};

} // namespace SceneStitch
