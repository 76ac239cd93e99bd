#include "CompositionPipeline.h"
#include "CompositionErrors.h"
#include "WorkerPool.h"
#include "audio/ClipNormalizer.h"
#include "audio/WavWriter.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "video/Exporter.h"
#include "video/SceneRenderer.h"
#include "video/TransitionStitcher.h"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace SceneStitch {

CompositionPipeline::CompositionPipeline(const ComposerConfig& config, MediaTool& tool, const MediaProbe& probe)
    : m_config(config)
    , m_tool(tool)
    , m_probe(probe)
{
}

void CompositionPipeline::setProgressCallback(std::function<void(double)> callback) {
    m_progressCallback = std::move(callback);
}

void CompositionPipeline::reportProgress(double progress) const {
    if (m_progressCallback) {
        m_progressCallback(progress);
    }
}

std::vector<Scene> CompositionPipeline::validateScenes(const std::vector<Scene>& scenes) const {
    if (scenes.empty()) {
        throw MissingAssetError("no scenes to compose");
    }
    std::vector<Scene> sorted = scenes;
    std::sort(sorted.begin(), sorted.end(), [](const Scene& a, const Scene& b) {
        return a.index < b.index;
    });
    for (size_t i = 0; i < sorted.size(); ++i) {
        const Scene& s = sorted[i];
        if (s.index != i) {
            throw MissingAssetError("scene indices must be contiguous from 0; expected scene "
                                    + std::to_string(i) + ", found " + std::to_string(s.index));
        }
        if (s.primarySource.empty()) {
            throw MissingAssetError("scene " + std::to_string(i) + " has no primary source");
        }
        if (s.audio.samples.empty() && s.audio.sourcePath.empty()) {
            throw MissingAssetError("scene " + std::to_string(i) + " has no narration audio");
        }
    }
    return sorted;
}

size_t CompositionPipeline::resolveAvatarSlot(size_t sceneCount, SelectionRng& rng) const {
    auto& logger = DebugLogger::getInstance();
    if (m_config.avatarPath.empty() && !m_config.avatarRequired) {
        return kNoAvatarSlot;
    }

    size_t slot = pickAvatarSlot(sceneCount, m_config, rng);
    if (slot == kNoAvatarSlot) {
        logger.log("[Pipeline] " + std::to_string(sceneCount) + " scene(s): no scene eligible for the avatar");
        return kNoAvatarSlot;
    }

    std::error_code ec;
    if (m_config.avatarPath.empty() || !fs::exists(m_config.avatarPath, ec)) {
        if (m_config.avatarRequired) {
            throw MissingAvatarAsset(m_config.avatarPath);
        }
        logger.log("[Pipeline] avatar clip not found (" + m_config.avatarPath + "), skipping avatar injection");
        return kNoAvatarSlot;
    }
    logger.log("[Pipeline] avatar slot: scene " + std::to_string(slot));
    return slot;
}

size_t CompositionPipeline::cleanWorkDir(const std::string& workDir) {
    std::error_code ec;
    if (workDir.empty() || !fs::is_directory(workDir, ec)) {
        return 0;
    }
    size_t removed = 0;
    for (fs::directory_iterator it(workDir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) continue;
        const std::string name = it->path().filename().string();
        if (name.rfind("scene_", 0) != 0) continue;
        if (fs::remove(it->path(), entryEc)) {
            ++removed;
        }
    }
    return removed;
}

std::string CompositionPipeline::makeRunDir(const std::string& workRoot) {
    static std::atomic<unsigned> counter{0};
#ifdef _WIN32
    const long pid = static_cast<long>(_getpid());
#else
    const long pid = static_cast<long>(getpid());
#endif
    std::error_code ec;
    fs::create_directories(workRoot, ec);
    if (ec) {
        throw ConfigurationError("could not create work directory " + workRoot + ": " + ec.message());
    }
    // A leftover directory from an earlier process with the same pid is skipped
    for (int attempt = 0; attempt < 1000; ++attempt) {
        fs::path candidate = fs::path(workRoot) / ("run_" + std::to_string(pid) + "_" + std::to_string(counter++));
        if (fs::create_directory(candidate, ec)) {
            return candidate.string();
        }
        if (ec) {
            throw ConfigurationError("could not create run directory " + candidate.string() + ": " + ec.message());
        }
    }
    throw ConfigurationError("no free run directory under " + workRoot);
}

void CompositionPipeline::discardRunDir(const std::string& runDir) const {
    auto& logger = DebugLogger::getInstance();
    size_t removed = cleanWorkDir(runDir);
    logger.log("[Pipeline] removed " + std::to_string(removed) + " intermediate file(s)");
    std::error_code ec;
    if (fs::is_empty(runDir, ec) && !ec) {
        if (!fs::remove(runDir, ec) || ec) {
            logger.log("[Pipeline] could not remove " + runDir + ": " + ec.message());
        }
    } else {
        logger.log("[Pipeline] leaving non-scene files in " + runDir);
    }
}

CompositionPlan CompositionPipeline::plan(const std::vector<Scene>& scenes, SelectionRng& rng) {
    TRACE_SCOPE("CompositionPipeline::plan");
    std::vector<Scene> ordered = validateScenes(scenes);

    CompositionPlan result;
    result.avatarScene = resolveAvatarSlot(ordered.size(), rng);

    ClipNormalizer normalizer(m_config);
    SceneTimelineBuilder builder;
    std::vector<RenderedClip> clips;
    for (const Scene& scene : ordered) {
        ScenePlan sp;
        sp.sceneIndex = scene.index;
        sp.audio = normalizer.normalize(scene.index, scene.audio);
        sp.sourceDuration = sp.audio.duration
            + samplesToMediaTime(sp.audio.trimmedLeading + sp.audio.trimmedTrailing, sp.audio.sampleRate);
        sp.timeline = builder.build(scene.index, sp.audio.duration, scene.hasSecondary());

        RenderedClip clip;
        clip.sceneIndex = scene.index;
        clip.duration = sp.timeline.total;
        clip.hasAvatar = scene.index == result.avatarScene;
        clips.push_back(clip);
        result.scenes.push_back(std::move(sp));
    }

    TransitionStitcher stitcher(m_config);
    result.timeline = stitcher.stitch(std::move(clips), rng);
    return result;
}

CompositionResult CompositionPipeline::run(const std::vector<Scene>& scenes, const std::string& outputPath,
                                           SelectionRng& rng) {
    TRACE_SCOPE("CompositionPipeline::run");
    auto& logger = DebugLogger::getInstance();

    if (outputPath.empty()) {
        throw ConfigurationError("no output path given");
    }
    std::vector<Scene> ordered = validateScenes(scenes);
    const size_t sceneCount = ordered.size();

    CompositionResult result;
    result.outputPath = outputPath;
    result.avatarScene = resolveAvatarSlot(sceneCount, rng);

    const std::string workDir = makeRunDir(m_config.resolveWorkDir());
    result.runDir = workDir;

    logger.log("[Pipeline] composing " + std::to_string(sceneCount) + " scene(s) in " + workDir);
    reportProgress(0.0);

    ClipNormalizer normalizer(m_config);
    SceneTimelineBuilder builder;
    SceneRenderer renderer(m_config, m_tool, m_probe, workDir);

    std::vector<RenderedClip> clips;
    std::mutex clipsMutex;
    std::atomic<size_t> finished{0};

    try {
        WorkerPool pool(WorkerPool::resolveWorkerCount(m_config.workerCount, sceneCount));
        logger.log("[Pipeline] rendering on " + std::to_string(pool.size()) + " worker(s)");

        for (const Scene& scene : ordered) {
            const std::string avatar = scene.index == result.avatarScene ? m_config.avatarPath : std::string();
            pool.submit([&, avatar, scene]() {
                TRACE_SCOPE("scene job");
                NormalizedAudio audio = normalizer.normalize(scene.index, scene.audio);

                const std::string wavPath =
                    (fs::path(workDir) / ("scene_" + std::to_string(scene.index) + "_audio.wav")).string();
                std::string wavError;
                if (!writeWav(wavPath, audio.samples, audio.sampleRate, wavError)) {
                    throw CompositionError("scene " + std::to_string(scene.index) + ": " + wavError);
                }

                SceneTimeline timeline = builder.build(scene.index, audio.duration, scene.hasSecondary());
                RenderedClip clip = renderer.render(scene, timeline, wavPath, avatar);

                {
                    std::lock_guard<std::mutex> lock(clipsMutex);
                    clips.push_back(clip);
                }
                size_t done = ++finished;
                reportProgress(0.8 * static_cast<double>(done) / static_cast<double>(sceneCount));
            });
        }
        pool.wait();

        TransitionStitcher stitcher(m_config);
        result.timeline = stitcher.stitch(std::move(clips), rng);
        reportProgress(0.85);

        Exporter exporter(m_config, m_tool);
        exporter.exportTimeline(result.timeline, outputPath);
    } catch (const std::exception& e) {
        logger.log(std::string("[Pipeline] run failed: ") + e.what());
        if (!m_config.keepIntermediates) {
            discardRunDir(workDir);
        }
        throw;
    }

    if (!m_config.keepIntermediates) {
        discardRunDir(workDir);
    }
    reportProgress(1.0);
    logger.log("[Pipeline] done: " + outputPath + " (" + formatSeconds(result.timeline.totalDuration()) + "s)");
    return result;
}

} // namespace SceneStitch
