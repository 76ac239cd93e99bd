#include "SceneRenderer.h"
#include "CaptionBuilder.h"
#include "pipeline/CompositionErrors.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include <filesystem>
#include <sstream>

namespace SceneStitch {

SceneRenderer::SceneRenderer(const ComposerConfig& config, MediaTool& tool, const MediaProbe& probe,
                             const std::string& workDir)
    : m_config(config)
    , m_tool(tool)
    , m_probe(probe)
    , m_workDir(workDir)
{
}

std::string SceneRenderer::clipPath(size_t sceneIndex) const {
    return (std::filesystem::path(m_workDir) / ("scene_" + std::to_string(sceneIndex) + ".mp4")).string();
}

FitMode SceneRenderer::chooseFit(MediaTime nativeDuration, MediaTime needed) {
    if (nativeDuration <= 0 || nativeDuration < needed) {
        return FitMode::Loop;
    }
    return FitMode::Trim;
}

bool SceneRenderer::probeSource(VideoAsset& asset, std::string& error) const {
    if (asset.path.empty()) {
        error = "no source path";
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::exists(asset.path, ec)) {
        error = "file not found";
        return false;
    }
    try {
        VideoInfo info = m_probe.probe(asset.path);
        asset.nativeDuration = info.duration;
        asset.width = info.width;
        asset.height = info.height;
        return true;
    } catch (const SourceDecodeError& e) {
        error = e.what();
        return false;
    }
}

std::string SceneRenderer::scaleCropChain() const {
    std::ostringstream oss;
    oss << "scale=" << m_config.frameWidth << ":" << m_config.frameHeight
        << ":force_original_aspect_ratio=increase"
        << ",crop=" << m_config.frameWidth << ":" << m_config.frameHeight
        << ",setsar=1"
        << ",fps=" << m_config.frameRate;
    return oss.str();
}

void SceneRenderer::appendOutputArgs(std::vector<std::string>& args, MediaTime total,
                                     const std::string& outputPath) const {
    const std::vector<std::string> tail = {
        "-c:v", m_config.videoCodec,
        "-preset", m_config.preset,
        "-crf", std::to_string(m_config.crf),
        "-pix_fmt", "yuv420p",
        "-r", std::to_string(m_config.frameRate),
        "-c:a", m_config.audioCodec,
        "-b:a", m_config.audioBitrate,
        "-ar", std::to_string(m_config.audioSampleRate),
        "-t", formatSeconds(total),
        "-y", outputPath
    };
    args.insert(args.end(), tail.begin(), tail.end());
}

SceneRenderPlan SceneRenderer::planStockScene(const Scene& scene, const SceneTimeline& timeline,
                                              const std::string& audioPath,
                                              const VideoAsset& sourceA, const VideoAsset& sourceB) const {
    SceneRenderPlan plan;
    plan.sceneIndex = scene.index;
    plan.total = timeline.total;
    plan.halves.push_back({sourceA.path, timeline.halfA, chooseFit(sourceA.nativeDuration, timeline.halfA.length())});
    plan.halves.push_back({sourceB.path, timeline.halfB, chooseFit(sourceB.nativeDuration, timeline.halfB.length())});

    std::vector<std::string>& args = plan.job.args;
    for (const auto& half : plan.halves) {
        if (half.fit == FitMode::Loop) {
            args.push_back("-stream_loop");
            args.push_back("-1");
        }
        args.push_back("-i");
        args.push_back(half.sourcePath);
    }
    args.push_back("-i");
    args.push_back(audioPath);

    // Each half starts at the head of its source; B is not offset into the source.
    std::ostringstream fc;
    for (size_t i = 0; i < plan.halves.size(); ++i) {
        fc << "[" << i << ":v]trim=duration=" << formatSeconds(plan.halves[i].span.length())
           << ",setpts=PTS-STARTPTS," << scaleCropChain() << "[v" << i << "];";
    }
    fc << "[v0][v1]concat=n=2:v=1:a=0[vcat];";

    std::string captions = buildCaptionFilters(scene.narrationText, m_config.captions);
    fc << "[vcat]" << (captions.empty() ? std::string("null") : captions) << "[vout]";
    plan.filterComplex = fc.str();

    args.push_back("-filter_complex");
    args.push_back(plan.filterComplex);
    args.push_back("-map");
    args.push_back("[vout]");
    args.push_back("-map");
    args.push_back(std::to_string(plan.halves.size()) + ":a");
    plan.job.outputPath = clipPath(scene.index);
    plan.job.label = "scene_" + std::to_string(scene.index);
    appendOutputArgs(args, plan.total, plan.job.outputPath);
    return plan;
}

SceneRenderPlan SceneRenderer::planAvatarScene(const Scene& scene, const SceneTimeline& timeline,
                                               const std::string& audioPath, const VideoAsset& avatar) const {
    SceneRenderPlan plan;
    plan.sceneIndex = scene.index;
    plan.avatar = true;
    plan.total = timeline.total;
    plan.halves.push_back({avatar.path, TimeSpan{0, timeline.total}, FitMode::Loop});

    std::vector<std::string>& args = plan.job.args;
    args = {"-stream_loop", "-1", "-i", avatar.path, "-i", audioPath};

    std::ostringstream fc;
    fc << "[0:v]crop=iw:ih-" << m_config.avatarCropBottom << ":0:0"
       << ",trim=duration=" << formatSeconds(timeline.total)
       << ",setpts=PTS-STARTPTS," << scaleCropChain() << "[vcat];";
    std::string captions = buildCaptionFilters(scene.narrationText, m_config.captions);
    fc << "[vcat]" << (captions.empty() ? std::string("null") : captions) << "[vout]";
    plan.filterComplex = fc.str();

    args.push_back("-filter_complex");
    args.push_back(plan.filterComplex);
    args.push_back("-map");
    args.push_back("[vout]");
    args.push_back("-map");
    args.push_back("1:a");
    plan.job.outputPath = clipPath(scene.index);
    plan.job.label = "scene_" + std::to_string(scene.index) + "_avatar";
    appendOutputArgs(args, plan.total, plan.job.outputPath);
    return plan;
}

void SceneRenderer::verifyDuration(const SceneRenderPlan& plan) const {
    VideoInfo info = m_probe.probe(plan.job.outputPath);
    MediaTime diff = info.duration - plan.total;
    if (diff < 0) diff = -diff;
    if (diff > frameInterval(m_config.frameRate)) {
        throw TimingViolationError("scene " + std::to_string(plan.sceneIndex) + ": rendered clip is "
                                   + formatSeconds(info.duration) + "s, narration is "
                                   + formatSeconds(plan.total) + "s");
    }
}

RenderedClip SceneRenderer::render(const Scene& scene, const SceneTimeline& timeline,
                                   const std::string& audioPath, const std::string& avatarPath) const {
    TRACE_SCOPE("SceneRenderer::render");
    SceneTimelineBuilder::verify(timeline);
    auto& logger = DebugLogger::getInstance();

    SceneRenderPlan plan;
    ToolResult result;

    if (!avatarPath.empty()) {
        VideoAsset avatar;
        avatar.path = avatarPath;
        std::string error;
        if (!probeSource(avatar, error)) {
            throw SourceDecodeError(avatarPath, error);
        }
        plan = planAvatarScene(scene, timeline, audioPath, avatar);
        result = m_tool.run(plan.job);
        if (!result.ok()) {
            throw SourceDecodeError(avatarPath, "scene " + std::to_string(scene.index)
                                    + " encode failed (exit " + std::to_string(result.exitStatus) + ")");
        }
    } else {
        if (scene.primarySource.empty()) {
            throw MissingAssetError("scene " + std::to_string(scene.index) + " has no primary source");
        }
        VideoAsset a = scene.primarySource;
        VideoAsset b = scene.hasSecondary() ? scene.secondarySource : scene.primarySource;

        std::string errA, errB;
        bool okA = probeSource(a, errA);
        bool okB = okA;
        if (b.path == a.path) {
            b = a;
            errB = errA;
        } else {
            okB = probeSource(b, errB);
        }

        if (!okA && !okB) {
            throw SourceDecodeError(a.path, errA);
        }
        if (!okA) {
            logger.log("[SceneRenderer] scene " + std::to_string(scene.index) + ": primary unusable ("
                       + errA + "), using " + b.path + " for both halves");
            a = b;
        } else if (!okB) {
            logger.log("[SceneRenderer] scene " + std::to_string(scene.index) + ": secondary unusable ("
                       + errB + "), using " + a.path + " for both halves");
            b = a;
        }

        plan = planStockScene(scene, timeline, audioPath, a, b);
        result = m_tool.run(plan.job);
        if (!result.ok() && a.path != b.path) {
            // Either source may be the one that breaks mid-decode: try each alone
            const VideoAsset* fallbacks[] = {&a, &b};
            for (const VideoAsset* only : fallbacks) {
                logger.log("[SceneRenderer] scene " + std::to_string(scene.index) + ": encode failed (exit "
                           + std::to_string(result.exitStatus) + "), retrying with " + only->path + " only");
                plan = planStockScene(scene, timeline, audioPath, *only, *only);
                result = m_tool.run(plan.job);
                if (result.ok()) break;
            }
        }
        if (!result.ok()) {
            throw SourceDecodeError(a.path, "scene " + std::to_string(scene.index)
                                    + " encode failed (exit " + std::to_string(result.exitStatus) + ")");
        }
    }

    verifyDuration(plan);

    RenderedClip clip;
    clip.sceneIndex = scene.index;
    clip.path = plan.job.outputPath;
    clip.duration = timeline.total;
    clip.hasAvatar = plan.avatar;
    logger.log("[SceneRenderer] scene " + std::to_string(scene.index) + " rendered: " + clip.path
               + " (" + formatSeconds(clip.duration) + "s)");
    return clip;
}

} // namespace SceneStitch
