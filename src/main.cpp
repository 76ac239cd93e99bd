#include "config/ComposerConfig.h"
#include "pipeline/CompositionErrors.h"
#include "pipeline/CompositionPipeline.h"
#include "pipeline/SceneManifest.h"
#include "pipeline/Selection.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "video/FFmpegTool.h"
#include "video/TransitionLibrary.h"
#include "video/VideoProcessor.h"
#include <cstring>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

using namespace SceneStitch;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

void printUsage(const char* programName) {
    std::cout << "SceneStitch - narrated short-video composer\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << programName << " <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  compose <manifest.json>   Render every scene and export the final video\n";
    std::cout << "  plan <manifest.json>      Show timelines, avatar slot and transitions without rendering\n";
    std::cout << "  probe <video>             Print stream information for a video file\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output <file>       Output file (overrides the manifest)\n";
    std::cout << "  -c, --config <file>       Composer configuration (JSON)\n";
    std::cout << "  -j, --jobs <n>            Parallel scene renders (default: CPU count)\n";
    std::cout << "  --seed <n>                Seed for avatar slot and transition choice\n";
    std::cout << "  --keep-temp               Keep intermediate scene files\n";
    std::cout << "  -h, --help                Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " compose story.json -o short.mp4\n";
    std::cout << "  " << programName << " plan story.json --seed 42\n";
    std::cout << "  " << programName << " probe clip.mp4\n";
}

struct CliOptions {
    std::string input;
    std::string output;
    std::string configPath;
    int jobs = -1;
    bool hasSeed = false;
    uint64_t seed = 0;
    bool keepTemp = false;
};

// Returns false (after printing the problem) on a usage error
bool parseOptions(int argc, char* argv[], CliOptions& opts) {
    for (int i = 3; i < argc; ++i) {
        const bool hasValue = i + 1 < argc;
        if (std::strcmp(argv[i], "-o") == 0 || std::strcmp(argv[i], "--output") == 0) {
            if (!hasValue) { std::cerr << "Error: --output requires a value\n"; return false; }
            opts.output = argv[++i];
        } else if (std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) {
            if (!hasValue) { std::cerr << "Error: --config requires a value\n"; return false; }
            opts.configPath = argv[++i];
        } else if (std::strcmp(argv[i], "-j") == 0 || std::strcmp(argv[i], "--jobs") == 0) {
            if (!hasValue) { std::cerr << "Error: --jobs requires a value\n"; return false; }
            try {
                opts.jobs = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid jobs value\n";
                return false;
            }
            if (opts.jobs < 1) {
                std::cerr << "Error: --jobs must be at least 1\n";
                return false;
            }
        } else if (std::strcmp(argv[i], "--seed") == 0) {
            if (!hasValue) { std::cerr << "Error: --seed requires a value\n"; return false; }
            try {
                opts.seed = std::stoull(argv[++i]);
                opts.hasSeed = true;
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid seed value\n";
                return false;
            }
        } else if (std::strcmp(argv[i], "--keep-temp") == 0) {
            opts.keepTemp = true;
        } else {
            std::cerr << "Error: Unknown option " << argv[i] << "\n";
            return false;
        }
    }
    return true;
}

ComposerConfig buildConfig(const CliOptions& opts, const SceneManifest& manifest) {
    ComposerConfig config = opts.configPath.empty() ? ComposerConfig() : loadComposerConfig(opts.configPath);
    if (opts.jobs > 0) config.workerCount = opts.jobs;
    if (opts.hasSeed) {
        config.hasSeed = true;
        config.seed = opts.seed;
    }
    if (opts.keepTemp) config.keepIntermediates = true;
    if (config.avatarPath.empty()) config.avatarPath = manifest.avatarPath;
    config.validate();
    return config;
}

int runCompose(const CliOptions& opts) {
    SceneManifest manifest = loadSceneManifest(opts.input);
    ComposerConfig config = buildConfig(opts, manifest);
    std::string outputPath = opts.output.empty() ? manifest.outputPath : opts.output;
    if (outputPath.empty()) {
        std::cerr << "Error: No output path (use -o or set \"output\" in the manifest)\n";
        return kExitUsage;
    }

    std::cout << "========================================\n";
    std::cout << "SceneStitch Compose\n";
    std::cout << "========================================\n\n";
    std::cout << "Manifest: " << opts.input << "\n";
    std::cout << "Scenes: " << manifest.scenes.size() << "\n";
    std::cout << "Output: " << outputPath << "\n";
    std::cout << "Avatar: " << (config.avatarPath.empty() ? "none" : config.avatarPath) << "\n\n";

    FFmpegTool tool(config.ffmpegPath);
    VideoProcessor probe;
    CompositionPipeline pipeline(config, tool, probe);

    std::mutex printMutex;
    pipeline.setProgressCallback([&printMutex](double progress) {
        std::lock_guard<std::mutex> lock(printMutex);
        int percent = static_cast<int>(progress * 100);
        std::cout << "\rProgress: " << percent << "%" << std::flush;
    });

    SelectionRng rng = makeSelectionRng(config);
    CompositionResult result = pipeline.run(manifest.scenes, outputPath, rng);

    std::cout << "\n\n";
    if (result.avatarScene != kNoAvatarSlot) {
        std::cout << "Avatar scene: " << result.avatarScene << "\n";
    }
    for (const auto& t : result.timeline.transitions) {
        std::cout << "Transition " << t.fromScene << " -> " << t.toScene << ": "
                  << TransitionLibrary::kindName(t.kind) << " at " << formatSeconds(t.offset) << "s\n";
    }
    std::cout << "\nDuration: " << formatSeconds(result.timeline.totalDuration()) << "s\n";
    std::cout << "Saved: " << result.outputPath << "\n";
    if (config.keepIntermediates) {
        std::cout << "Intermediates: " << result.runDir << "\n";
    }
    return kExitOk;
}

int runPlan(const CliOptions& opts) {
    SceneManifest manifest = loadSceneManifest(opts.input);
    ComposerConfig config = buildConfig(opts, manifest);

    FFmpegTool tool(config.ffmpegPath);
    VideoProcessor probe;
    CompositionPipeline pipeline(config, tool, probe);
    SelectionRng rng = makeSelectionRng(config);
    CompositionPlan plan = pipeline.plan(manifest.scenes, rng);

    std::cout << "Scene  Narration      Normalized     Half A         Half B         Source B\n";
    for (const auto& sp : plan.scenes) {
        std::cout << std::left << std::setw(7) << sp.sceneIndex
                  << std::setw(15) << formatSeconds(sp.sourceDuration)
                  << std::setw(15) << formatSeconds(sp.audio.duration)
                  << std::setw(15) << formatSeconds(sp.timeline.halfA.length())
                  << std::setw(15) << formatSeconds(sp.timeline.halfB.length())
                  << (sp.timeline.secondaryFallback ? "primary" : "secondary")
                  << (sp.sceneIndex == plan.avatarScene ? "  [avatar]" : "") << "\n";
    }
    std::cout << "\n";
    for (const auto& t : plan.timeline.transitions) {
        std::cout << "Transition " << t.fromScene << " -> " << t.toScene << ": "
                  << TransitionLibrary::kindName(t.kind) << " at " << formatSeconds(t.offset)
                  << "s (overlap " << formatSeconds(t.overlap) << "s)\n";
    }
    std::cout << "Expected duration: " << formatSeconds(plan.timeline.totalDuration()) << "s\n";
    return kExitOk;
}

int runProbe(const std::string& path) {
    VideoProcessor probe;
    VideoInfo info = probe.probe(path);
    std::cout << "File: " << path << "\n";
    std::cout << "Resolution: " << info.width << "x" << info.height << "\n";
    std::cout << "FPS: " << std::fixed << std::setprecision(3) << info.fps << "\n";
    std::cout << "Duration: " << formatSeconds(info.duration) << "s\n";
    std::cout << "Codec: " << info.codec << "\n";
    std::cout << "Audio: " << (info.hasAudio ? "yes" : "no") << "\n";
    return kExitOk;
}

void reportFailure(const std::string& command, const std::exception& e) {
    auto& logger = DebugLogger::getInstance();
    logger.log(std::string("[main] ") + command + " failed: " + e.what());
    const std::string logPath = logger.getLogPath();
    if (!logPath.empty()) {
        std::cerr << "Details: " << logPath << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    tracing::ScopedInit tracerInit;

    if (argc < 2) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printUsage(argv[0]);
        return kExitOk;
    }

    if (command != "compose" && command != "plan" && command != "probe") {
        std::cerr << "Error: Unknown command '" << command << "'\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (argc < 3) {
        std::cerr << "Error: Missing " << (command == "probe" ? "video file" : "manifest path") << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }

    CliOptions opts;
    opts.input = argv[2];
    if (!parseOptions(argc, argv, opts)) {
        return kExitUsage;
    }

    try {
        if (command == "compose") return runCompose(opts);
        if (command == "plan") return runPlan(opts);
        return runProbe(opts.input);
    } catch (const CompositionError& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        reportFailure(command, e);
        return kExitFailed;
    } catch (const std::exception& e) {
        std::cerr << "\nUnexpected error: " << e.what() << "\n";
        reportFailure(command, e);
        return kExitFailed;
    }
}
