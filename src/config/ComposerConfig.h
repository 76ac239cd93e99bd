#pragma once

#include "timeline/MediaTime.h"
#include "video/TransitionLibrary.h"
#include <cstdint>
#include <string>
#include <vector>

namespace SceneStitch {

/**
 * @brief Burned-in caption styling
 */
struct CaptionStyle {
    bool enabled = true;
    std::string fontPath;                 // used only when the file exists
    int fontSize = 56;                    // px; ~30 bold chars fit in 1080px
    size_t maxCharsPerLine = 24;
    int lineSpacing = 14;                 // px between lines
    int depthLayers = 5;                  // dark offset copies under the main text
    double anchor = 0.72;                 // block centre as a fraction of frame height
    std::vector<std::string> palette = {"#FFE500", "#00E5FF", "#FF6B00", "#FF2D8B"};
};

/**
 * @brief Every tunable of a composition run, passed to each component at construction
 */
struct ComposerConfig {
    // Target frame (portrait 9:16)
    int frameWidth = 1080;
    int frameHeight = 1920;
    int frameRate = 30;

    // Clip normalizer
    double gainFactor = 2.0;
    double silenceThresholdDb = -50.0;    // dBFS
    int silenceWindowMs = 10;

    // Transition stitcher
    std::vector<TransitionKind> transitionKinds = {
        TransitionKind::CrossFade, TransitionKind::Wipe, TransitionKind::Slide};
    MediaTime transitionOverlap = 500000; // 0.5s

    // Avatar injection
    std::string avatarPath;
    bool avatarRequired = false;          // MissingAvatarAsset is fatal when set
    int avatarExcludeLeading = 1;         // hook scene(s)
    int avatarExcludeTrailing = 1;        // outro scene(s)
    int avatarCropBottom = 150;           // px stripped before scaling

    CaptionStyle captions;

    // Encode policy
    std::string videoCodec = "libx264";
    std::string preset = "medium";
    int crf = 18;
    std::string audioCodec = "aac";
    std::string audioBitrate = "192k";
    int audioSampleRate = 44100;

    // Execution
    int workerCount = 0;                  // 0 = hardware concurrency
    std::string workDir;                  // root of per-run directories; empty = <temp>/scenestitch
    bool keepIntermediates = false;
    std::string ffmpegPath;               // empty = resolve at run time

    bool hasSeed = false;
    uint64_t seed = 0;

    // Throws ConfigurationError on the first invalid field.
    void validate() const;

    std::string resolveWorkDir() const;
};

// Parse a JSON document whose keys mirror the field names above. Unknown keys
// are ignored; missing keys keep their defaults.
ComposerConfig parseComposerConfig(const std::string& jsonText);

ComposerConfig loadComposerConfig(const std::string& path);

} // namespace SceneStitch
