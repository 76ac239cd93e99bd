#include "ComposerConfig.h"
#include "pipeline/CompositionErrors.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace SceneStitch {

using json = nlohmann::json;

namespace {

template <typename T>
void readField(const json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

void readCaptions(const json& j, CaptionStyle& style) {
    if (!j.is_object()) {
        throw ConfigurationError("'captions' must be an object");
    }
    readField(j, "enabled", style.enabled);
    readField(j, "fontPath", style.fontPath);
    readField(j, "fontSize", style.fontSize);
    readField(j, "maxCharsPerLine", style.maxCharsPerLine);
    readField(j, "lineSpacing", style.lineSpacing);
    readField(j, "depthLayers", style.depthLayers);
    readField(j, "anchor", style.anchor);
    readField(j, "palette", style.palette);
}

} // namespace

void ComposerConfig::validate() const {
    if (frameWidth <= 0 || frameHeight <= 0) {
        throw ConfigurationError("frame size must be positive");
    }
    if (frameRate <= 0) {
        throw ConfigurationError("frameRate must be positive");
    }
    if (gainFactor <= 0.0) {
        throw ConfigurationError("gainFactor must be positive");
    }
    if (silenceWindowMs <= 0) {
        throw ConfigurationError("silenceWindowMs must be positive");
    }
    if (transitionKinds.empty()) {
        throw ConfigurationError("transition set is empty");
    }
    if (transitionOverlap < 0) {
        throw ConfigurationError("transitionOverlap must not be negative");
    }
    if (avatarExcludeLeading < 1 || avatarExcludeTrailing < 1) {
        throw ConfigurationError("avatar eligibility must exclude at least the first and last scene");
    }
    if (avatarCropBottom < 0 || avatarCropBottom >= frameHeight) {
        throw ConfigurationError("avatarCropBottom out of range");
    }
    if (captions.enabled) {
        if (captions.maxCharsPerLine == 0 || captions.fontSize <= 0) {
            throw ConfigurationError("caption line width and font size must be positive");
        }
        if (captions.palette.empty()) {
            throw ConfigurationError("caption palette is empty");
        }
    }
    if (workerCount < 0) {
        throw ConfigurationError("workerCount must not be negative");
    }
}

std::string ComposerConfig::resolveWorkDir() const {
    if (!workDir.empty()) {
        return workDir;
    }
    std::error_code ec;
    std::filesystem::path td = std::filesystem::temp_directory_path(ec);
    if (ec) {
        td = std::filesystem::path("/tmp");
    }
    return (td / "scenestitch").string();
}

ComposerConfig parseComposerConfig(const std::string& jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("config is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigurationError("config root must be an object");
    }

    ComposerConfig cfg;
    readField(j, "frameWidth", cfg.frameWidth);
    readField(j, "frameHeight", cfg.frameHeight);
    readField(j, "frameRate", cfg.frameRate);
    readField(j, "gainFactor", cfg.gainFactor);
    readField(j, "silenceThresholdDb", cfg.silenceThresholdDb);
    readField(j, "silenceWindowMs", cfg.silenceWindowMs);

    if (j.contains("transitionKinds")) {
        std::vector<std::string> names;
        readField(j, "transitionKinds", names);
        TransitionLibrary library;
        cfg.transitionKinds.clear();
        for (const auto& name : names) {
            const TransitionEffect* effect = library.findByName(name);
            if (!effect) {
                throw ConfigurationError("unknown transition kind: " + name);
            }
            cfg.transitionKinds.push_back(effect->kind);
        }
    }
    if (j.contains("transitionOverlap")) {
        double seconds = 0.0;
        readField(j, "transitionOverlap", seconds);
        cfg.transitionOverlap = secondsToMediaTime(seconds);
    }

    readField(j, "avatarPath", cfg.avatarPath);
    readField(j, "avatarRequired", cfg.avatarRequired);
    readField(j, "avatarExcludeLeading", cfg.avatarExcludeLeading);
    readField(j, "avatarExcludeTrailing", cfg.avatarExcludeTrailing);
    readField(j, "avatarCropBottom", cfg.avatarCropBottom);

    if (j.contains("captions")) {
        readCaptions(j.at("captions"), cfg.captions);
    }

    readField(j, "videoCodec", cfg.videoCodec);
    readField(j, "preset", cfg.preset);
    readField(j, "crf", cfg.crf);
    readField(j, "audioCodec", cfg.audioCodec);
    readField(j, "audioBitrate", cfg.audioBitrate);
    readField(j, "audioSampleRate", cfg.audioSampleRate);
    readField(j, "workerCount", cfg.workerCount);
    readField(j, "workDir", cfg.workDir);
    readField(j, "keepIntermediates", cfg.keepIntermediates);
    readField(j, "ffmpegPath", cfg.ffmpegPath);

    if (j.contains("seed")) {
        readField(j, "seed", cfg.seed);
        cfg.hasSeed = true;
    }

    cfg.validate();
    return cfg;
}

ComposerConfig loadComposerConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("could not open config file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parseComposerConfig(ss.str());
}

} // namespace SceneStitch
