#include "SceneManifest.h"
#include "CompositionErrors.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace SceneStitch {

using json = nlohmann::json;

namespace {

std::string readString(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    if (!j.at(key).is_string()) {
        throw ConfigurationError(where + ": '" + key + "' must be a string");
    }
    return j.at(key).get<std::string>();
}

std::string resolvePath(const std::string& path, const std::string& baseDir) {
    if (path.empty() || baseDir.empty()) return path;
    std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    return (std::filesystem::path(baseDir) / p).lexically_normal().string();
}

} // namespace

SceneManifest parseSceneManifest(const std::string& jsonText, const std::string& baseDir) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("manifest is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigurationError("manifest root must be an object");
    }

    SceneManifest manifest;
    manifest.outputPath = resolvePath(readString(j, "output", "manifest"), baseDir);
    manifest.avatarPath = resolvePath(readString(j, "avatar", "manifest"), baseDir);

    if (!j.contains("scenes") || !j.at("scenes").is_array()) {
        throw ConfigurationError("manifest needs a 'scenes' array");
    }

    const json& scenes = j.at("scenes");
    for (size_t i = 0; i < scenes.size(); ++i) {
        const json& s = scenes[i];
        const std::string where = "scene " + std::to_string(i);
        if (!s.is_object()) {
            throw ConfigurationError(where + " must be an object");
        }
        Scene scene;
        scene.index = i;
        scene.narrationText = readString(s, "text", where);
        scene.visualKeyword1 = readString(s, "visual_1", where);
        scene.visualKeyword2 = readString(s, "visual_2", where);
        scene.audio.sourcePath = resolvePath(readString(s, "audio", where), baseDir);
        scene.primarySource.path = resolvePath(readString(s, "primary", where), baseDir);
        scene.secondarySource.path = resolvePath(readString(s, "secondary", where), baseDir);
        if (s.contains("audio_duration")) {
            const json& d = s.at("audio_duration");
            if (!d.is_number() || d.get<double>() <= 0.0) {
                throw ConfigurationError(where + ": 'audio_duration' must be a positive number of seconds");
            }
            scene.audio.duration = secondsToMediaTime(d.get<double>());
        }
        manifest.scenes.push_back(std::move(scene));
    }
    return manifest;
}

SceneManifest loadSceneManifest(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("could not open manifest: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string baseDir = std::filesystem::path(path).parent_path().string();
    return parseSceneManifest(ss.str(), baseDir);
}

} // namespace SceneStitch
