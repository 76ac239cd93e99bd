#pragma once

#include "Scene.h"
#include <string>
#include <vector>

namespace SceneStitch {

/**
 * @brief One composition request as read from disk
 *
 * {
 *   "output": "final/short.mp4",
 *   "avatar": "avatar/loop.mp4",
 *   "scenes": [
 *     {"text": "...", "audio": "a0.wav", "primary": "v0a.mp4", "secondary": "v0b.mp4",
 *      "visual_1": "...", "visual_2": "..."}
 *   ]
 * }
 *
 * Relative paths are resolved against the manifest's directory. Scene index
 * is the position in the array.
 */
struct SceneManifest {
    std::string outputPath;
    std::string avatarPath;
    std::vector<Scene> scenes;
};

// @throws ConfigurationError on malformed JSON or wrongly typed fields
SceneManifest parseSceneManifest(const std::string& jsonText, const std::string& baseDir = "");

SceneManifest loadSceneManifest(const std::string& path);

} // namespace SceneStitch
