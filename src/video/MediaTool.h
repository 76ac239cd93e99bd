#pragma once

#include <string>
#include <vector>

namespace SceneStitch {

/**
 * @brief One invocation of the external media tool
 */
struct MediaJob {
    std::string label;              // for logs, e.g. "scene_3" or "export"
    std::vector<std::string> args;  // tool arguments, without the executable
    std::string outputPath;         // file the job is expected to produce
};

struct ToolResult {
    int exitStatus = -1;
    std::string output;             // captured stdout + stderr

    bool ok() const { return exitStatus == 0; }
};

/**
 * @brief Capability interface over the encode/decode tool
 *
 * The production implementation spawns ffmpeg; tests substitute a fake so the
 * composition logic runs without real media tooling.
 */
class MediaTool {
public:
    virtual ~MediaTool() = default;

    virtual ToolResult run(const MediaJob& job) = 0;
};

} // namespace SceneStitch
