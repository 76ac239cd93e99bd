#pragma once

#include "MediaTool.h"
#include <string>

namespace SceneStitch {

/**
 * @brief MediaTool that runs the ffmpeg executable
 *
 * Every run is appended (command, exit code, output tail) to
 * <temp>/scenestitch_ffmpeg.log. Safe to share across worker threads.
 */
class FFmpegTool : public MediaTool {
public:
    /**
     * @param ffmpegPath Explicit executable; empty resolves
     *        SCENESTITCH_FFMPEG_PATH, then PATH, then a platform default
     */
    explicit FFmpegTool(const std::string& ffmpegPath = "");

    ToolResult run(const MediaJob& job) override;

    // Expose resolved FFmpeg path for diagnostics
    std::string resolveFfmpegPath() const;

    // Filter graphs longer than this go through -filter_complex_script
    static constexpr size_t kMaxInlineFilterLength = 4000;

private:
    std::string m_ffmpegPath;

    std::string getFFmpegPath() const;
};

} // namespace SceneStitch
