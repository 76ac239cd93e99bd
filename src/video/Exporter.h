#pragma once

#include "MediaTool.h"
#include "config/ComposerConfig.h"
#include "timeline/FinalTimeline.h"
#include <string>

namespace SceneStitch {

/**
 * @brief Exclusive claim on an output path for the lifetime of the object
 *
 * Exporters aimed at the same path run one after another. Within the process
 * a registry serialises them; across processes an advisory lock on
 * <output>.lock does. The advisory lock dies with its process, so a lock file
 * left by a killed run does not block later exports.
 */
class OutputPathLock {
public:
    // Blocks until the path is free.
    // @throws ExportFailed (exit status -1) if the lock file cannot be opened
    explicit OutputPathLock(const std::string& outputPath);
    ~OutputPathLock();

    OutputPathLock(const OutputPathLock&) = delete;
    OutputPathLock& operator=(const OutputPathLock&) = delete;

    const std::string& lockPath() const { return m_lockPath; }

    // Number of threads in this process currently waiting for any path
    static size_t waitingCount();

private:
    std::string m_key;
    std::string m_lockPath;
    int m_fd = -1;

    void lockFile();
    void unlockFile();
};

/**
 * @brief Encodes the final timeline into one fast-start H.264 file
 *
 * Fixed policy: yuv420p, the configured H.264 encoder, +faststart, the target
 * frame size, one audio track. Single pass, no retry.
 */
class Exporter {
public:
    Exporter(const ComposerConfig& config, MediaTool& tool);

    /**
     * @brief Export to outputPath
     *
     * The tool writes <output>.partial.mp4, which is renamed on success and
     * removed on failure, so outputPath only ever holds a complete file.
     *
     * @throws ExportFailed carrying the tool's exit status
     */
    void exportTimeline(const FinalTimeline& timeline, const std::string& outputPath) const;

    // Tool job writing the timeline to `destination`. One clip: re-encode only.
    MediaJob buildJob(const FinalTimeline& timeline, const std::string& destination) const;

    static std::string partialPath(const std::string& outputPath);

private:
    const ComposerConfig& m_config;
    MediaTool& m_tool;
    TransitionLibrary m_library;
};

} // namespace SceneStitch
