#pragma once

#include "timeline/MediaTime.h"
#include <string>

namespace SceneStitch {

/**
 * @brief Video metadata information
 */
struct VideoInfo {
    int width = 0;              // Video width in pixels
    int height = 0;             // Video height in pixels
    double fps = 0.0;           // Frames per second
    MediaTime duration = 0;     // Container duration
    bool hasAudio = false;
    std::string codec;          // Video codec name
};

/**
 * @brief Reads stream metadata from a media file
 */
class MediaProbe {
public:
    virtual ~MediaProbe() = default;

    /**
     * @throws SourceDecodeError if the file cannot be opened or has no video stream
     */
    virtual VideoInfo probe(const std::string& path) const = 0;
};

} // namespace SceneStitch
