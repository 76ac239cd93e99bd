#pragma once

#include "MediaProbe.h"
#include <string>

namespace SceneStitch {

/**
 * @brief FFmpeg-backed media probe (libavformat + libavcodec)
 */
class VideoProcessor : public MediaProbe {
public:
    VideoInfo probe(const std::string& path) const override;
};

} // namespace SceneStitch
