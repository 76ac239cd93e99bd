#pragma once

#include <string>
#include <vector>

namespace SceneStitch {

/**
 * @brief Decodes audio files to mono float samples using FFmpeg
 */
class AudioDecoder {
public:
    struct AudioData {
        std::vector<float> samples;  // Mono audio samples
        int sampleRate = 0;
        double duration = 0.0;
    };

    /**
     * @brief Load and decode an audio file (MP3, WAV, FLAC, ...)
     * @throws std::runtime_error if the file cannot be opened or decoded
     */
    AudioData decode(const std::string& filePath) const;
};

} // namespace SceneStitch
