#pragma once

#include <string>
#include <vector>

namespace SceneStitch {

// Write mono float samples as a 16-bit PCM WAV file. Samples outside [-1, 1]
// are clamped. Returns true on success, false on error; 'error' will contain a message.
bool writeWav(const std::string& dest, const std::vector<float>& samples, int sampleRate, std::string& error);

} // namespace SceneStitch
