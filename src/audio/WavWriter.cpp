#include "WavWriter.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>

namespace SceneStitch {

static void write_le(std::ofstream& os, uint16_t v) {
    char b[2];
    b[0] = v & 0xFF;
    b[1] = (v >> 8) & 0xFF;
    os.write(b, 2);
}
static void write_le(std::ofstream& os, uint32_t v) {
    char b[4];
    b[0] = v & 0xFF;
    b[1] = (v >> 8) & 0xFF;
    b[2] = (v >> 16) & 0xFF;
    b[3] = (v >> 24) & 0xFF;
    os.write(b, 4);
}

bool writeWav(const std::string& dest, const std::vector<float>& samples, int sampleRate, std::string& error) {
    error.clear();

    if (sampleRate <= 0) {
        error = "Invalid sample rate: " + std::to_string(sampleRate);
        return false;
    }

    const uint16_t channels = 1;
    const uint16_t bitsPerSample = 16;
    const uint32_t blockAlign = channels * bitsPerSample / 8;
    const uint64_t dataBytes = static_cast<uint64_t>(samples.size()) * blockAlign;
    if (dataBytes > 0xFFFFFFFFull - 36) {
        error = "Audio too long for a WAV container";
        return false;
    }

    std::ofstream out(dest, std::ios::binary);
    if (!out) {
        error = "Could not create WAV file: " + dest;
        return false;
    }

    // RIFF header
    out.write("RIFF", 4);
    write_le(out, static_cast<uint32_t>(36 + dataBytes));
    out.write("WAVE", 4);

    // fmt chunk (PCM)
    out.write("fmt ", 4);
    write_le(out, static_cast<uint32_t>(16));
    write_le(out, static_cast<uint16_t>(1));
    write_le(out, channels);
    write_le(out, static_cast<uint32_t>(sampleRate));
    write_le(out, static_cast<uint32_t>(sampleRate) * blockAlign);
    write_le(out, static_cast<uint16_t>(blockAlign));
    write_le(out, bitsPerSample);

    // data chunk
    out.write("data", 4);
    write_le(out, static_cast<uint32_t>(dataBytes));
    for (float s : samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, s));
        int16_t pcm = static_cast<int16_t>(std::lround(clamped * 32767.0f));
        write_le(out, static_cast<uint16_t>(pcm));
    }

    out.close();
    if (!out) {
        error = "Write failed: " + dest;
        return false;
    }
    return true;
}

} // namespace SceneStitch
