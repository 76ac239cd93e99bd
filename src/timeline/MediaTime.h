#pragma once

#include <cstdint>
#include <string>

namespace SceneStitch {

// Integer microseconds. Same base as FFmpeg's AV_TIME_BASE so values map onto
// the tool's timestamps without drift.
using MediaTime = int64_t;

constexpr MediaTime kTimeBase = 1000000;

// Exact conversion from a sample count, rounding half up.
MediaTime samplesToMediaTime(size_t sampleCount, int sampleRate);

// Nearest MediaTime for a duration in seconds, rounding half up.
MediaTime secondsToMediaTime(double seconds);

double mediaTimeToSeconds(MediaTime t);

// Length of one frame at the given rate, rounded half up.
MediaTime frameInterval(int frameRate);

// Fixed-point seconds with six decimals. FFmpeg rejects scientific notation
// such as 2e-05, so every timestamp handed to the tool goes through here.
std::string formatSeconds(MediaTime t);

/**
 * @brief Half-open span [start, end) on a media timeline
 */
struct TimeSpan {
    MediaTime start = 0;
    MediaTime end = 0;

    MediaTime length() const { return end - start; }
    bool operator==(const TimeSpan& other) const noexcept {
        return start == other.start && end == other.end;
    }
};

} // namespace SceneStitch
