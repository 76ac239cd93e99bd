#include "MediaTime.h"
#include <cmath>
#include <cstdio>

namespace SceneStitch {

MediaTime samplesToMediaTime(size_t sampleCount, int sampleRate) {
    if (sampleRate <= 0) {
        return 0;
    }
    // (count * base + rate/2) / rate in integer arithmetic
    const int64_t rate = sampleRate;
    const int64_t count = static_cast<int64_t>(sampleCount);
    return (count * kTimeBase + rate / 2) / rate;
}

MediaTime secondsToMediaTime(double seconds) {
    return static_cast<MediaTime>(std::floor(seconds * static_cast<double>(kTimeBase) + 0.5));
}

double mediaTimeToSeconds(MediaTime t) {
    return static_cast<double>(t) / static_cast<double>(kTimeBase);
}

MediaTime frameInterval(int frameRate) {
    if (frameRate <= 0) {
        return 0;
    }
    return (kTimeBase + frameRate / 2) / frameRate;
}

std::string formatSeconds(MediaTime t) {
    const bool negative = t < 0;
    const int64_t magnitude = negative ? -t : t;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s%lld.%06lld",
                  negative ? "-" : "",
                  static_cast<long long>(magnitude / kTimeBase),
                  static_cast<long long>(magnitude % kTimeBase));
    return buf;
}

} // namespace SceneStitch
