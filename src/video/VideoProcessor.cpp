#include "VideoProcessor.h"
#include "pipeline/CompositionErrors.h"
#include "tracing/Tracing.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/mathematics.h>
}

namespace SceneStitch {

namespace {
struct FormatHandle {
    AVFormatContext* ctx = nullptr;
    ~FormatHandle() {
        if (ctx) avformat_close_input(&ctx);
    }
};
} // namespace

VideoInfo VideoProcessor::probe(const std::string& path) const {
    TRACE_FUNC();
    FormatHandle fmt;

    if (avformat_open_input(&fmt.ctx, path.c_str(), nullptr, nullptr) < 0) {
        throw SourceDecodeError(path, "could not open file");
    }
    if (avformat_find_stream_info(fmt.ctx, nullptr) < 0) {
        throw SourceDecodeError(path, "could not find stream information");
    }

    int videoStreamIndex = -1;
    int audioStreamIndex = -1;
    for (unsigned int i = 0; i < fmt.ctx->nb_streams; i++) {
        AVMediaType type = fmt.ctx->streams[i]->codecpar->codec_type;
        if (type == AVMEDIA_TYPE_VIDEO && videoStreamIndex < 0) {
            videoStreamIndex = static_cast<int>(i);
        }
        if (type == AVMEDIA_TYPE_AUDIO && audioStreamIndex < 0) {
            audioStreamIndex = static_cast<int>(i);
        }
    }

    if (videoStreamIndex == -1) {
        throw SourceDecodeError(path, "no video stream");
    }

    AVStream* videoStream = fmt.ctx->streams[videoStreamIndex];
    AVCodecParameters* params = videoStream->codecpar;
    if (!avcodec_find_decoder(params->codec_id)) {
        throw SourceDecodeError(path, "no decoder for codec " + std::string(avcodec_get_name(params->codec_id)));
    }

    VideoInfo info;
    info.width = params->width;
    info.height = params->height;
    info.fps = av_q2d(videoStream->r_frame_rate);
    info.codec = avcodec_get_name(params->codec_id);
    info.hasAudio = audioStreamIndex >= 0;

    // Container duration first, stream duration as fallback
    if (fmt.ctx->duration != AV_NOPTS_VALUE) {
        info.duration = av_rescale_q(fmt.ctx->duration, AV_TIME_BASE_Q, AVRational{1, static_cast<int>(kTimeBase)});
    } else if (videoStream->duration != AV_NOPTS_VALUE) {
        info.duration = av_rescale_q(videoStream->duration, videoStream->time_base, AVRational{1, static_cast<int>(kTimeBase)});
    }

    if (info.width <= 0 || info.height <= 0) {
        throw SourceDecodeError(path, "invalid frame size");
    }
    return info;
}

} // namespace SceneStitch
