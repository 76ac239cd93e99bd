#include "AudioDecoder.h"
#include <stdexcept>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

namespace SceneStitch {

namespace {

// Owns every FFmpeg object touched while decoding one file
struct DecodeContext {
    AVFormatContext* formatCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    SwrContext* swrCtx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;

    ~DecodeContext() {
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (swrCtx) swr_free(&swrCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (formatCtx) avformat_close_input(&formatCtx);
    }
};

void appendResampled(DecodeContext& ctx, std::vector<float>& buffer, std::vector<float>& out) {
    int outSamples = swr_get_out_samples(ctx.swrCtx, ctx.frame->nb_samples);
    if (outSamples <= 0) {
        return;
    }
    if (buffer.size() < static_cast<size_t>(outSamples)) {
        buffer.resize(outSamples);
    }
    uint8_t* outData = reinterpret_cast<uint8_t*>(buffer.data());
    int converted = swr_convert(ctx.swrCtx, &outData, outSamples,
                                const_cast<const uint8_t**>(ctx.frame->data), ctx.frame->nb_samples);
    if (converted < 0) {
        throw std::runtime_error("Resampling failed");
    }
    out.insert(out.end(), buffer.begin(), buffer.begin() + converted);
}

} // namespace

AudioDecoder::AudioData AudioDecoder::decode(const std::string& filePath) const {
    AudioData result;
    DecodeContext ctx;

    if (avformat_open_input(&ctx.formatCtx, filePath.c_str(), nullptr, nullptr) < 0) {
        throw std::runtime_error("Could not open audio file: " + filePath);
    }
    if (avformat_find_stream_info(ctx.formatCtx, nullptr) < 0) {
        throw std::runtime_error("Could not find stream information");
    }

    int audioStreamIndex = av_find_best_stream(ctx.formatCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audioStreamIndex < 0) {
        throw std::runtime_error("Could not find audio stream");
    }

    AVCodecParameters* codecParams = ctx.formatCtx->streams[audioStreamIndex]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(codecParams->codec_id);
    if (!codec) {
        throw std::runtime_error("Could not find decoder");
    }

    ctx.codecCtx = avcodec_alloc_context3(codec);
    if (!ctx.codecCtx) {
        throw std::runtime_error("Could not allocate codec context");
    }
    if (avcodec_parameters_to_context(ctx.codecCtx, codecParams) < 0) {
        throw std::runtime_error("Could not copy codec parameters");
    }
    if (avcodec_open2(ctx.codecCtx, codec, nullptr) < 0) {
        throw std::runtime_error("Could not open codec");
    }

    // Resample to mono float32 at the source rate (FFmpeg 5.1+ channel layout API)
    ctx.swrCtx = swr_alloc();
    if (!ctx.swrCtx) {
        throw std::runtime_error("Could not allocate resampler");
    }

    AVChannelLayout inLayout;
    AVChannelLayout outLayout;
    av_channel_layout_default(&inLayout, ctx.codecCtx->ch_layout.nb_channels > 0 ? ctx.codecCtx->ch_layout.nb_channels : 2);
    av_channel_layout_default(&outLayout, 1);

    av_opt_set_chlayout(ctx.swrCtx, "in_chlayout", &inLayout, 0);
    av_opt_set_int(ctx.swrCtx, "in_sample_rate", ctx.codecCtx->sample_rate, 0);
    av_opt_set_sample_fmt(ctx.swrCtx, "in_sample_fmt", ctx.codecCtx->sample_fmt, 0);
    av_opt_set_chlayout(ctx.swrCtx, "out_chlayout", &outLayout, 0);
    av_opt_set_int(ctx.swrCtx, "out_sample_rate", ctx.codecCtx->sample_rate, 0);
    av_opt_set_sample_fmt(ctx.swrCtx, "out_sample_fmt", AV_SAMPLE_FMT_FLT, 0);

    av_channel_layout_uninit(&inLayout);
    av_channel_layout_uninit(&outLayout);

    if (swr_init(ctx.swrCtx) < 0) {
        throw std::runtime_error("Could not initialize resampler");
    }

    result.sampleRate = ctx.codecCtx->sample_rate;
    if (result.sampleRate <= 0) {
        throw std::runtime_error("Invalid sample rate");
    }

    AVStream* stream = ctx.formatCtx->streams[audioStreamIndex];
    if (stream->duration != AV_NOPTS_VALUE) {
        double estimate = stream->duration * av_q2d(stream->time_base);
        result.samples.reserve(static_cast<size_t>(estimate * result.sampleRate) + 1);
    }

    ctx.packet = av_packet_alloc();
    ctx.frame = av_frame_alloc();
    if (!ctx.packet || !ctx.frame) {
        throw std::runtime_error("Could not allocate frame/packet");
    }

    std::vector<float> buffer;
    while (av_read_frame(ctx.formatCtx, ctx.packet) >= 0) {
        if (ctx.packet->stream_index == audioStreamIndex) {
            if (avcodec_send_packet(ctx.codecCtx, ctx.packet) == 0) {
                while (avcodec_receive_frame(ctx.codecCtx, ctx.frame) == 0) {
                    appendResampled(ctx, buffer, result.samples);
                }
            }
        }
        av_packet_unref(ctx.packet);
    }

    // Flush decoder
    avcodec_send_packet(ctx.codecCtx, nullptr);
    while (avcodec_receive_frame(ctx.codecCtx, ctx.frame) == 0) {
        appendResampled(ctx, buffer, result.samples);
    }

    if (result.samples.empty()) {
        throw std::runtime_error("No audio samples decoded");
    }

    // Sample count is the ground truth; container durations are often padded.
    result.duration = static_cast<double>(result.samples.size()) / result.sampleRate;
    return result;
}

} // namespace SceneStitch
