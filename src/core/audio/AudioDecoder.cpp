#include "AudioDecoder.h"
#include <QDebug>
#include <QString>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
}

#include <algorithm>
#include <cstring>
#include <vector>

namespace {

QString avErrorText(int err)
{
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return QString::fromUtf8(buf);
}

} // namespace

struct AudioDecoder::Impl {
    AVFormatContext* fmtCtx   = nullptr;
    AVCodecContext*  codecCtx = nullptr;
    SwrContext*      swrCtx   = nullptr;
    AVPacket*        packet   = nullptr;
    AVFrame*         frame    = nullptr;

    int              requestedRate = 0;
    int              requestedChannels = 0;

    int              audioStreamIndex = -1;
    AudioStreamFormat streamFormat;
    int64_t          framesDecoded = 0;  // total frames output so far
    bool             opened = false;
    bool             inputDrained = false;   // demuxer hit EOF, decoder flushed
    bool             resamplerDrained = false;
    QString          lastError;

    // Converted frames not yet handed to the caller
    std::vector<float> residual;
    int              residualFrames = 0;
    int              residualOffset = 0;

    ~Impl() {
        cleanup();
    }

    void cleanup() {
        residual.clear();
        if (frame)    { av_frame_free(&frame); }
        if (packet)   { av_packet_free(&packet); }
        if (swrCtx)   { swr_free(&swrCtx); }
        if (codecCtx) { avcodec_free_context(&codecCtx); }
        if (fmtCtx)   { avformat_close_input(&fmtCtx); }
        audioStreamIndex = -1;
        framesDecoded = 0;
        residualFrames = 0;
        residualOffset = 0;
        inputDrained = false;
        resamplerDrained = false;
        opened = false;
    }

    bool fail(const QString& what, int err) {
        lastError = what + QStringLiteral(": ") + avErrorText(err);
        return false;
    }

    // Converts one decoded frame (or flushes the resampler when src is null)
    // into the residual buffer. Returns frames produced, -1 on error.
    int convert(const AVFrame* src) {
        const int channels = streamFormat.channels;
        const int inSamples = src ? src->nb_samples : 0;
        const int capacity = swr_get_out_samples(swrCtx, inSamples);
        if (capacity <= 0) return 0;

        // Compact unread residual to the front before appending
        if (residualOffset > 0 && residualFrames > 0) {
            std::memmove(residual.data(),
                         residual.data() + size_t(residualOffset) * channels,
                         size_t(residualFrames) * channels * sizeof(float));
        }
        residualOffset = 0;
        residual.resize(size_t(residualFrames + capacity) * channels);

        uint8_t* out = reinterpret_cast<uint8_t*>(
            residual.data() + size_t(residualFrames) * channels);
        int converted = swr_convert(swrCtx, &out, capacity,
                                    src ? const_cast<const uint8_t**>(src->extended_data) : nullptr,
                                    inSamples);
        if (converted < 0) {
            lastError = QStringLiteral("resample failed: ") + avErrorText(converted);
            return -1;
        }
        residualFrames += converted;
        return converted;
    }

    // Pull the next batch of converted frames into the residual buffer.
    // Returns >0 frames, 0 at end-of-stream, -1 on error.
    int decodeMore() {
        while (true) {
            int ret = avcodec_receive_frame(codecCtx, frame);
            if (ret == 0) {
                int got = convert(frame);
                av_frame_unref(frame);
                if (got != 0) return got;
                continue;
            }
            if (ret == AVERROR_EOF) {
                if (resamplerDrained) return 0;
                resamplerDrained = true;
                return convert(nullptr);
            }
            if (ret != AVERROR(EAGAIN)) {
                lastError = QStringLiteral("decode failed: ") + avErrorText(ret);
                return -1;
            }
            if (inputDrained) return 0;

            ret = av_read_frame(fmtCtx, packet);
            if (ret == AVERROR_EOF) {
                inputDrained = true;
                avcodec_send_packet(codecCtx, nullptr);  // enter draining mode
                continue;
            }
            if (ret < 0) {
                lastError = QStringLiteral("read failed: ") + avErrorText(ret);
                return -1;
            }
            if (packet->stream_index != audioStreamIndex) {
                av_packet_unref(packet);
                continue;
            }
            ret = avcodec_send_packet(codecCtx, packet);
            av_packet_unref(packet);
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                // Corrupt packet: skip it, the next one may decode
                qWarning() << "[Decoder] Dropping packet:" << avErrorText(ret);
            }
        }
    }
};

AudioDecoder::AudioDecoder()
    : m_impl(std::make_unique<Impl>())
{
}

AudioDecoder::~AudioDecoder() = default;

void AudioDecoder::setOutputFormat(int sampleRate, int channels)
{
    m_impl->requestedRate = sampleRate;
    m_impl->requestedChannels = channels;
}

bool AudioDecoder::open(const std::string& filePath)
{
    close();

    auto& d = *m_impl;
    d.lastError.clear();

    // Open input
    int ret = avformat_open_input(&d.fmtCtx, filePath.c_str(), nullptr, nullptr);
    if (ret < 0)
        return d.fail(QStringLiteral("cannot open input"), ret);

    ret = avformat_find_stream_info(d.fmtCtx, nullptr);
    if (ret < 0) {
        d.cleanup();
        return d.fail(QStringLiteral("no stream info"), ret);
    }

    // Find best audio stream
    d.audioStreamIndex = av_find_best_stream(d.fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (d.audioStreamIndex < 0) {
        ret = d.audioStreamIndex;
        d.cleanup();
        return d.fail(QStringLiteral("no audio stream"), ret);
    }

    AVStream* stream = d.fmtCtx->streams[d.audioStreamIndex];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        d.cleanup();
        d.lastError = QStringLiteral("unsupported codec");
        return false;
    }

    d.codecCtx = avcodec_alloc_context3(codec);
    if (!d.codecCtx) {
        d.cleanup();
        return d.fail(QStringLiteral("codec context"), AVERROR(ENOMEM));
    }
    ret = avcodec_parameters_to_context(d.codecCtx, stream->codecpar);
    if (ret < 0) {
        d.cleanup();
        return d.fail(QStringLiteral("codec parameters"), ret);
    }

    ret = avcodec_open2(d.codecCtx, codec, nullptr);
    if (ret < 0) {
        d.cleanup();
        return d.fail(QStringLiteral("cannot open codec"), ret);
    }

    // Setup resampler: convert to interleaved float32 at the output format
    int outChannels = d.requestedChannels > 0 ? d.requestedChannels
                                              : d.codecCtx->ch_layout.nb_channels;
    if (outChannels == 0) outChannels = 2;
    int outSampleRate = d.requestedRate > 0 ? d.requestedRate : d.codecCtx->sample_rate;

    AVChannelLayout outLayout;
    av_channel_layout_default(&outLayout, outChannels);

    ret = swr_alloc_set_opts2(
        &d.swrCtx,
        &outLayout,                    // out layout
        AV_SAMPLE_FMT_FLT,             // out format: interleaved float32
        outSampleRate,                 // out sample rate
        &d.codecCtx->ch_layout,        // in layout
        d.codecCtx->sample_fmt,        // in format
        d.codecCtx->sample_rate,       // in sample rate
        0, nullptr
    );
    av_channel_layout_uninit(&outLayout);

    if (ret >= 0)
        ret = swr_init(d.swrCtx);
    if (ret < 0) {
        d.cleanup();
        return d.fail(QStringLiteral("resampler init"), ret);
    }

    d.packet = av_packet_alloc();
    d.frame  = av_frame_alloc();
    if (!d.packet || !d.frame) {
        d.cleanup();
        return d.fail(QStringLiteral("frame alloc"), AVERROR(ENOMEM));
    }

    d.streamFormat = AudioStreamFormat();
    d.streamFormat.sampleRate = outSampleRate;
    d.streamFormat.channels   = outChannels;

    if (stream->duration != AV_NOPTS_VALUE) {
        double tb = av_q2d(stream->time_base);
        d.streamFormat.durationSecs = stream->duration * tb;
    } else if (d.fmtCtx->duration != AV_NOPTS_VALUE) {
        d.streamFormat.durationSecs = d.fmtCtx->duration / (double)AV_TIME_BASE;
    }

    d.streamFormat.totalFrames = (int64_t)(d.streamFormat.durationSecs * d.streamFormat.sampleRate);

    d.opened = true;
    qDebug() << "[Decoder] Opened" << QString::fromStdString(filePath)
             << codecName() << d.codecCtx->sample_rate << "Hz ->" << outSampleRate
             << "Hz," << outChannels << "ch," << d.streamFormat.durationSecs << "s";
    return true;
}

void AudioDecoder::close()
{
    m_impl->cleanup();
}

bool AudioDecoder::isOpen() const
{
    return m_impl->opened;
}

int AudioDecoder::read(float* buf, int maxFrames)
{
    auto& d = *m_impl;
    if (!d.opened) {
        d.lastError = QStringLiteral("decoder not open");
        return -1;
    }

    const int channels = d.streamFormat.channels;
    int framesWritten = 0;

    while (framesWritten < maxFrames) {
        if (d.residualFrames == 0) {
            int got = d.decodeMore();
            if (got < 0) {
                // Hand out what was decoded; report the error on the next call
                if (framesWritten > 0) break;
                return -1;
            }
            if (got == 0) break;  // end of stream
        }

        int toCopy = std::min(d.residualFrames, maxFrames - framesWritten);
        std::memcpy(buf + size_t(framesWritten) * channels,
                    d.residual.data() + size_t(d.residualOffset) * channels,
                    size_t(toCopy) * channels * sizeof(float));
        d.residualOffset += toCopy;
        d.residualFrames -= toCopy;
        framesWritten += toCopy;
    }

    d.framesDecoded += framesWritten;
    return framesWritten;
}

bool AudioDecoder::seek(int64_t frame)
{
    auto& d = *m_impl;
    if (!d.opened) return false;

    AVStream* stream = d.fmtCtx->streams[d.audioStreamIndex];
    const double secs = double(frame) / d.streamFormat.sampleRate;
    int64_t ts = (int64_t)(secs / av_q2d(stream->time_base));

    int ret = av_seek_frame(d.fmtCtx, d.audioStreamIndex, ts, AVSEEK_FLAG_BACKWARD);
    if (ret < 0)
        return d.fail(QStringLiteral("seek failed"), ret);

    avcodec_flush_buffers(d.codecCtx);
    // Drop samples buffered inside the resampler
    swr_close(d.swrCtx);
    ret = swr_init(d.swrCtx);
    if (ret < 0)
        return d.fail(QStringLiteral("resampler reset"), ret);

    d.residualFrames = 0;
    d.residualOffset = 0;
    d.inputDrained = false;
    d.resamplerDrained = false;
    d.framesDecoded = frame;
    return true;
}

AudioStreamFormat AudioDecoder::format() const
{
    return m_impl->streamFormat;
}

int64_t AudioDecoder::currentFrame() const
{
    return m_impl->framesDecoded;
}

QString AudioDecoder::errorString() const
{
    return m_impl->lastError;
}

QString AudioDecoder::codecName() const
{
    auto& d = *m_impl;
    if (!d.opened || !d.codecCtx) return QString();
    return QString::fromUtf8(avcodec_get_name(d.codecCtx->codec_id));
}
