#include "AudioDecoder.h"
#include <QDebug>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libavutil/error.h>
}

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

namespace {

constexpr AVRational kNanoseconds = { 1, 1000000000 };
constexpr int kMaxConsecutiveErrors = 8;

QString avErrorString(int err)
{
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return QString::fromUtf8(buf);
}

DecoderError classifyOpenError(int err)
{
    if (err == AVERROR(ENOENT))
        return DecoderError::FileNotFound;
    if (err == AVERROR(EACCES) || err == AVERROR(EPERM) || err == AVERROR(EIO))
        return DecoderError::FileUnreadable;
    return DecoderError::CorruptStream;
}

} // namespace

struct AudioDecoder::Impl {
    AVFormatContext* fmtCtx   = nullptr;
    AVCodecContext*  codecCtx = nullptr;
    SwrContext*      swrCtx   = nullptr;   // planar -> interleaved only
    AVPacket*        packet   = nullptr;
    AVFrame*         frame    = nullptr;

    int               audioStreamIndex = -1;
    int64_t           streamStart = 0;     // in stream time base
    AudioStreamFormat streamFormat;
    bool              opened = false;
    bool              draining = false;
    bool              eof = false;
    int               consecutiveErrors = 0;

    DecoderError error = DecoderError::None;
    QString      errorText;

    // Decoded bytes not yet handed out (whole frames)
    std::vector<uint8_t> pending;
    size_t               pendingOffset = 0;

    // After a seek, frames before this index are dropped
    int64_t skipUntilFrame = -1;

    ~Impl() {
        cleanup();
    }

    void cleanup() {
        if (frame)    { av_frame_free(&frame); }
        if (packet)   { av_packet_free(&packet); }
        if (swrCtx)   { swr_free(&swrCtx); }
        if (codecCtx) { avcodec_free_context(&codecCtx); }
        if (fmtCtx)   { avformat_close_input(&fmtCtx); }
        audioStreamIndex = -1;
        streamStart = 0;
        streamFormat = AudioStreamFormat{};
        pending.clear();
        pendingOffset = 0;
        skipUntilFrame = -1;
        draining = false;
        eof = false;
        consecutiveErrors = 0;
        opened = false;
    }

    bool fail(DecoderError e, const QString& text) {
        error = e;
        errorText = text;
        return false;
    }

    bool decodeMore();
    bool appendFrame();
};

bool AudioDecoder::Impl::decodeMore()
{
    if (error != DecoderError::None)
        return false;

    for (;;) {
        int ret = avcodec_receive_frame(codecCtx, frame);
        if (ret == 0) {
            bool ok = appendFrame();
            av_frame_unref(frame);
            if (!ok)
                return false;
            if (pending.size() > pendingOffset)
                return true;
            continue;
        }
        if (ret == AVERROR_EOF) {
            eof = true;
            return false;
        }
        if (ret != AVERROR(EAGAIN))
            return fail(DecoderError::CorruptStream, avErrorString(ret));

        if (draining) {
            eof = true;
            return false;
        }

        ret = av_read_frame(fmtCtx, packet);
        if (ret == AVERROR_EOF) {
            avcodec_send_packet(codecCtx, nullptr);
            draining = true;
            continue;
        }
        if (ret < 0)
            return fail(ret == AVERROR(EIO) ? DecoderError::FileUnreadable
                                            : DecoderError::CorruptStream,
                        avErrorString(ret));

        if (packet->stream_index != audioStreamIndex) {
            av_packet_unref(packet);
            continue;
        }

        ret = avcodec_send_packet(codecCtx, packet);
        av_packet_unref(packet);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            // Tolerate isolated bad packets, give up on a run of them
            if (++consecutiveErrors >= kMaxConsecutiveErrors)
                return fail(DecoderError::CorruptStream, avErrorString(ret));
            qDebug() << "[Decoder] Skipping bad packet:" << avErrorString(ret);
            continue;
        }
        consecutiveErrors = 0;
    }
}

bool AudioDecoder::Impl::appendFrame()
{
    const int nb = frame->nb_samples;
    if (nb <= 0)
        return true;

    int drop = 0;
    if (skipUntilFrame >= 0) {
        if (frame->best_effort_timestamp != AV_NOPTS_VALUE) {
            AVStream* stream = fmtCtx->streams[audioStreamIndex];
            int64_t start = av_rescale_q(frame->best_effort_timestamp - streamStart,
                                         stream->time_base,
                                         AVRational{ 1, streamFormat.sampleRate });
            if (start + nb <= skipUntilFrame)
                return true;
            drop = (int)std::max<int64_t>(0, skipUntilFrame - start);
        }
        skipUntilFrame = -1;
    }

    const size_t bytesPerFrame = (size_t)streamFormat.bytesPerFrame();
    pending.resize((size_t)nb * bytesPerFrame);
    pendingOffset = (size_t)drop * bytesPerFrame;

    if (swrCtx) {
        uint8_t* out = pending.data();
        int converted = swr_convert(swrCtx, &out, nb,
                                    (const uint8_t**)frame->extended_data, nb);
        if (converted < 0)
            return fail(DecoderError::CorruptStream, avErrorString(converted));
        pending.resize((size_t)converted * bytesPerFrame);
    } else {
        std::memcpy(pending.data(), frame->extended_data[0], (size_t)nb * bytesPerFrame);
    }

    if (pendingOffset > pending.size())
        pendingOffset = pending.size();
    return true;
}

AudioDecoder::AudioDecoder()
    : m_impl(std::make_unique<Impl>())
{
}

AudioDecoder::~AudioDecoder() = default;

bool AudioDecoder::open(const std::string& filePath)
{
    close();

    auto& d = *m_impl;

    int ret = avformat_open_input(&d.fmtCtx, filePath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        qDebug() << "[Decoder] Cannot open" << filePath.c_str() << ":" << avErrorString(ret);
        return d.fail(classifyOpenError(ret), avErrorString(ret));
    }

    ret = avformat_find_stream_info(d.fmtCtx, nullptr);
    if (ret < 0) {
        d.cleanup();
        return d.fail(DecoderError::CorruptStream, avErrorString(ret));
    }

    d.audioStreamIndex = av_find_best_stream(d.fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (d.audioStreamIndex < 0) {
        d.cleanup();
        return d.fail(DecoderError::CorruptStream, QStringLiteral("no audio stream"));
    }

    AVStream* stream = d.fmtCtx->streams[d.audioStreamIndex];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        QString name = QString::fromUtf8(avcodec_get_name(stream->codecpar->codec_id));
        d.cleanup();
        return d.fail(DecoderError::UnsupportedCodec, QStringLiteral("no decoder for ") + name);
    }

    d.codecCtx = avcodec_alloc_context3(codec);
    if (!d.codecCtx || avcodec_parameters_to_context(d.codecCtx, stream->codecpar) < 0) {
        d.cleanup();
        return d.fail(DecoderError::CorruptStream, QStringLiteral("bad codec parameters"));
    }

    ret = avcodec_open2(d.codecCtx, codec, nullptr);
    if (ret < 0) {
        d.cleanup();
        return d.fail(DecoderError::UnsupportedCodec, avErrorString(ret));
    }

    const int channels = d.codecCtx->ch_layout.nb_channels;
    const int sampleRate = d.codecCtx->sample_rate;
    if (channels <= 0 || sampleRate <= 0) {
        d.cleanup();
        return d.fail(DecoderError::CorruptStream, QStringLiteral("missing channel count or rate"));
    }

    // The device gets the codec's own sample type; only the layout may change.
    const AVSampleFormat inFormat = d.codecCtx->sample_fmt;
    const AVSampleFormat packed = av_get_packed_sample_fmt(inFormat);
    AudioStreamFormat& f = d.streamFormat;
    switch (packed) {
    case AV_SAMPLE_FMT_S16:
        f.bitsPerSample = 16;
        break;
    case AV_SAMPLE_FMT_S32:
        f.bitsPerSample = (d.codecCtx->bits_per_raw_sample > 0
                           && d.codecCtx->bits_per_raw_sample <= 32)
                          ? d.codecCtx->bits_per_raw_sample : 32;
        break;
    case AV_SAMPLE_FMT_FLT:
        f.bitsPerSample = 32;
        f.isFloat = true;
        break;
    default: {
        QString name = QString::fromUtf8(av_get_sample_fmt_name(inFormat));
        d.cleanup();
        return d.fail(DecoderError::UnsupportedCodec,
                      QStringLiteral("sample format %1 has no bit-exact device mapping").arg(name));
    }
    }
    f.bytesPerSample = av_get_bytes_per_sample(packed);
    f.sampleRate = sampleRate;
    f.channels = channels;

    if (av_sample_fmt_is_planar(inFormat) && channels > 1) {
        AVChannelLayout layout;
        if (d.codecCtx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC)
            av_channel_layout_default(&layout, channels);
        else
            av_channel_layout_copy(&layout, &d.codecCtx->ch_layout);

        ret = swr_alloc_set_opts2(&d.swrCtx,
                                  &layout, packed, sampleRate,
                                  &layout, inFormat, sampleRate,
                                  0, nullptr);
        av_channel_layout_uninit(&layout);
        if (ret < 0 || swr_init(d.swrCtx) < 0) {
            d.cleanup();
            return d.fail(DecoderError::UnsupportedCodec, QStringLiteral("cannot interleave planar output"));
        }
    }

    d.packet = av_packet_alloc();
    d.frame  = av_frame_alloc();
    if (!d.packet || !d.frame) {
        d.cleanup();
        return d.fail(DecoderError::CorruptStream, QStringLiteral("out of memory"));
    }

    d.streamStart = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
    if (stream->duration != AV_NOPTS_VALUE)
        f.durationNs = (uint64_t)av_rescale_q(stream->duration, stream->time_base, kNanoseconds);
    else if (d.fmtCtx->duration != AV_NOPTS_VALUE)
        f.durationNs = (uint64_t)d.fmtCtx->duration * 1000ULL;
    f.totalFrames = av_rescale((int64_t)f.durationNs, sampleRate, 1000000000LL);

    d.opened = true;
    qDebug() << "[Decoder] Opened" << filePath.c_str()
             << avcodec_get_name(d.codecCtx->codec_id)
             << f.sampleRate << "Hz" << f.bitsPerSample << "bit" << f.channels << "ch";
    return true;
}

void AudioDecoder::close()
{
    m_impl->cleanup();
    m_impl->error = DecoderError::None;
    m_impl->errorText.clear();
}

bool AudioDecoder::isOpen() const
{
    return m_impl->opened;
}

int AudioDecoder::read(uint8_t* buf, int maxFrames)
{
    auto& d = *m_impl;
    if (!d.opened || maxFrames <= 0)
        return 0;

    const size_t bytesPerFrame = (size_t)d.streamFormat.bytesPerFrame();
    const size_t want = (size_t)maxFrames * bytesPerFrame;
    size_t copied = 0;

    while (copied < want) {
        const size_t available = d.pending.size() - d.pendingOffset;
        if (available > 0) {
            const size_t n = std::min(available, want - copied);
            std::memcpy(buf + copied, d.pending.data() + d.pendingOffset, n);
            d.pendingOffset += n;
            copied += n;
            continue;
        }

        d.pending.clear();
        d.pendingOffset = 0;
        if (d.eof || !d.decodeMore())
            break;
    }

    if (copied == 0 && d.error != DecoderError::None) {
        qWarning() << "[Decoder] Read failed:" << d.errorText;
        return -1;
    }
    return (int)(copied / bytesPerFrame);
}

bool AudioDecoder::seek(uint64_t positionNs)
{
    auto& d = *m_impl;
    if (!d.opened)
        return false;

    AVStream* stream = d.fmtCtx->streams[d.audioStreamIndex];
    int64_t ts = av_rescale_q((int64_t)positionNs, kNanoseconds, stream->time_base) + d.streamStart;

    int ret = av_seek_frame(d.fmtCtx, d.audioStreamIndex, ts, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        qWarning() << "[Decoder] Seek failed:" << avErrorString(ret);
        return false;
    }

    avcodec_flush_buffers(d.codecCtx);
    d.pending.clear();
    d.pendingOffset = 0;
    d.draining = false;
    d.eof = false;
    d.consecutiveErrors = 0;
    d.skipUntilFrame = av_rescale((int64_t)positionNs, d.streamFormat.sampleRate, 1000000000LL);
    return true;
}

AudioStreamFormat AudioDecoder::format() const
{
    return m_impl->streamFormat;
}

DecoderError AudioDecoder::lastError() const
{
    return m_impl->error;
}

QString AudioDecoder::errorString() const
{
    return m_impl->errorText;
}

QString AudioDecoder::codecName() const
{
    auto& d = *m_impl;
    if (!d.opened || !d.codecCtx) return QString();
    return QString::fromUtf8(avcodec_get_name(d.codecCtx->codec_id));
}

QString AudioDecoder::tag(const char* key) const
{
    auto& d = *m_impl;
    if (!d.opened)
        return QString();

    const AVDictionaryEntry* e = av_dict_get(d.fmtCtx->metadata, key, nullptr, 0);
    if (!e)
        e = av_dict_get(d.fmtCtx->streams[d.audioStreamIndex]->metadata, key, nullptr, 0);
    return e ? QString::fromUtf8(e->value) : QString();
}
