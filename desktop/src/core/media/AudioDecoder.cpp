#include "AudioDecoder.hpp"
#include "../common/Logger.hpp"

#include <memory>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace WordFinder {

namespace {

struct FormatContextDeleter {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};

struct CodecContextDeleter {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};

struct SwrContextDeleter {
    void operator()(SwrContext* ctx) const { swr_free(&ctx); }
};

struct PacketDeleter {
    void operator()(AVPacket* packet) const { av_packet_free(&packet); }
};

struct FrameDeleter {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;

// Appends the resampled contents of frame (or the flushed tail when frame is null)
int appendResampled(SwrContext* swr, const AVFrame* frame, std::vector<float>& pcm) {
    const int inSamples = frame ? frame->nb_samples : 0;
    const int maxOut = swr_get_out_samples(swr, inSamples);
    if (maxOut < 0) {
        return maxOut;
    }
    if (maxOut == 0) {
        return 0;
    }

    const size_t offset = pcm.size();
    pcm.resize(offset + static_cast<size_t>(maxOut));
    uint8_t* out = reinterpret_cast<uint8_t*>(pcm.data() + offset);

    const int converted = swr_convert(swr, &out, maxOut,
                                      frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
                                      inSamples);
    if (converted < 0) {
        pcm.resize(offset);
        return converted;
    }
    pcm.resize(offset + static_cast<size_t>(converted));
    return converted;
}

} // namespace

QString toString(DecodeError error) {
    switch (error) {
        case DecodeError::OpenFailed:
            return "Could not open the media file";
        case DecodeError::NoAudioStream:
            return "The media file has no audio track";
        case DecodeError::DecoderUnavailable:
            return "No decoder available for the audio track";
        case DecodeError::DecodingFailed:
            return "Audio decoding failed";
        case DecodeError::ResampleFailed:
            return "Audio resampling failed";
        case DecodeError::EmptyAudio:
            return "The audio track is empty";
    }
    return "Unknown decode error";
}

Expected<std::vector<float>, DecodeError> AudioDecoder::decode(const QString& mediaPath) {
    WORDFINDER_DEBUG("Decoding audio from {}", mediaPath.toStdString());

    AVFormatContext* rawFormat = nullptr;
    int ret = avformat_open_input(&rawFormat, mediaPath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        WORDFINDER_ERROR("Cannot open {}: {}", mediaPath.toStdString(), avErrorString(ret).toStdString());
        return makeUnexpected(DecodeError::OpenFailed);
    }
    FormatContextPtr format(rawFormat);

    ret = avformat_find_stream_info(format.get(), nullptr);
    if (ret < 0) {
        WORDFINDER_ERROR("Cannot read stream info: {}", avErrorString(ret).toStdString());
        return makeUnexpected(DecodeError::OpenFailed);
    }

    const int streamIndex = av_find_best_stream(format.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (streamIndex < 0) {
        WORDFINDER_ERROR("No audio stream in {}", mediaPath.toStdString());
        return makeUnexpected(DecodeError::NoAudioStream);
    }
    AVStream* stream = format->streams[streamIndex];

    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        WORDFINDER_ERROR("No decoder for codec id {}", static_cast<int>(stream->codecpar->codec_id));
        return makeUnexpected(DecodeError::DecoderUnavailable);
    }

    CodecContextPtr decoder(avcodec_alloc_context3(codec));
    if (!decoder) {
        return makeUnexpected(DecodeError::DecoderUnavailable);
    }
    ret = avcodec_parameters_to_context(decoder.get(), stream->codecpar);
    if (ret >= 0) {
        ret = avcodec_open2(decoder.get(), codec, nullptr);
    }
    if (ret < 0) {
        WORDFINDER_ERROR("Cannot open {} decoder: {}", codec->name, avErrorString(ret).toStdString());
        return makeUnexpected(DecodeError::DecoderUnavailable);
    }

    AVChannelLayout inLayout = {};
    if (decoder->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC || decoder->ch_layout.nb_channels == 0) {
        av_channel_layout_default(&inLayout, decoder->ch_layout.nb_channels > 0 ? decoder->ch_layout.nb_channels : 1);
    } else {
        ret = av_channel_layout_copy(&inLayout, &decoder->ch_layout);
        if (ret < 0) {
            return makeUnexpected(DecodeError::ResampleFailed);
        }
    }
    AVChannelLayout outLayout = {};
    av_channel_layout_default(&outLayout, 1);

    SwrContext* rawSwr = nullptr;
    ret = swr_alloc_set_opts2(&rawSwr,
                              &outLayout, AV_SAMPLE_FMT_FLT, TARGET_SAMPLE_RATE,
                              &inLayout, decoder->sample_fmt, decoder->sample_rate,
                              0, nullptr);
    av_channel_layout_uninit(&inLayout);
    SwrContextPtr swr(rawSwr);
    if (ret < 0 || !swr || (ret = swr_init(swr.get())) < 0) {
        WORDFINDER_ERROR("Cannot set up resampler: {}", avErrorString(ret).toStdString());
        return makeUnexpected(DecodeError::ResampleFailed);
    }

    PacketPtr packet(av_packet_alloc());
    FramePtr frame(av_frame_alloc());
    if (!packet || !frame) {
        return makeUnexpected(DecodeError::DecodingFailed);
    }

    std::vector<float> pcm;
    bool draining = false;

    while (true) {
        if (!draining) {
            ret = av_read_frame(format.get(), packet.get());
            if (ret == AVERROR_EOF) {
                draining = true;
                ret = avcodec_send_packet(decoder.get(), nullptr);
            } else if (ret < 0) {
                WORDFINDER_ERROR("Read error: {}", avErrorString(ret).toStdString());
                return makeUnexpected(DecodeError::DecodingFailed);
            } else if (packet->stream_index != streamIndex) {
                av_packet_unref(packet.get());
                continue;
            } else {
                ret = avcodec_send_packet(decoder.get(), packet.get());
                av_packet_unref(packet.get());
            }

            // Corrupt packets are skipped, as ffmpeg itself does
            if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
                WORDFINDER_WARN("Skipping undecodable packet: {}", avErrorString(ret).toStdString());
                continue;
            }
        }

        while ((ret = avcodec_receive_frame(decoder.get(), frame.get())) >= 0) {
            const int converted = appendResampled(swr.get(), frame.get(), pcm);
            av_frame_unref(frame.get());
            if (converted < 0) {
                WORDFINDER_ERROR("Resampling failed: {}", avErrorString(converted).toStdString());
                return makeUnexpected(DecodeError::ResampleFailed);
            }
        }

        if (ret == AVERROR_EOF) {
            break;
        }
        if (ret != AVERROR(EAGAIN)) {
            WORDFINDER_ERROR("Decoding failed: {}", avErrorString(ret).toStdString());
            return makeUnexpected(DecodeError::DecodingFailed);
        }
    }

    if (appendResampled(swr.get(), nullptr, pcm) < 0) {
        return makeUnexpected(DecodeError::ResampleFailed);
    }

    if (pcm.empty()) {
        WORDFINDER_WARN("No audio samples decoded from {}", mediaPath.toStdString());
        return makeUnexpected(DecodeError::EmptyAudio);
    }

    WORDFINDER_INFO("Decoded {:.1f} s of audio from {}",
                    static_cast<double>(pcm.size()) / TARGET_SAMPLE_RATE, mediaPath.toStdString());
    return pcm;
}

QString AudioDecoder::avErrorString(int averror) {
    char errorBuffer[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(averror, errorBuffer, AV_ERROR_MAX_STRING_SIZE);
    return QString::fromUtf8(errorBuffer);
}

} // namespace WordFinder
