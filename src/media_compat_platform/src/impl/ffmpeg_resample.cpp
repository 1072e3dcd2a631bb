#include "ffmpeg_resample.h"
#include <cassert>

namespace mcp {
namespace impl {

// Used by encoders that accept any frame size
constexpr int DEFAULT_AUDIO_FRAME_SIZE = 1024;

FFmpegAudioConverter::~FFmpegAudioConverter() {
    if (m_swr_ctx) {
        swr_free(&m_swr_ctx);
    }
    if (m_fifo) {
        av_audio_fifo_free(m_fifo);
    }
    av_channel_layout_uninit(&m_dst_layout);
}

Result<void> FFmpegAudioConverter::init(const AVCodecContext* decoder, const AVCodecContext* encoder) {
    m_src_rate = decoder->sample_rate;
    m_dst_rate = encoder->sample_rate;
    m_dst_fmt = encoder->sample_fmt;
    m_frame_size = encoder->frame_size > 0 ? encoder->frame_size : DEFAULT_AUDIO_FRAME_SIZE;

    int ret = av_channel_layout_copy(&m_dst_layout, &encoder->ch_layout);
    if (ret < 0) {
        return ffmpeg_error(ret, "av_channel_layout_copy");
    }

    // Decoders may leave the order unspecified; give swr a concrete layout
    AVChannelLayout src_layout{};
    if (decoder->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(&src_layout, decoder->ch_layout.nb_channels);
    } else {
        ret = av_channel_layout_copy(&src_layout, &decoder->ch_layout);
        if (ret < 0) {
            return ffmpeg_error(ret, "av_channel_layout_copy");
        }
    }

    ret = swr_alloc_set_opts2(&m_swr_ctx,
        &m_dst_layout, m_dst_fmt, m_dst_rate,
        &src_layout, decoder->sample_fmt, m_src_rate,
        0, nullptr);
    av_channel_layout_uninit(&src_layout);
    if (ret < 0) {
        return ffmpeg_error(ret, "swr_alloc_set_opts2");
    }

    ret = swr_init(m_swr_ctx);
    if (ret < 0) {
        swr_free(&m_swr_ctx);
        return ffmpeg_error(ret, "swr_init");
    }

    m_fifo = av_audio_fifo_alloc(m_dst_fmt, m_dst_layout.nb_channels, m_frame_size);
    if (!m_fifo) {
        return Error::internal("av_audio_fifo_alloc failed");
    }
    return Result<void>();
}

Result<void> FFmpegAudioConverter::write_converted(const uint8_t** src, int src_samples) {
    assert(m_swr_ctx && "Audio converter not initialized");

    int max_out = swr_get_out_samples(m_swr_ctx, src_samples);
    if (max_out <= 0) {
        return Result<void>();
    }

    uint8_t** out_planes = nullptr;
    int ret = av_samples_alloc_array_and_samples(&out_planes, nullptr, m_dst_layout.nb_channels,
                                                 max_out, m_dst_fmt, 0);
    if (ret < 0) {
        return ffmpeg_error(ret, "av_samples_alloc_array_and_samples");
    }

    int converted = swr_convert(m_swr_ctx, out_planes, max_out, src, src_samples);
    Result<void> result;
    if (converted < 0) {
        result = ffmpeg_error(converted, "swr_convert");
    } else if (converted > 0) {
        int written = av_audio_fifo_write(m_fifo, reinterpret_cast<void**>(out_planes), converted);
        if (written < converted) {
            result = Error::internal("av_audio_fifo_write short write");
        }
    }

    av_freep(&out_planes[0]);
    av_freep(&out_planes);
    return result;
}

Result<void> FFmpegAudioConverter::push(const AVFrame* frame) {
    return write_converted(const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
}

Result<void> FFmpegAudioConverter::flush() {
    return write_converted(nullptr, 0);
}

int FFmpegAudioConverter::buffered() const {
    return m_fifo ? av_audio_fifo_size(m_fifo) : 0;
}

Result<AVFrame*> FFmpegAudioConverter::pop(int nb_samples) {
    AVFrame* frame = av_frame_alloc();
    if (!frame) {
        return Error::internal("av_frame_alloc failed");
    }

    frame->nb_samples = nb_samples;
    frame->format = m_dst_fmt;
    frame->sample_rate = m_dst_rate;
    int ret = av_channel_layout_copy(&frame->ch_layout, &m_dst_layout);
    if (ret >= 0) {
        ret = av_frame_get_buffer(frame, 0);
    }
    if (ret < 0) {
        av_frame_free(&frame);
        return ffmpeg_error(ret, "av_frame_get_buffer(audio)");
    }

    int read = av_audio_fifo_read(m_fifo, reinterpret_cast<void**>(frame->data), nb_samples);
    if (read < nb_samples) {
        av_frame_free(&frame);
        return Error::internal("av_audio_fifo_read short read");
    }
    return frame;
}

} // namespace impl
} // namespace mcp
