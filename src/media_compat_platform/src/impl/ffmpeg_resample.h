#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libswresample/swresample.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
}

#include "ffmpeg_context.h"

namespace mcp {
namespace impl {

// SwrContext + AVAudioFifo wrapper for audio re-encoding.
// Converts decoded frames to the encoder's sample format/layout/rate and
// re-chunks them into encoder-sized frames.
class FFmpegAudioConverter {
public:
    FFmpegAudioConverter() = default;
    ~FFmpegAudioConverter();

    // Non-copyable
    FFmpegAudioConverter(const FFmpegAudioConverter&) = delete;
    FFmpegAudioConverter& operator=(const FFmpegAudioConverter&) = delete;

    // Source side comes from the decoder, destination side from the opened encoder
    Result<void> init(const AVCodecContext* decoder, const AVCodecContext* encoder);

    // Convert a decoded frame and append it to the FIFO
    Result<void> push(const AVFrame* frame);

    // Drain resampler delay into the FIFO (end of stream)
    Result<void> flush();

    // Samples waiting in the FIFO
    int buffered() const;

    // Pop up to nb_samples into a freshly allocated frame (caller frees)
    Result<AVFrame*> pop(int nb_samples);

    // Encoder frame size (fixed-size encoders like AAC need exactly this many)
    int frame_size() const { return m_frame_size; }

private:
    Result<void> write_converted(const uint8_t** src, int src_samples);

    SwrContext* m_swr_ctx = nullptr;
    AVAudioFifo* m_fifo = nullptr;

    AVChannelLayout m_dst_layout{};
    AVSampleFormat m_dst_fmt = AV_SAMPLE_FMT_NONE;
    int m_dst_rate = 0;
    int m_src_rate = 0;
    int m_frame_size = 0;
};

} // namespace impl
} // namespace mcp
