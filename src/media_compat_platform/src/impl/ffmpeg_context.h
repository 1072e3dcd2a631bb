#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

#include <media_compat_platform/mcp_errors.h>
#include <media_compat_platform/mcp_stream_info.h>
#include <string>

namespace mcp {
namespace impl {

// Convert FFmpeg error code to MCP Error
Error ffmpeg_error(int errnum, const std::string& context);

// Lower FFmpeg's own stderr logging once per process
void quiet_ffmpeg_logging();

// Input format context wrapper
class FFmpegFormatContext {
public:
    FFmpegFormatContext() = default;
    ~FFmpegFormatContext();

    // Non-copyable
    FFmpegFormatContext(const FFmpegFormatContext&) = delete;
    FFmpegFormatContext& operator=(const FFmpegFormatContext&) = delete;

    // Move semantics
    FFmpegFormatContext(FFmpegFormatContext&& other) noexcept;
    FFmpegFormatContext& operator=(FFmpegFormatContext&& other) noexcept;

    // Open a file and read stream info
    Result<void> open(const std::string& path);

    AVFormatContext* get() const { return m_fmt_ctx; }
    AVStream* stream(int index) const;
    int stream_count() const;

private:
    AVFormatContext* m_fmt_ctx = nullptr;
};

// Output (muxer) context wrapper
class FFmpegOutputContext {
public:
    FFmpegOutputContext() = default;
    ~FFmpegOutputContext();

    FFmpegOutputContext(const FFmpegOutputContext&) = delete;
    FFmpegOutputContext& operator=(const FFmpegOutputContext&) = delete;

    // Allocate the muxer for `container` and open the output file
    Result<void> open(const std::string& path, const std::string& container);

    Result<AVStream*> add_stream();

    Result<void> write_header(bool faststart);
    Result<void> write_packet(AVPacket* pkt);
    Result<void> write_trailer();

    // Encoders must emit extradata up front for this container
    bool needs_global_header() const;

    AVFormatContext* get() const { return m_fmt_ctx; }

private:
    AVFormatContext* m_fmt_ctx = nullptr;
    bool m_header_written = false;
    bool m_trailer_written = false;
};

// Codec context wrapper, used for both decoders and encoders
class FFmpegCodecContext {
public:
    FFmpegCodecContext() = default;
    ~FFmpegCodecContext();

    // Non-copyable
    FFmpegCodecContext(const FFmpegCodecContext&) = delete;
    FFmpegCodecContext& operator=(const FFmpegCodecContext&) = delete;

    // Move semantics
    FFmpegCodecContext(FFmpegCodecContext&& other) noexcept;
    FFmpegCodecContext& operator=(FFmpegCodecContext&& other) noexcept;

    // Open a decoder for the given stream parameters
    Result<void> init_decoder(const AVStream* stream);

    // Allocate an encoder context; caller configures get() then calls open_encoder()
    Result<void> alloc_encoder(const AVCodec* codec);
    Result<void> open_encoder(AVDictionary** options);

    AVCodecContext* get() const { return m_codec_ctx; }

private:
    AVCodecContext* m_codec_ctx = nullptr;
};

// SwScale context wrapper: converts decoded frames to the encoder's pixel format
class FFmpegScaleContext {
public:
    FFmpegScaleContext() = default;
    ~FFmpegScaleContext();

    // Non-copyable
    FFmpegScaleContext(const FFmpegScaleContext&) = delete;
    FFmpegScaleContext& operator=(const FFmpegScaleContext&) = delete;

    Result<void> init(int width, int height, AVPixelFormat src_fmt, AVPixelFormat dst_fmt);

    // Convert src into a newly referenced frame owned by this context.
    // The returned frame stays valid until the next convert().
    Result<AVFrame*> convert(const AVFrame* src);

    bool matches(int width, int height, AVPixelFormat src_fmt) const {
        return m_sws_ctx && width == m_width && height == m_height && src_fmt == m_src_fmt;
    }

private:
    SwsContext* m_sws_ctx = nullptr;
    AVFrame* m_dst_frame = nullptr;
    int m_width = 0;
    int m_height = 0;
    AVPixelFormat m_src_fmt = AV_PIX_FMT_NONE;
    AVPixelFormat m_dst_fmt = AV_PIX_FMT_NONE;
};

// Map AVMediaType to StreamKind
StreamKind stream_kind_of(AVMediaType type);

// Convert stream PTS to microseconds
TimeUS stream_pts_to_us(int64_t pts, const AVStream* stream);

} // namespace impl
} // namespace mcp
