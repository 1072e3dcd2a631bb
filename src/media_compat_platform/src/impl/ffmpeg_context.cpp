#include "ffmpeg_context.h"
#include <cassert>
#include <mutex>

namespace mcp {
namespace impl {

Error ffmpeg_error(int errnum, const std::string& context) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, errbuf, sizeof(errbuf));
    std::string msg = context + ": " + errbuf;

    // Map FFmpeg errors to MCP errors
    if (errnum == AVERROR(ENOENT)) {
        return Error::file_not_found(msg);
    } else if (errnum == AVERROR_INVALIDDATA || errnum == AVERROR(EINVAL)) {
        return Error::unsupported(msg);
    } else if (errnum == AVERROR_DECODER_NOT_FOUND) {
        return Error::unsupported("No decoder found: " + context);
    } else if (errnum == AVERROR_ENCODER_NOT_FOUND) {
        return Error::unsupported("No encoder found: " + context);
    }
    return Error::internal(msg);
}

void quiet_ffmpeg_logging() {
    // Decoder warnings on damaged streams are noisy and not actionable here
    static std::once_flag s_ffmpeg_log_init;
    std::call_once(s_ffmpeg_log_init, [] {
        av_log_set_level(AV_LOG_FATAL);
    });
}

// FFmpegFormatContext implementation

FFmpegFormatContext::~FFmpegFormatContext() {
    if (m_fmt_ctx) {
        avformat_close_input(&m_fmt_ctx);
    }
}

FFmpegFormatContext::FFmpegFormatContext(FFmpegFormatContext&& other) noexcept
    : m_fmt_ctx(other.m_fmt_ctx) {
    other.m_fmt_ctx = nullptr;
}

FFmpegFormatContext& FFmpegFormatContext::operator=(FFmpegFormatContext&& other) noexcept {
    if (this != &other) {
        if (m_fmt_ctx) {
            avformat_close_input(&m_fmt_ctx);
        }
        m_fmt_ctx = other.m_fmt_ctx;
        other.m_fmt_ctx = nullptr;
    }
    return *this;
}

Result<void> FFmpegFormatContext::open(const std::string& path) {
    int ret = avformat_open_input(&m_fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        if (ret == AVERROR(ENOENT)) {
            return Error::file_not_found(path);
        }
        return ffmpeg_error(ret, "avformat_open_input(" + path + ")");
    }

    ret = avformat_find_stream_info(m_fmt_ctx, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avformat_find_stream_info");
    }

    return Result<void>();
}

AVStream* FFmpegFormatContext::stream(int index) const {
    assert(m_fmt_ctx && "Format context not opened");
    assert(index >= 0 && static_cast<unsigned>(index) < m_fmt_ctx->nb_streams);
    return m_fmt_ctx->streams[index];
}

int FFmpegFormatContext::stream_count() const {
    return m_fmt_ctx ? static_cast<int>(m_fmt_ctx->nb_streams) : 0;
}

// FFmpegOutputContext implementation

FFmpegOutputContext::~FFmpegOutputContext() {
    if (!m_fmt_ctx) {
        return;
    }
    if (m_header_written && !m_trailer_written) {
        // Finalize what we have so the muxer releases its buffers
        av_write_trailer(m_fmt_ctx);
    }
    if (m_fmt_ctx->oformat && !(m_fmt_ctx->oformat->flags & AVFMT_NOFILE) && m_fmt_ctx->pb) {
        avio_closep(&m_fmt_ctx->pb);
    }
    avformat_free_context(m_fmt_ctx);
    m_fmt_ctx = nullptr;
}

Result<void> FFmpegOutputContext::open(const std::string& path, const std::string& container) {
    int ret = avformat_alloc_output_context2(&m_fmt_ctx, nullptr, container.c_str(), path.c_str());
    if (ret < 0 || !m_fmt_ctx) {
        return ffmpeg_error(ret, "avformat_alloc_output_context2(" + container + ")");
    }

    if (!(m_fmt_ctx->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&m_fmt_ctx->pb, path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            return ffmpeg_error(ret, "avio_open(" + path + ")");
        }
    }
    return Result<void>();
}

Result<AVStream*> FFmpegOutputContext::add_stream() {
    assert(m_fmt_ctx && "Output context not opened");
    AVStream* stream = avformat_new_stream(m_fmt_ctx, nullptr);
    if (!stream) {
        return Error::internal("avformat_new_stream failed");
    }
    return stream;
}

Result<void> FFmpegOutputContext::write_header(bool faststart) {
    AVDictionary* options = nullptr;
    if (faststart) {
        av_dict_set(&options, "movflags", "+faststart", 0);
    }
    int ret = avformat_write_header(m_fmt_ctx, &options);
    av_dict_free(&options);
    if (ret < 0) {
        return ffmpeg_error(ret, "avformat_write_header");
    }
    m_header_written = true;
    return Result<void>();
}

Result<void> FFmpegOutputContext::write_packet(AVPacket* pkt) {
    int ret = av_interleaved_write_frame(m_fmt_ctx, pkt);
    if (ret < 0) {
        return ffmpeg_error(ret, "av_interleaved_write_frame");
    }
    return Result<void>();
}

Result<void> FFmpegOutputContext::write_trailer() {
    m_trailer_written = true;
    int ret = av_write_trailer(m_fmt_ctx);
    if (ret < 0) {
        return ffmpeg_error(ret, "av_write_trailer");
    }
    return Result<void>();
}

bool FFmpegOutputContext::needs_global_header() const {
    return m_fmt_ctx && (m_fmt_ctx->oformat->flags & AVFMT_GLOBALHEADER);
}

// FFmpegCodecContext implementation

FFmpegCodecContext::~FFmpegCodecContext() {
    if (m_codec_ctx) {
        avcodec_free_context(&m_codec_ctx);
    }
}

FFmpegCodecContext::FFmpegCodecContext(FFmpegCodecContext&& other) noexcept
    : m_codec_ctx(other.m_codec_ctx) {
    other.m_codec_ctx = nullptr;
}

FFmpegCodecContext& FFmpegCodecContext::operator=(FFmpegCodecContext&& other) noexcept {
    if (this != &other) {
        if (m_codec_ctx) {
            avcodec_free_context(&m_codec_ctx);
        }
        m_codec_ctx = other.m_codec_ctx;
        other.m_codec_ctx = nullptr;
    }
    return *this;
}

Result<void> FFmpegCodecContext::init_decoder(const AVStream* stream) {
    const AVCodecParameters* params = stream->codecpar;
    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        return Error::unsupported(std::string("No decoder for codec ") + avcodec_get_name(params->codec_id));
    }

    m_codec_ctx = avcodec_alloc_context3(codec);
    if (!m_codec_ctx) {
        return Error::internal("Failed to allocate decoder context");
    }

    int ret = avcodec_parameters_to_context(m_codec_ctx, params);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_parameters_to_context");
    }
    m_codec_ctx->pkt_timebase = stream->time_base;

    ret = avcodec_open2(m_codec_ctx, codec, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_open2(decoder)");
    }
    return Result<void>();
}

Result<void> FFmpegCodecContext::alloc_encoder(const AVCodec* codec) {
    assert(codec && "Encoder codec cannot be null");
    m_codec_ctx = avcodec_alloc_context3(codec);
    if (!m_codec_ctx) {
        return Error::internal("Failed to allocate encoder context");
    }
    return Result<void>();
}

Result<void> FFmpegCodecContext::open_encoder(AVDictionary** options) {
    assert(m_codec_ctx && "Encoder not allocated");
    int ret = avcodec_open2(m_codec_ctx, m_codec_ctx->codec, options);
    if (ret < 0) {
        return ffmpeg_error(ret, std::string("avcodec_open2(") + m_codec_ctx->codec->name + ")");
    }
    return Result<void>();
}

// FFmpegScaleContext implementation

FFmpegScaleContext::~FFmpegScaleContext() {
    if (m_sws_ctx) {
        sws_freeContext(m_sws_ctx);
    }
    if (m_dst_frame) {
        av_frame_free(&m_dst_frame);
    }
}

Result<void> FFmpegScaleContext::init(int width, int height, AVPixelFormat src_fmt, AVPixelFormat dst_fmt) {
    if (m_sws_ctx) {
        sws_freeContext(m_sws_ctx);
        m_sws_ctx = nullptr;
    }
    m_width = width;
    m_height = height;
    m_src_fmt = src_fmt;
    m_dst_fmt = dst_fmt;

    m_sws_ctx = sws_getContext(
        width, height, src_fmt,
        width, height, dst_fmt,
        SWS_BILINEAR, nullptr, nullptr, nullptr
    );

    if (!m_sws_ctx) {
        return Error::internal("Failed to create swscale context");
    }

    if (!m_dst_frame) {
        m_dst_frame = av_frame_alloc();
        if (!m_dst_frame) {
            return Error::internal("Failed to allocate scaled frame");
        }
    }
    return Result<void>();
}

Result<AVFrame*> FFmpegScaleContext::convert(const AVFrame* src) {
    assert(m_sws_ctx && "Scale context not initialized");

    av_frame_unref(m_dst_frame);
    m_dst_frame->format = m_dst_fmt;
    m_dst_frame->width = m_width;
    m_dst_frame->height = m_height;
    int ret = av_frame_get_buffer(m_dst_frame, 0);
    if (ret < 0) {
        return ffmpeg_error(ret, "av_frame_get_buffer(video)");
    }

    sws_scale(m_sws_ctx, src->data, src->linesize, 0, src->height,
              m_dst_frame->data, m_dst_frame->linesize);

    av_frame_copy_props(m_dst_frame, src);
    return m_dst_frame;
}

// Utility functions

StreamKind stream_kind_of(AVMediaType type) {
    switch (type) {
        case AVMEDIA_TYPE_VIDEO:    return StreamKind::Video;
        case AVMEDIA_TYPE_AUDIO:    return StreamKind::Audio;
        case AVMEDIA_TYPE_SUBTITLE: return StreamKind::Subtitle;
        default:                    return StreamKind::Other;
    }
}

TimeUS stream_pts_to_us(int64_t pts, const AVStream* stream) {
    if (pts == AV_NOPTS_VALUE) {
        return 0;
    }
    return av_rescale_q(pts, stream->time_base, {1, 1000000});
}

} // namespace impl
} // namespace mcp
