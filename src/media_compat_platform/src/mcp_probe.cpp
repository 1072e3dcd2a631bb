#include <media_compat_platform/mcp_probe.h>
#include "impl/ffmpeg_context.h"

namespace mcp {

static StreamDescriptor describe_stream(const AVStream* stream) {
    const AVCodecParameters* params = stream->codecpar;

    StreamDescriptor desc;
    desc.index = stream->index;
    desc.kind = impl::stream_kind_of(params->codec_type);
    desc.codec_name = avcodec_get_name(params->codec_id);

    const char* profile = avcodec_profile_name(params->codec_id, params->profile);
    if (profile) {
        desc.profile_name = profile;
    }

    desc.attached_picture = (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) != 0;

    if (desc.kind == StreamKind::Video) {
        desc.width = params->width;
        desc.height = params->height;
    } else if (desc.kind == StreamKind::Audio) {
        desc.channels = params->ch_layout.nb_channels;
        desc.sample_rate = params->sample_rate;
    }
    return desc;
}

Result<ProbeReport> ProbeFile(const std::string& path) {
    impl::quiet_ffmpeg_logging();

    impl::FFmpegFormatContext fmt_ctx;
    auto open_result = fmt_ctx.open(path);
    if (open_result.is_error()) {
        return open_result.error();
    }

    AVFormatContext* fmt = fmt_ctx.get();

    ProbeReport report;
    report.path = path;
    report.container = fmt->iformat ? fmt->iformat->name : "";
    if (fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0) {
        report.duration_us = av_rescale_q(fmt->duration, AV_TIME_BASE_Q, {1, 1000000});
    }

    for (int i = 0; i < fmt_ctx.stream_count(); ++i) {
        report.streams.push_back(describe_stream(fmt_ctx.stream(i)));
    }

    // Fall back to the longest stream duration if the container has none
    if (report.duration_us == 0) {
        for (int i = 0; i < fmt_ctx.stream_count(); ++i) {
            const AVStream* stream = fmt_ctx.stream(i);
            if (stream->duration != AV_NOPTS_VALUE) {
                TimeUS d = impl::stream_pts_to_us(stream->duration, stream);
                if (d > report.duration_us) report.duration_us = d;
            }
        }
    }

    return report;
}

Result<uint64_t> StreamDigest(const std::string& path, StreamKind kind) {
    impl::quiet_ffmpeg_logging();

    impl::FFmpegFormatContext fmt_ctx;
    auto open_result = fmt_ctx.open(path);
    if (open_result.is_error()) {
        return open_result.error();
    }

    int stream_idx = -1;
    for (int i = 0; i < fmt_ctx.stream_count(); ++i) {
        const AVStream* stream = fmt_ctx.stream(i);
        if (impl::stream_kind_of(stream->codecpar->codec_type) != kind) continue;
        if (kind == StreamKind::Video && (stream->disposition & AV_DISPOSITION_ATTACHED_PIC)) continue;
        stream_idx = i;
        break;
    }
    if (stream_idx < 0) {
        return Error::invalid_arg(std::string("No ") + stream_kind_to_string(kind) + " stream in " + path);
    }

    // FNV-1a, 64 bit
    uint64_t hash = 1469598103934665603ULL;
    AVPacket* pkt = av_packet_alloc();
    if (!pkt) {
        return Error::internal("av_packet_alloc failed");
    }

    int ret = 0;
    while ((ret = av_read_frame(fmt_ctx.get(), pkt)) >= 0) {
        if (pkt->stream_index == stream_idx) {
            for (int i = 0; i < pkt->size; ++i) {
                hash ^= pkt->data[i];
                hash *= 1099511628211ULL;
            }
        }
        av_packet_unref(pkt);
    }
    av_packet_free(&pkt);

    if (ret != AVERROR_EOF) {
        return impl::ffmpeg_error(ret, "av_read_frame");
    }
    return hash;
}

} // namespace mcp
