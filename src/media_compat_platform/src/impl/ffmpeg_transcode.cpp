#include <media_compat_platform/mcp_transcode_engine.h>
#include <media_compat_platform/mcp_probe.h>
#include "ffmpeg_context.h"
#include "ffmpeg_resample.h"
#include "mcp_log.h"

#include <algorithm>
#include <memory>
#include <vector>

namespace mcp {
namespace {

// One mapped input stream and everything needed to carry it into the output
struct StreamPipe {
    AVStream* in_stream = nullptr;
    AVStream* out_stream = nullptr;
    StreamAction action = StreamAction::Copy;

    impl::FFmpegCodecContext decoder;
    impl::FFmpegCodecContext encoder;
    impl::FFmpegScaleContext scaler;
    impl::FFmpegAudioConverter audio;
    int64_t next_audio_pts = AV_NOPTS_VALUE;

    bool is_video() const { return in_stream->codecpar->codec_type == AVMEDIA_TYPE_VIDEO; }
};

// A single transcode run: input demuxer, output muxer, one pipe per mapped stream
class TranscodeJob {
public:
    TranscodeJob(const EncoderSettings& settings, const ProgressCallback& progress,
                 const CancellationToken& cancel)
        : m_settings(settings), m_progress(progress), m_cancel(cancel) {}

    ~TranscodeJob() {
        if (m_pkt) av_packet_free(&m_pkt);
        if (m_enc_pkt) av_packet_free(&m_enc_pkt);
        if (m_frame) av_frame_free(&m_frame);
    }

    Result<void> run(const std::string& input_path, const std::string& output_path,
                     const TranscodePlan& plan);

private:
    Result<void> setup(const TranscodePlan& plan);
    Result<void> add_pipe(int stream_index, StreamAction action);
    Result<void> setup_copy(StreamPipe& pipe);
    Result<void> setup_video_encoder(StreamPipe& pipe);
    Result<void> setup_audio_encoder(StreamPipe& pipe);

    Result<void> copy_packet(StreamPipe& pipe, AVPacket* pkt);
    Result<void> decode_packet(StreamPipe& pipe, AVPacket* pkt);
    Result<void> process_video_frame(StreamPipe& pipe, AVFrame* frame);
    Result<void> process_audio_frame(StreamPipe& pipe, AVFrame* frame);
    Result<void> drain_audio(StreamPipe& pipe, bool final);
    Result<void> encode_and_write(StreamPipe& pipe, AVFrame* frame);
    Result<void> flush(StreamPipe& pipe);

    StreamPipe* pipe_for(int stream_index);
    void report_progress(const AVPacket* pkt, const AVStream* stream);

    const EncoderSettings& m_settings;
    const ProgressCallback& m_progress;
    const CancellationToken& m_cancel;

    impl::FFmpegFormatContext m_input;
    impl::FFmpegOutputContext m_output;
    std::vector<std::unique_ptr<StreamPipe>> m_pipes;

    AVPacket* m_pkt = nullptr;
    AVPacket* m_enc_pkt = nullptr;
    AVFrame* m_frame = nullptr;

    TimeUS m_duration_us = 0;
    int m_last_percent = -1;
};

Result<void> TranscodeJob::run(const std::string& input_path, const std::string& output_path,
                               const TranscodePlan& plan) {
    m_pkt = av_packet_alloc();
    m_enc_pkt = av_packet_alloc();
    m_frame = av_frame_alloc();
    if (!m_pkt || !m_enc_pkt || !m_frame) {
        return Error::internal("Failed to allocate packet/frame");
    }

    auto open_result = m_input.open(input_path);
    if (open_result.is_error()) {
        return open_result.error();
    }

    AVFormatContext* in_fmt = m_input.get();
    if (in_fmt->duration != AV_NOPTS_VALUE && in_fmt->duration > 0) {
        m_duration_us = av_rescale_q(in_fmt->duration, AV_TIME_BASE_Q, {1, 1000000});
    }

    auto out_result = m_output.open(output_path, m_settings.container);
    if (out_result.is_error()) {
        return out_result.error();
    }

    auto setup_result = setup(plan);
    if (setup_result.is_error()) {
        return setup_result.error();
    }

    auto header_result = m_output.write_header(m_settings.faststart);
    if (header_result.is_error()) {
        return header_result.error();
    }

    if (m_progress) m_progress(0);

    while (true) {
        if (m_cancel.is_cancelled()) {
            return Error::cancelled();
        }

        int ret = av_read_frame(in_fmt, m_pkt);
        if (ret == AVERROR_EOF) {
            break;
        }
        if (ret < 0) {
            return impl::ffmpeg_error(ret, "av_read_frame");
        }

        StreamPipe* pipe = pipe_for(m_pkt->stream_index);
        if (!pipe) {
            av_packet_unref(m_pkt);
            continue;
        }

        report_progress(m_pkt, pipe->in_stream);

        Result<void> step = pipe->action == StreamAction::Copy
            ? copy_packet(*pipe, m_pkt)
            : decode_packet(*pipe, m_pkt);
        av_packet_unref(m_pkt);
        if (step.is_error()) {
            return step.error();
        }
    }

    for (auto& pipe : m_pipes) {
        if (pipe->action != StreamAction::Reencode) continue;
        auto flush_result = flush(*pipe);
        if (flush_result.is_error()) {
            return flush_result.error();
        }
    }

    auto trailer_result = m_output.write_trailer();
    if (trailer_result.is_error()) {
        return trailer_result.error();
    }

    if (m_progress) m_progress(100);
    return Result<void>();
}

Result<void> TranscodeJob::setup(const TranscodePlan& plan) {
    if (plan.video_stream < 0 && plan.audio_stream < 0) {
        return Error::invalid_arg("Transcode plan maps no streams");
    }
    if (plan.video_stream >= 0) {
        auto r = add_pipe(plan.video_stream, plan.video_action);
        if (r.is_error()) return r.error();
    }
    if (plan.audio_stream >= 0) {
        auto r = add_pipe(plan.audio_stream, plan.audio_action);
        if (r.is_error()) return r.error();
    }
    return Result<void>();
}

Result<void> TranscodeJob::add_pipe(int stream_index, StreamAction action) {
    if (stream_index >= m_input.stream_count()) {
        return Error::invalid_arg("Plan references missing stream " + std::to_string(stream_index));
    }

    auto pipe = std::make_unique<StreamPipe>();
    pipe->in_stream = m_input.stream(stream_index);
    pipe->action = action;

    auto stream_result = m_output.add_stream();
    if (stream_result.is_error()) {
        return stream_result.error();
    }
    pipe->out_stream = stream_result.value();

    Result<void> r;
    if (action == StreamAction::Copy) {
        r = setup_copy(*pipe);
    } else if (pipe->is_video()) {
        r = setup_video_encoder(*pipe);
    } else {
        r = setup_audio_encoder(*pipe);
    }
    if (r.is_error()) {
        return r.error();
    }

    MCP_LOG_DEBUG("stream %d -> %s", stream_index, stream_action_to_string(action));
    m_pipes.push_back(std::move(pipe));
    return Result<void>();
}

Result<void> TranscodeJob::setup_copy(StreamPipe& pipe) {
    int ret = avcodec_parameters_copy(pipe.out_stream->codecpar, pipe.in_stream->codecpar);
    if (ret < 0) {
        return impl::ffmpeg_error(ret, "avcodec_parameters_copy");
    }
    // Let the muxer pick a tag valid for the output container
    pipe.out_stream->codecpar->codec_tag = 0;
    pipe.out_stream->time_base = pipe.in_stream->time_base;
    return Result<void>();
}

Result<void> TranscodeJob::setup_video_encoder(StreamPipe& pipe) {
    const AVCodec* codec = avcodec_find_encoder_by_name(m_settings.video_encoder.c_str());
    if (!codec) {
        MCP_LOG_WARN("video encoder %s not available, using default H.264 encoder",
                     m_settings.video_encoder.c_str());
        codec = avcodec_find_encoder(AV_CODEC_ID_H264);
    }
    if (!codec) {
        return Error::unsupported("No H.264 encoder available");
    }

    auto dec_result = pipe.decoder.init_decoder(pipe.in_stream);
    if (dec_result.is_error()) {
        return dec_result.error();
    }
    auto alloc_result = pipe.encoder.alloc_encoder(codec);
    if (alloc_result.is_error()) {
        return alloc_result.error();
    }

    AVCodecContext* dec = pipe.decoder.get();
    AVCodecContext* enc = pipe.encoder.get();
    enc->width = dec->width;
    enc->height = dec->height;
    enc->sample_aspect_ratio = dec->sample_aspect_ratio;
    enc->pix_fmt = AV_PIX_FMT_YUV420P;
    // Keep the input time base so frame timestamps pass through unchanged
    enc->time_base = pipe.in_stream->time_base;

    AVRational frame_rate = av_guess_frame_rate(m_input.get(), pipe.in_stream, nullptr);
    if (frame_rate.num > 0 && frame_rate.den > 0) {
        enc->framerate = frame_rate;
    }
    if (m_output.needs_global_header()) {
        enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    AVDictionary* options = nullptr;
    av_dict_set(&options, "preset", m_settings.video_preset.c_str(), 0);
    av_dict_set(&options, "crf", std::to_string(m_settings.video_crf).c_str(), 0);
    auto open_result = pipe.encoder.open_encoder(&options);
    av_dict_free(&options);
    if (open_result.is_error()) {
        return open_result.error();
    }

    int ret = avcodec_parameters_from_context(pipe.out_stream->codecpar, enc);
    if (ret < 0) {
        return impl::ffmpeg_error(ret, "avcodec_parameters_from_context(video)");
    }
    pipe.out_stream->time_base = enc->time_base;
    pipe.out_stream->avg_frame_rate = enc->framerate;
    return Result<void>();
}

Result<void> TranscodeJob::setup_audio_encoder(StreamPipe& pipe) {
    const AVCodec* codec = avcodec_find_encoder_by_name(m_settings.audio_encoder.c_str());
    if (!codec) {
        codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
    }
    if (!codec) {
        return Error::unsupported("No AAC encoder available");
    }

    auto dec_result = pipe.decoder.init_decoder(pipe.in_stream);
    if (dec_result.is_error()) {
        return dec_result.error();
    }
    auto alloc_result = pipe.encoder.alloc_encoder(codec);
    if (alloc_result.is_error()) {
        return alloc_result.error();
    }

    AVCodecContext* dec = pipe.decoder.get();
    AVCodecContext* enc = pipe.encoder.get();
    enc->sample_rate = dec->sample_rate;
    // Multichannel sources are downmixed; the renderer is only guaranteed stereo
    av_channel_layout_default(&enc->ch_layout, std::min(2, std::max(1, dec->ch_layout.nb_channels)));
    enc->sample_fmt = AV_SAMPLE_FMT_FLTP;
    enc->bit_rate = m_settings.audio_bitrate;
    enc->time_base = AVRational{1, dec->sample_rate};
    if (m_output.needs_global_header()) {
        enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    auto open_result = pipe.encoder.open_encoder(nullptr);
    if (open_result.is_error()) {
        return open_result.error();
    }

    int ret = avcodec_parameters_from_context(pipe.out_stream->codecpar, enc);
    if (ret < 0) {
        return impl::ffmpeg_error(ret, "avcodec_parameters_from_context(audio)");
    }
    pipe.out_stream->time_base = enc->time_base;

    return pipe.audio.init(dec, enc);
}

StreamPipe* TranscodeJob::pipe_for(int stream_index) {
    for (auto& pipe : m_pipes) {
        if (pipe->in_stream->index == stream_index) {
            return pipe.get();
        }
    }
    return nullptr;
}

void TranscodeJob::report_progress(const AVPacket* pkt, const AVStream* stream) {
    if (!m_progress || m_duration_us <= 0 || pkt->pts == AV_NOPTS_VALUE) {
        return;
    }
    TimeUS pos = impl::stream_pts_to_us(pkt->pts, stream);
    // 100 is reserved for completion
    int percent = static_cast<int>(std::clamp<int64_t>(pos * 100 / m_duration_us, 0, 99));
    if (percent > m_last_percent) {
        m_last_percent = percent;
        m_progress(percent);
    }
}

Result<void> TranscodeJob::copy_packet(StreamPipe& pipe, AVPacket* pkt) {
    av_packet_rescale_ts(pkt, pipe.in_stream->time_base, pipe.out_stream->time_base);
    pkt->stream_index = pipe.out_stream->index;
    pkt->pos = -1;
    return m_output.write_packet(pkt);
}

Result<void> TranscodeJob::decode_packet(StreamPipe& pipe, AVPacket* pkt) {
    AVCodecContext* dec = pipe.decoder.get();

    int ret = avcodec_send_packet(dec, pkt);
    if (ret == AVERROR_INVALIDDATA) {
        // Damaged packet: skip it, the decoder resyncs on the next one
        MCP_LOG_DEBUG("skipping undecodable packet on stream %d", pipe.in_stream->index);
        return Result<void>();
    }
    if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
        return impl::ffmpeg_error(ret, "avcodec_send_packet");
    }

    while (true) {
        ret = avcodec_receive_frame(dec, m_frame);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return Result<void>();
        }
        if (ret < 0) {
            return impl::ffmpeg_error(ret, "avcodec_receive_frame");
        }

        Result<void> r = pipe.is_video()
            ? process_video_frame(pipe, m_frame)
            : process_audio_frame(pipe, m_frame);
        av_frame_unref(m_frame);
        if (r.is_error()) {
            return r.error();
        }
    }
}

Result<void> TranscodeJob::process_video_frame(StreamPipe& pipe, AVFrame* frame) {
    frame->pts = frame->best_effort_timestamp;

    AVFrame* to_encode = frame;
    AVPixelFormat src_fmt = static_cast<AVPixelFormat>(frame->format);
    if (src_fmt != pipe.encoder.get()->pix_fmt) {
        if (!pipe.scaler.matches(frame->width, frame->height, src_fmt)) {
            auto init_result = pipe.scaler.init(frame->width, frame->height, src_fmt,
                                                pipe.encoder.get()->pix_fmt);
            if (init_result.is_error()) {
                return init_result.error();
            }
        }
        auto converted = pipe.scaler.convert(frame);
        if (converted.is_error()) {
            return converted.error();
        }
        to_encode = converted.value();
    }

    // Let the encoder choose frame types
    to_encode->pict_type = AV_PICTURE_TYPE_NONE;
    return encode_and_write(pipe, to_encode);
}

Result<void> TranscodeJob::process_audio_frame(StreamPipe& pipe, AVFrame* frame) {
    if (pipe.next_audio_pts == AV_NOPTS_VALUE) {
        int64_t first = frame->best_effort_timestamp;
        pipe.next_audio_pts = first == AV_NOPTS_VALUE
            ? 0
            : av_rescale_q(first, pipe.in_stream->time_base, pipe.encoder.get()->time_base);
    }

    auto push_result = pipe.audio.push(frame);
    if (push_result.is_error()) {
        return push_result.error();
    }
    return drain_audio(pipe, false);
}

Result<void> TranscodeJob::drain_audio(StreamPipe& pipe, bool final) {
    const int frame_size = pipe.audio.frame_size();
    while (pipe.audio.buffered() >= frame_size || (final && pipe.audio.buffered() > 0)) {
        int n = std::min(frame_size, pipe.audio.buffered());
        auto popped = pipe.audio.pop(n);
        if (popped.is_error()) {
            return popped.error();
        }
        AVFrame* out = popped.value();
        out->pts = pipe.next_audio_pts == AV_NOPTS_VALUE ? 0 : pipe.next_audio_pts;
        pipe.next_audio_pts = out->pts + n;

        auto r = encode_and_write(pipe, out);
        av_frame_free(&out);
        if (r.is_error()) {
            return r.error();
        }
    }
    return Result<void>();
}

Result<void> TranscodeJob::encode_and_write(StreamPipe& pipe, AVFrame* frame) {
    AVCodecContext* enc = pipe.encoder.get();

    int ret = avcodec_send_frame(enc, frame);
    if (ret < 0 && ret != AVERROR_EOF) {
        return impl::ffmpeg_error(ret, "avcodec_send_frame");
    }

    while (true) {
        ret = avcodec_receive_packet(enc, m_enc_pkt);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return Result<void>();
        }
        if (ret < 0) {
            return impl::ffmpeg_error(ret, "avcodec_receive_packet");
        }

        m_enc_pkt->stream_index = pipe.out_stream->index;
        av_packet_rescale_ts(m_enc_pkt, enc->time_base, pipe.out_stream->time_base);
        auto write_result = m_output.write_packet(m_enc_pkt);
        av_packet_unref(m_enc_pkt);
        if (write_result.is_error()) {
            return write_result.error();
        }
    }
}

Result<void> TranscodeJob::flush(StreamPipe& pipe) {
    auto decode_result = decode_packet(pipe, nullptr);
    if (decode_result.is_error()) {
        return decode_result.error();
    }

    if (!pipe.is_video()) {
        auto swr_result = pipe.audio.flush();
        if (swr_result.is_error()) {
            return swr_result.error();
        }
        auto drain_result = drain_audio(pipe, true);
        if (drain_result.is_error()) {
            return drain_result.error();
        }
    }

    return encode_and_write(pipe, nullptr);
}

// FFmpeg-backed engine. Stateless between calls apart from its settings.
class FFmpegTranscodeEngine : public TranscodeEngine {
public:
    explicit FFmpegTranscodeEngine(EncoderSettings settings)
        : m_settings(std::move(settings)) {}

    std::string name() const override { return "ffmpeg"; }

    Result<ProbeReport> Probe(const std::string& input_path) override {
        auto report = ProbeFile(input_path);
        if (report.is_error()) {
            return Error::probe_failed(report.error().message);
        }
        return report;
    }

    Result<void> Transcode(const std::string& input_path,
                           const std::string& output_path,
                           const TranscodePlan& plan,
                           const ProgressCallback& progress,
                           const CancellationToken& cancel) override {
        TranscodeJob job(m_settings, progress, cancel);
        auto result = job.run(input_path, output_path, plan);
        if (result.is_error() && result.error().code != ErrorCode::Cancelled) {
            return Error::transcode_failed(result.error().message);
        }
        return result;
    }

private:
    EncoderSettings m_settings;
};

} // namespace

Result<std::shared_ptr<TranscodeEngine>> CreateFFmpegEngine(const EncoderSettings& settings) {
    impl::quiet_ffmpeg_logging();

    if (!av_guess_format(settings.container.c_str(), nullptr, nullptr)) {
        return Error::engine_unavailable("No muxer for container " + settings.container);
    }

    bool has_video_encoder = avcodec_find_encoder_by_name(settings.video_encoder.c_str()) ||
                             avcodec_find_encoder(AV_CODEC_ID_H264);
    bool has_audio_encoder = avcodec_find_encoder_by_name(settings.audio_encoder.c_str()) ||
                             avcodec_find_encoder(AV_CODEC_ID_AAC);
    if (!has_video_encoder && !has_audio_encoder) {
        return Error::engine_unavailable("FFmpeg build has neither an H.264 nor an AAC encoder");
    }
    if (!has_video_encoder) {
        MCP_LOG_WARN("no H.264 encoder: video re-encoding will fail and fall back");
    }

    return std::shared_ptr<TranscodeEngine>(std::make_shared<FFmpegTranscodeEngine>(settings));
}

} // namespace mcp
